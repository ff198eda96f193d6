#include "protoplan/cli.hpp"

#include "protoplan/builder.hpp"
#include "protoplan/emitter.hpp"
#include "protoplan/parser.hpp"
#include "protoplan/utility.hpp"

#include <filesystem>
#include <fstream>
#include <optional>
#include <ostream>
#include <print>
#include <string>
#include <string_view>

namespace protoplan {

namespace {

enum class Mode { Json, Graph, Check };

struct CliConfig {
    Mode mode = Mode::Json;
    std::string manifest = "protoplan.build";
    std::optional<std::string> output;
    std::filesystem::path work_dir = ".";
};

void print_help(std::ostream &out) {
    std::println(out, "Usage: protoplan [options] [manifest]");
    std::println(out, "Options:");
    std::println(out, "  -h, --help       Show this help message");
    std::println(out, "  -v, --version    Show version");
    std::println(out, "  -d <dir>         Change working directory before doing anything");
    std::println(out, "  -f <file>        Use <file> as the target manifest (default: protoplan.build)");
    std::println(out, "  -o <file>        Write output to <file> instead of stdout");
    std::println(out, "  --json           Emit the resolved plan as JSON (default)");
    std::println(out, "  --graph          Emit the build graph in DOT format");
    std::println(out, "  --check          Resolve targets and print a summary");
}

void print_summary(const PlanBuilder &builder, std::ostream &out) {
    for (const auto &target : builder.targets()) {
        std::println(out, "{}: {} invocation(s), {} output(s), {}", target.label,
                     target.generation.invocations.size(), target.generation.outputs.size(),
                     to_string(target.compile.kind));
    }
}

} // namespace

int run(int argc, const char *const *argv, std::ostream &out, std::ostream &err) {
    CliConfig config;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_help(out);
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            std::println(out, "protoplan {}", PROTOPLAN_PROJ_VER);
            return 0;
        } else if (arg == "-d" || arg == "-f" || arg == "-o") {
            if (i + 1 >= argc) {
                std::println(err, "Missing argument for {}", arg);
                return 1;
            }
            if (arg == "-d")
                config.work_dir = argv[i + 1];
            else if (arg == "-f")
                config.manifest = argv[i + 1];
            else
                config.output = argv[i + 1];
            i++;
        } else if (arg == "--json") {
            config.mode = Mode::Json;
        } else if (arg == "--graph") {
            config.mode = Mode::Graph;
        } else if (arg == "--check") {
            config.mode = Mode::Check;
        } else if (!arg.starts_with("-")) {
            config.manifest = arg;
        } else {
            std::println(err, "Unknown argument: {}", arg);
            print_help(err);
            return 1;
        }
    }

    if (config.work_dir != ".") {
        std::error_code ec;
        std::filesystem::current_path(config.work_dir, ec);
        if (ec) {
            std::println(err, "Failed to change directory to {}: {}", config.work_dir.string(), ec.message());
            return 1;
        }
    }

    if (!std::filesystem::exists(config.manifest)) {
        std::println(err, "Manifest: {} does not exist.", config.manifest);
        return 1;
    }

    PlanBuilder builder;
    if (auto res = parse(builder, config.manifest); !res) {
        std::println(err, "Failed to resolve {}: {}", config.manifest, res.error());
        return 1;
    }

    std::ofstream file;
    if (config.output) {
        file.open(*config.output);
        if (!file.is_open()) {
            std::println(err, "Failed to open {} for writing", *config.output);
            return 1;
        }
    }
    std::ostream &sink = config.output ? static_cast<std::ostream &>(file) : out;

    Result<void> res;
    switch (config.mode) {
    case Mode::Json:
        res = emit_json(builder, sink);
        break;
    case Mode::Graph:
        res = emit_graph(builder, sink);
        break;
    case Mode::Check:
        print_summary(builder, sink);
        break;
    }
    if (!res) {
        std::println(err, "Emission failed: {}", res.error());
        return 1;
    }

    return 0;
}

} // namespace protoplan
