#include "protoplan/parser.hpp"

#include "protoplan/builder.hpp"
#include "protoplan/domain.hpp"
#include "protoplan/label.hpp"
#include "protoplan/utility.hpp"

#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace protoplan {

namespace {

struct PendingTarget {
    size_t line_no = 0;
    TargetConfig config;
    std::unordered_set<std::string> seen_keys;
    std::optional<std::string> plugin_label;
    std::optional<std::string> plugin_suffix;
    std::optional<std::string> plugin_options;
};

std::vector<std::string> split_list(std::string_view remaining) {
    std::vector<std::string> items;
    while (!remaining.empty()) {
        size_t comma_pos = remaining.find(',');
        std::string_view item;
        if (comma_pos == std::string_view::npos) {
            item = remaining;
            remaining = {};
        } else {
            item = remaining.substr(0, comma_pos);
            remaining = remaining.substr(comma_pos + 1);
        }

        if (!item.empty()) {
            items.emplace_back(item);
        }
    }
    return items;
}

Result<void> parse_def(const std::string_view line, size_t line_no, PlanBuilder &builder) {
    size_t first_pipe = line.find('|');
    size_t second_pipe = line.find('|', first_pipe + 1);
    if (second_pipe == std::string_view::npos) {
        return fail(ErrorKind::ParseError, "line {}: Malformed def line (missing second pipe): {}", line_no, line);
    }

    auto res = builder.set_definition(line.substr(first_pipe + 1, second_pipe - (first_pipe + 1)), // key
                                      line.substr(second_pipe + 1)                                 // value
    );
    if (!res) {
        return fail(res.error().kind, "line {}: {}", line_no, res.error().message);
    }
    return {};
}

Result<PendingTarget> parse_target_header(const std::string_view line, size_t line_no) {
    auto label = Label::parse(line.substr(line.find('|') + 1));
    if (!label) {
        return fail(ErrorKind::ParseError, "line {}: {}", line_no, label.error().message);
    }

    PendingTarget pending;
    pending.line_no = line_no;
    pending.config.name = label->name();
    pending.config.directory = label->dir();
    return pending;
}

Result<void> set_flag(bool &flag, std::string_view value) {
    auto b = parse_bool(value);
    if (!b)
        return std::unexpected(b.error());
    flag = *b;
    return {};
}

Result<void> set_field(PendingTarget &target, std::string_view key, std::string_view value) {
    TargetConfig &cfg = target.config;
    if (key == "sources")
        cfg.sources = split_list(value);
    else if (key == "proto_out_dir")
        cfg.proto_out_dir = std::string(value);
    else if (key == "cc_include")
        cfg.cc_include = std::string(value);
    else if (key == "import_dirs")
        cfg.import_dirs = split_list(value);
    else if (key == "generate_python")
        return set_flag(cfg.generate_python, value);
    else if (key == "generate_cc")
        return set_flag(cfg.generate_cc, value);
    else if (key == "cc_generator_options")
        cfg.cc_generator_options = value;
    else if (key == "generator_plugin")
        target.plugin_label = std::string(value);
    else if (key == "generator_plugin_suffix")
        target.plugin_suffix = std::string(value);
    else if (key == "generator_plugin_options")
        target.plugin_options = std::string(value);
    else if (key == "deps")
        cfg.deps = split_list(value);
    else if (key == "visibility")
        cfg.visibility = split_list(value);
    else if (key == "defines")
        cfg.defines = split_list(value);
    else if (key == "extra_configs")
        cfg.extra_configs = split_list(value);
    else if (key == "component_build_force_source_set")
        return set_flag(cfg.component_build_force_source_set, value);
    else if (key == "use_protobuf_full")
        return set_flag(cfg.use_protobuf_full, value);
    else if (key == "testonly")
        return set_flag(cfg.testonly, value);
    else
        return fail(ErrorKind::ParseError, "Unknown target field: {}", key);
    return {};
}

Result<void> parse_field(const std::string_view line, size_t line_no, PendingTarget &target) {
    size_t pipe = line.find('|');
    if (pipe == std::string_view::npos) {
        return fail(ErrorKind::ParseError, "line {}: Malformed field line (missing pipe): {}", line_no, line);
    }
    std::string_view key = line.substr(0, pipe);
    if (!target.seen_keys.emplace(key).second) {
        return fail(ErrorKind::ParseError, "line {}: {} set twice", line_no, key);
    }
    if (auto res = set_field(target, key, line.substr(pipe + 1)); !res) {
        return fail(res.error().kind, "line {}: {}", line_no, res.error().message);
    }
    return {};
}

Result<TargetConfig> finish_target(PendingTarget &&target) {
    if (target.plugin_label) {
        target.config.plugin = PluginConfig{
            .label = std::move(*target.plugin_label),
            .suffix = std::move(target.plugin_suffix),
            .options = target.plugin_options.value_or(""),
        };
    } else if (target.plugin_suffix || target.plugin_options) {
        return fail(ErrorKind::ParseError, "line {}: plugin suffix or options given without generator_plugin",
                    target.line_no);
    }
    return std::move(target.config);
}

} // namespace

Result<void> parse_manifest(PlanBuilder &builder, std::string_view content) {
    // Definitions and targets land in a copy; the caller's builder changes only on success.
    PlanBuilder scratch = builder;
    std::vector<PendingTarget> pending;

    size_t start = 0;
    size_t line_no = 0;
    while (start < content.size()) {
        size_t end = content.find('\n', start);
        // last line of the file
        if (end == std::string_view::npos) {
            end = content.size();
        }
        ++line_no;

        std::string_view line = content.substr(start, end - start);
        // windows CRLF handling
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        if (!line.empty() && !line.starts_with("#")) {
            Result<void> res;
            if (line.starts_with("DEF|")) {
                res = parse_def(line, line_no, scratch);
            } else if (line.starts_with("TARGET|")) {
                auto target = parse_target_header(line, line_no);
                if (!target)
                    return std::unexpected(target.error());
                pending.push_back(std::move(*target));
            } else if (pending.empty()) {
                res = fail(ErrorKind::ParseError, "line {}: Field outside of a TARGET block: {}", line_no, line);
            } else {
                res = parse_field(line, line_no, pending.back());
            }
            if (!res)
                return res;
        }

        start = end + 1;
    }

    for (auto &target : pending) {
        const size_t target_line = target.line_no;
        auto config = finish_target(std::move(target));
        if (!config)
            return std::unexpected(config.error());
        if (auto res = scratch.add_target(*config); !res) {
            return fail(res.error().kind, "target at line {}: {}", target_line, res.error().message);
        }
    }

    builder = std::move(scratch);
    return {};
}

Result<void> parse(PlanBuilder &builder, const std::filesystem::path &path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return fail(ErrorKind::Io, "Could not open manifest: {}", path.string());
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return fail(ErrorKind::Io, "Failed reading manifest: {}", path.string());
    }
    return parse_manifest(builder, content);
}

} // namespace protoplan
