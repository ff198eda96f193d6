#include "protoplan/resolver.hpp"

#include "protoplan/domain.hpp"
#include "protoplan/label.hpp"
#include "protoplan/utility.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace protoplan {

namespace {

constexpr std::string_view OPTIONS_SEPARATOR = ":";
constexpr std::string_view PYTHON_OUT_SUBDIR = "pyproto";

// Options are glued directly onto the output directory, so anything but an
// empty string or one ending in the separator yields an unusable flag.
Result<void> check_options(std::string_view field, std::string_view options) {
    if (!options.empty() && !options.ends_with(OPTIONS_SEPARATOR)) {
        return fail(ErrorKind::MalformedOptionsString, "{} must end in '{}': {}", field, OPTIONS_SEPARATOR,
                    options);
    }
    return {};
}

Result<std::vector<std::string>> canonical_labels(const std::vector<std::string> &labels,
                                                  std::string_view directory) {
    std::vector<std::string> out;
    out.reserve(labels.size());
    for (const auto &text : labels) {
        auto label = Label::parse(text, directory);
        if (!label)
            return std::unexpected(label.error());
        out.push_back(label->str());
    }
    return out;
}

} // namespace

BuildContext BuildContext::resolved() const {
    BuildContext ctx = *this;
    ctx.root_build_dir = source_relative(root_build_dir);
    ctx.root_gen_dir = root_gen_dir.empty() ? join_path(ctx.root_build_dir, "gen") : source_relative(root_gen_dir);
    ctx.root_out_dir = root_out_dir.empty() ? ctx.root_build_dir : source_relative(root_out_dir);
    return ctx;
}

Result<GenerationPlan> resolve(const TargetConfig &config, const BuildContext &context) {
    if (config.name.empty()) {
        return fail(ErrorKind::MissingRequiredField, "Target in {} has no name", config.directory);
    }
    if (config.sources.empty()) {
        return fail(ErrorKind::MissingRequiredField, "Need sources for proto library {}", config.name);
    }

    std::optional<Label> plugin_label;
    if (config.plugin) {
        if (!config.plugin->suffix) {
            return fail(ErrorKind::MissingDependentField, "generator_plugin_suffix required for {} in {}",
                        config.plugin->label, config.name);
        }
        auto parsed = Label::parse(config.plugin->label, config.directory);
        if (!parsed)
            return std::unexpected(parsed.error());
        plugin_label = std::move(*parsed);
        if (auto res = check_options("generator_plugin_options", config.plugin->options); !res)
            return std::unexpected(res.error());
    }
    if (config.generate_cc) {
        if (auto res = check_options("cc_generator_options", config.cc_generator_options); !res)
            return std::unexpected(res.error());
    }

    const BuildContext ctx = context.resolved();

    auto protoc = Label::parse(ctx.protoc_label);
    if (!protoc)
        return std::unexpected(protoc.error());
    const Label protoc_host = protoc->with_toolchain(ctx.host_toolchain);

    GenerationPlan plan;
    plan.name = config.name + "_gen";
    plan.script = ctx.wrapper_script;
    plan.testonly = config.testonly;
    auto self = Label::parse(":" + config.name, config.directory);
    if (!self)
        return std::unexpected(self.error());
    plan.visibility.push_back(self->str());

    std::vector<std::string> import_args;
    for (const auto &dir : config.import_dirs) {
        const std::string abs = dir.starts_with("//") ? source_relative(dir) : join_path(config.directory, dir);
        import_args.push_back("--import-dir");
        import_args.push_back(rebase_path(abs, ctx.root_build_dir));
    }

    std::unordered_set<std::string> seen;
    for (const auto &source : config.sources) {
        const SourceParts parts = split_source(source, config.directory);
        if (!seen.insert(parts.path).second) {
            return fail(ErrorKind::DuplicateSource, "{} listed twice in {}", parts.path, config.name);
        }

        const std::string rel_out_dir = config.proto_out_dir ? source_relative(*config.proto_out_dir) : parts.dir;
        const std::string cc_out_dir = join_path(ctx.root_gen_dir, rel_out_dir);
        // The wrapper runs from root_build_dir; generator flags must land where outputs are declared.
        const std::string rel_cc_out_dir = rebase_path(cc_out_dir, ctx.root_build_dir);

        FileInvocation inv;
        inv.source = parts.path;
        auto &args = inv.args;
        args.reserve(24);

        if (config.cc_include) {
            const std::string header = join_path(cc_out_dir, parts.name_part + ".pb.h");
            args.insert(args.end(), {"--include", *config.cc_include, "--protobuf",
                                     rebase_path(header, ctx.root_build_dir)});
        }
        args.insert(args.end(), {"--proto-in-dir", rebase_path(parts.dir, ctx.root_build_dir), "--proto-in-file",
                                 parts.file_part, "--use-system-protobuf=0"});
        args.insert(args.end(), import_args.begin(), import_args.end());
        args.push_back("--");
        args.push_back("./" + protoc->name() + ctx.host_executable_suffix);

        if (config.generate_python) {
            const std::string py_out_dir = join_path(join_path(ctx.root_out_dir, PYTHON_OUT_SUBDIR), rel_out_dir);
            inv.outputs.push_back(join_path(py_out_dir, parts.name_part + "_pb2.py"));
            args.push_back("--python_out");
            args.push_back(rebase_path(py_out_dir, ctx.root_build_dir));
        }

        if (config.generate_cc) {
            inv.outputs.push_back(join_path(cc_out_dir, parts.name_part + ".pb.cc"));
            inv.outputs.push_back(join_path(cc_out_dir, parts.name_part + ".pb.h"));
            args.push_back("--cpp_out");
            args.push_back(config.cc_generator_options + rel_cc_out_dir);
        }

        if (plugin_label) {
            const std::string stem = parts.name_part + *config.plugin->suffix;
            inv.outputs.push_back(join_path(cc_out_dir, stem + ".cc"));
            inv.outputs.push_back(join_path(cc_out_dir, stem + ".h"));
            args.push_back("--plugin");
            args.push_back("protoc-gen-plugin=./" + plugin_label->name() + ctx.host_executable_suffix);
            args.push_back("--plugin_out");
            args.push_back(config.plugin->options + rel_cc_out_dir);
        }

        plan.sources.push_back(parts.path);
        plan.outputs.insert(plan.outputs.end(), inv.outputs.begin(), inv.outputs.end());
        plan.invocations.push_back(std::move(inv));
    }

    plan.deps.push_back(protoc_host.str());
    if (plugin_label) {
        plan.deps.push_back(plugin_label->with_toolchain(ctx.host_toolchain).str());
    }
    auto extra = canonical_labels(config.deps, config.directory);
    if (!extra)
        return std::unexpected(extra.error());
    plan.deps.insert(plan.deps.end(), extra->begin(), extra->end());

    return plan;
}

Result<CompileUnitSpec> declare_compile_unit(const TargetConfig &config,
                                             const GenerationPlan &plan,
                                             const BuildContext &context) {
    auto gen_label = Label::parse(":" + plan.name, config.directory);
    if (!gen_label)
        return std::unexpected(gen_label.error());
    auto extra = canonical_labels(config.deps, config.directory);
    if (!extra)
        return std::unexpected(extra.error());

    CompileUnitSpec unit;
    unit.name = config.name;
    unit.kind = config.component_build_force_source_set && context.is_component_build
                    ? CompileUnitKind::SourceSet
                    : CompileUnitKind::StaticLibrary;
    unit.sources = plan.outputs;
    unit.visibility = config.visibility;
    unit.defines = config.defines;
    unit.configs = config.extra_configs;
    unit.testonly = config.testonly;
    unit.public_configs.push_back(context.using_proto_config);

    // Generated C++ needs the runtime; stub-A output alone does not.
    if (config.generate_cc) {
        unit.public_deps.push_back(config.use_protobuf_full ? context.protobuf_full_label
                                                            : context.protobuf_lite_label);
    }

    // The generation node alone does not link the caller's deps in.
    unit.deps.push_back(gen_label->str());
    unit.deps.insert(unit.deps.end(), extra->begin(), extra->end());
    return unit;
}

Result<ResolvedTarget> resolve_target(const TargetConfig &config, const BuildContext &context) {
    auto plan = resolve(config, context);
    if (!plan)
        return std::unexpected(plan.error());

    auto unit = declare_compile_unit(config, *plan, context);
    if (!unit)
        return std::unexpected(unit.error());

    auto label = Label::parse(":" + config.name, config.directory);
    if (!label)
        return std::unexpected(label.error());

    return ResolvedTarget{label->str(), std::move(*plan), std::move(*unit)};
}

} // namespace protoplan
