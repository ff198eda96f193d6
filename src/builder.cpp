#include "protoplan/builder.hpp"

#include "protoplan/resolver.hpp"
#include "protoplan/utility.hpp"

#include <string>
#include <utility>
#include <vector>

namespace protoplan {

Result<bool> parse_bool(std::string_view value) {
    if (value == "true")
        return true;
    if (value == "false")
        return false;
    return fail(ErrorKind::ParseError, "Expected 'true' or 'false', got '{}'", value);
}

Result<void> PlanBuilder::set_definition(std::string_view key, std::string_view value) {
    if (key == "is_component_build") {
        auto b = parse_bool(value);
        if (!b)
            return std::unexpected(b.error());
        context_.is_component_build = *b;
        return {};
    }

    std::string *field = nullptr;
    if (key == "root_build_dir")
        field = &context_.root_build_dir;
    else if (key == "root_gen_dir")
        field = &context_.root_gen_dir;
    else if (key == "root_out_dir")
        field = &context_.root_out_dir;
    else if (key == "host_toolchain")
        field = &context_.host_toolchain;
    else if (key == "host_executable_suffix")
        field = &context_.host_executable_suffix;
    else if (key == "protoc_label")
        field = &context_.protoc_label;
    else if (key == "wrapper_script")
        field = &context_.wrapper_script;
    else if (key == "using_proto_config")
        field = &context_.using_proto_config;
    else if (key == "protobuf_lite_label")
        field = &context_.protobuf_lite_label;
    else if (key == "protobuf_full_label")
        field = &context_.protobuf_full_label;

    if (!field) {
        return fail(ErrorKind::ParseError, "Unknown definition: {}", key);
    }
    *field = value;
    return {};
}

Result<void> PlanBuilder::add_target(const TargetConfig &config) {
    auto resolved = resolve_target(config, context_);
    if (!resolved)
        return std::unexpected(resolved.error());

    std::vector<BuildStep> steps;
    steps.reserve(resolved->generation.invocations.size() + 1);
    for (const auto &inv : resolved->generation.invocations) {
        // Nothing enabled for this file: no action to declare.
        if (inv.outputs.empty())
            continue;
        // Compiler, plugin and caller deps all gate regeneration.
        std::vector<std::string> inputs{inv.source};
        inputs.insert(inputs.end(), resolved->generation.deps.begin(), resolved->generation.deps.end());
        steps.push_back(
            {.tool = "protoc", .target = resolved->label, .inputs = std::move(inputs), .outputs = inv.outputs});
    }
    steps.push_back({.tool = to_string(resolved->compile.kind),
                     .target = resolved->label,
                     .inputs = resolved->generation.outputs,
                     .outputs = {resolved->label}});

    if (auto res = graph_.add_steps(std::move(steps)); !res)
        return std::unexpected(res.error());

    targets_.push_back(std::move(*resolved));
    return {};
}

} // namespace protoplan
