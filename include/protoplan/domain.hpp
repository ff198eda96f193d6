#pragma once

#include <optional>
#include <string>
#include <vector>

namespace protoplan {

/**
 * @brief Evaluation environment shared by every target in one build-graph evaluation.
 *
 * All directories are relative to the source root. Empty derived fields are
 * filled in by `BuildContext::resolved()`.
 */
struct BuildContext {
    std::string root_build_dir = "out/Default";
    std::string root_gen_dir;  ///< Defaults to `<root_build_dir>/gen`.
    std::string root_out_dir;  ///< Defaults to `<root_build_dir>`.
    std::string host_toolchain = "//build/toolchain/linux:host";
    std::string host_executable_suffix;
    bool is_component_build = false;

    std::string protoc_label = "//third_party/protobuf:protoc";
    std::string wrapper_script = "//tools/protoc_wrapper/protoc_wrapper.py";
    std::string using_proto_config = "//third_party/protobuf:using_proto";
    std::string protobuf_lite_label = "//third_party/protobuf:protobuf_lite";
    std::string protobuf_full_label = "//third_party/protobuf:protobuf_full";

    /** @brief Returns a copy with the derived directories filled in. */
    BuildContext resolved() const;
};

struct PluginConfig {
    std::string label;                 ///< Build label of the plugin executable.
    std::optional<std::string> suffix; ///< Appended to the source name part of plugin outputs.
    std::string options;               ///< Must end in ':' when non-empty.
};

/**
 * @brief Immutable description of one proto library target.
 *
 * Toggles default to enabled; optional strings default to empty.
 */
struct TargetConfig {
    std::string name;
    std::string directory = "//";
    std::vector<std::string> sources;

    std::optional<std::string> proto_out_dir;
    std::optional<std::string> cc_include;
    std::vector<std::string> import_dirs;

    bool generate_python = true;
    bool generate_cc = true;
    std::string cc_generator_options;
    std::optional<PluginConfig> plugin;

    std::vector<std::string> deps;
    std::vector<std::string> visibility;
    std::vector<std::string> defines;
    std::vector<std::string> extra_configs;

    bool component_build_force_source_set = false;
    bool use_protobuf_full = false;
    bool testonly = false;
};

/** @brief One external-compiler invocation for a single source file. */
struct FileInvocation {
    std::string source; ///< Source-root-relative path of the .proto file.
    std::vector<std::string> args;
    std::vector<std::string> outputs;
};

/** @brief The generation node: a per-file action over every source of the target. */
struct GenerationPlan {
    std::string name;
    std::string script;
    std::vector<std::string> sources;
    std::vector<FileInvocation> invocations;
    std::vector<std::string> outputs; ///< Union of every invocation's outputs, in source order.
    std::vector<std::string> deps;
    std::vector<std::string> visibility;
    bool testonly = false;
};

enum class CompileUnitKind { StaticLibrary, SourceSet };

constexpr const char *to_string(CompileUnitKind kind) {
    return kind == CompileUnitKind::SourceSet ? "source_set" : "static_library";
}

/** @brief The compile node consuming a `GenerationPlan`'s outputs. */
struct CompileUnitSpec {
    std::string name;
    CompileUnitKind kind = CompileUnitKind::StaticLibrary;
    std::vector<std::string> sources;
    std::vector<std::string> deps;
    std::vector<std::string> public_deps;
    std::vector<std::string> public_configs;
    std::vector<std::string> configs;
    std::vector<std::string> defines;
    std::vector<std::string> visibility;
    bool testonly = false;
};

/** @brief A node-producing step in the file-level build graph. */
struct BuildStep {
    std::string tool; ///< `protoc`, `static_library` or `source_set`.
    std::string target;
    std::vector<std::string> inputs;
    std::vector<std::string> outputs;
};

struct ResolvedTarget {
    std::string label;
    GenerationPlan generation;
    CompileUnitSpec compile;
};

} // namespace protoplan
