#pragma once

#include "protoplan/domain.hpp"
#include "protoplan/utility.hpp"

namespace protoplan {

/**
 * @brief Computes the generation node for a target.
 *
 * Pure: performs no I/O and touches no filesystem state. For every source it
 * derives the wrapper arguments and the exact set of files the external
 * compiler is expected to emit for the enabled generators.
 *
 * @param config The target description.
 * @param context The build context; derived directories are resolved here.
 * @return The plan, or `MissingRequiredField`, `MissingDependentField`,
 *         `MalformedOptionsString`, `MalformedLabel` or `DuplicateSource`.
 */
Result<GenerationPlan> resolve(const TargetConfig &config, const BuildContext &context);

/**
 * @brief Declares the compile node consuming a resolved generation node.
 */
Result<CompileUnitSpec> declare_compile_unit(const TargetConfig &config,
                                             const GenerationPlan &plan,
                                             const BuildContext &context);

/**
 * @brief Resolves both nodes of a target.
 */
Result<ResolvedTarget> resolve_target(const TargetConfig &config, const BuildContext &context);

} // namespace protoplan
