#pragma once

#include "protoplan/domain.hpp"
#include "protoplan/graph.hpp"
#include "protoplan/utility.hpp"

#include <string_view>
#include <utility>
#include <vector>

namespace protoplan {

/**
 * @brief Facade for resolving targets and collecting them into one build graph.
 *
 * Parsers populate the build context through `set_definition` and hand
 * targets to `add_target`; emitters read the result back out.
 */
class PlanBuilder {
public:
    PlanBuilder() = default;
    explicit PlanBuilder(BuildContext context) : context_(std::move(context)) {
    }

    /**
     * @brief Sets one build-context field by its manifest key.
     * @return Success, or `ParseError` for an unknown key or a bad boolean.
     */
    Result<void> set_definition(std::string_view key, std::string_view value);

    /**
     * @brief Resolves a target and adds its generation and compile steps.
     *
     * On failure the builder is left as it was before the call.
     */
    Result<void> add_target(const TargetConfig &config);

    const BuildContext &context() const {
        return context_;
    }
    const BuildGraph &graph() const {
        return graph_;
    }
    const std::vector<ResolvedTarget> &targets() const {
        return targets_;
    }

private:
    BuildContext context_;
    BuildGraph graph_;
    std::vector<ResolvedTarget> targets_;
};

/** @brief Parses `true`/`false`. */
Result<bool> parse_bool(std::string_view value);

} // namespace protoplan
