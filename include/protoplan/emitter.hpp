#pragma once

#include "protoplan/builder.hpp"
#include "protoplan/utility.hpp"

#include <nlohmann/json.hpp>

#include <ostream>

namespace protoplan {

/**
 * @brief Converts every resolved target to its JSON description.
 *
 * Each target becomes `{"label", "generation": {...}, "compile": {...}}`.
 */
nlohmann::json to_json(const PlanBuilder &builder);

/**
 * @brief Writes the resolved plan as indented JSON.
 */
Result<void> emit_json(const PlanBuilder &builder, std::ostream &out);

/**
 * @brief Writes the build graph in Graphviz DOT format.
 *
 * Nodes are emitted in topological order: source files gray, generated
 * files green, compile units blue.
 */
Result<void> emit_graph(const PlanBuilder &builder, std::ostream &out);

} // namespace protoplan
