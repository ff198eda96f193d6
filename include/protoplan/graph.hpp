#pragma once

#include "protoplan/domain.hpp"
#include "protoplan/utility.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace protoplan {

/**
 * @brief File-level dependency graph over every declared generation and compile step.
 *
 * Nodes are files or target labels; an edge points from an input to each
 * output of the step consuming it.
 */
class BuildGraph {
public:
    struct Node {
        std::string path;
        std::vector<size_t> out_edges; ///< Indices of nodes that depend on this node.
        std::optional<size_t> step_id; ///< Index of the step producing this node, if any.
    };

    size_t get_or_create_node(std::string_view path);

    /**
     * @brief Adds a group of steps atomically.
     *
     * Either every step is added or, when any output already has a producer
     * (in the graph or earlier in the group), none is.
     *
     * @return Index of the first added step, or `DuplicateOutput`.
     */
    Result<size_t> add_steps(std::vector<BuildStep> steps);

    Result<size_t> add_step(BuildStep step);

    const std::vector<Node> &nodes() const {
        return nodes_;
    }
    const std::vector<BuildStep> &steps() const {
        return steps_;
    }

    /** @brief Returns the index of a node, if one exists for `path`. */
    std::optional<size_t> find(std::string_view path) const;

    /**
     * @brief Performs a topological sort of the graph.
     * @return Node indices, dependencies first, or `Cycle`.
     */
    Result<std::vector<size_t>> topo_sort() const;

private:
    std::vector<Node> nodes_;
    std::vector<BuildStep> steps_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace protoplan
