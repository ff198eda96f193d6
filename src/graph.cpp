#include "protoplan/graph.hpp"

#include "protoplan/utility.hpp"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_set>

namespace protoplan {

size_t BuildGraph::get_or_create_node(std::string_view path) {
    if (auto it = index_.find(std::string(path)); it != index_.end()) {
        return it->second;
    }

    size_t id = nodes_.size();
    nodes_.push_back({std::string(path), {}, std::nullopt});
    index_.emplace(path, id);
    return id;
}

std::optional<size_t> BuildGraph::find(std::string_view path) const {
    if (auto it = index_.find(std::string(path)); it != index_.end()) {
        return it->second;
    }
    return std::nullopt;
}

Result<size_t> BuildGraph::add_steps(std::vector<BuildStep> steps) {
    std::unordered_set<std::string_view> claimed;
    for (const auto &step : steps) {
        for (const auto &out : step.outputs) {
            auto existing = find(out);
            if (existing && nodes_[*existing].step_id.has_value()) {
                const auto &owner = steps_[*nodes_[*existing].step_id];
                return fail(ErrorKind::DuplicateOutput, "Duplicate producer for output: {} ({} and {})", out,
                            owner.target, step.target);
            }
            if (!claimed.insert(out).second) {
                return fail(ErrorKind::DuplicateOutput, "Duplicate producer for output: {} (twice in {})", out,
                            step.target);
            }
        }
    }

    size_t first = steps_.size();
    for (auto &step : steps) {
        size_t step_id = steps_.size();
        steps_.push_back(std::move(step));
        const BuildStep &stored = steps_.back();

        std::vector<size_t> out_ids;
        out_ids.reserve(stored.outputs.size());
        for (const auto &out : stored.outputs) {
            size_t out_id = get_or_create_node(out);
            nodes_[out_id].step_id = step_id;
            out_ids.push_back(out_id);
        }

        for (const auto &in : stored.inputs) {
            if (in.empty())
                continue;
            size_t in_id = get_or_create_node(in);
            for (size_t out_id : out_ids) {
                nodes_[in_id].out_edges.push_back(out_id);
            }
        }
    }
    return first;
}

Result<size_t> BuildGraph::add_step(BuildStep step) {
    std::vector<BuildStep> one;
    one.push_back(std::move(step));
    return add_steps(std::move(one));
}

Result<std::vector<size_t>> BuildGraph::topo_sort() const {
    enum class STATUS : uint8_t { UNSTARTED, WORKING, FINISHED };

    std::vector<STATUS> status(nodes_.size(), STATUS::UNSTARTED);
    std::vector<size_t> order;
    order.reserve(nodes_.size());

    std::function<Result<void>(size_t)> dfs = [&](size_t u) -> Result<void> {
        status[u] = STATUS::WORKING;
        for (size_t v : nodes_[u].out_edges) {
            if (status[v] == STATUS::UNSTARTED) {
                if (auto res = dfs(v); !res)
                    return res;
            } else if (status[v] == STATUS::WORKING) {
                return fail(ErrorKind::Cycle, "Cycle detected in the build graph at: {}", nodes_[v].path);
            }
        }
        status[u] = STATUS::FINISHED;
        order.push_back(u);
        return {};
    };

    for (size_t i = 0; i < nodes_.size(); ++i) {
        if (status[i] == STATUS::UNSTARTED) {
            if (auto res = dfs(i); !res)
                return std::unexpected(res.error());
        }
    }

    std::reverse(order.begin(), order.end());
    return order;
}

} // namespace protoplan
