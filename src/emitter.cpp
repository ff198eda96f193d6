#include "protoplan/emitter.hpp"

#include "protoplan/builder.hpp"
#include "protoplan/domain.hpp"
#include "protoplan/utility.hpp"

#include <nlohmann/json.hpp>

#include <ostream>
#include <string>
#include <vector>

namespace protoplan {

namespace {

using json = nlohmann::json;

json generation_json(const GenerationPlan &plan) {
    json invocations = json::array();
    for (const auto &inv : plan.invocations) {
        invocations.push_back({{"source", inv.source}, {"args", inv.args}, {"outputs", inv.outputs}});
    }

    json entry;
    entry["name"] = plan.name;
    entry["script"] = plan.script;
    entry["sources"] = plan.sources;
    entry["outputs"] = plan.outputs;
    entry["deps"] = plan.deps;
    entry["visibility"] = plan.visibility;
    entry["testonly"] = plan.testonly;
    entry["invocations"] = std::move(invocations);
    return entry;
}

json compile_json(const CompileUnitSpec &unit) {
    json entry;
    entry["name"] = unit.name;
    entry["type"] = to_string(unit.kind);
    entry["sources"] = unit.sources;
    entry["deps"] = unit.deps;
    entry["public_deps"] = unit.public_deps;
    entry["public_configs"] = unit.public_configs;
    entry["configs"] = unit.configs;
    entry["defines"] = unit.defines;
    entry["visibility"] = unit.visibility;
    entry["testonly"] = unit.testonly;
    return entry;
}

std::string escape_dot(const std::string &s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '"' || c == '\\')
            out += '\\';
        out += c;
    }
    return out;
}

} // namespace

json to_json(const PlanBuilder &builder) {
    json targets = json::array();
    for (const auto &target : builder.targets()) {
        json entry;
        entry["label"] = target.label;
        entry["generation"] = generation_json(target.generation);
        entry["compile"] = compile_json(target.compile);
        targets.push_back(std::move(entry));
    }
    return targets;
}

Result<void> emit_json(const PlanBuilder &builder, std::ostream &out) {
    try {
        out << to_json(builder).dump(4) << '\n';
    } catch (const json::exception &err) {
        return fail(ErrorKind::Io, "Failed to serialize plan: {}", err.what());
    }
    if (!out) {
        return fail(ErrorKind::Io, "Failed to write plan");
    }
    return {};
}

Result<void> emit_graph(const PlanBuilder &builder, std::ostream &out) {
    const BuildGraph &graph = builder.graph();
    auto order = graph.topo_sort();
    if (!order)
        return std::unexpected(order.error());

    out << "digraph protoplan {\n";
    out << "  rankdir=LR;\n";
    out << "  node [shape=box, style=filled, fontname=\"Helvetica\"];\n";

    for (size_t i : *order) {
        const auto &node = graph.nodes()[i];
        std::string color = "0.9 0.9 0.9"; // light gray for source files and labels

        if (node.step_id.has_value()) {
            const auto &step = graph.steps()[*node.step_id];
            color = step.tool == "protoc" ? "green" : "lightblue";
        }

        out << "  n" << i << " [label=\"" << escape_dot(node.path) << "\", fillcolor=\"" << color << "\"];\n";

        for (size_t target_idx : node.out_edges) {
            out << "  n" << i << " -> n" << target_idx << ";\n";
        }
    }
    out << "}\n";

    if (!out) {
        return fail(ErrorKind::Io, "Failed to write graph");
    }
    return {};
}

} // namespace protoplan
