#include "graph/graph_compiler.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"

#include <string>

namespace tsdsep {

CompiledGraph GraphCompiler::compile(const EdgeTypeArray& graph) const {
    const int n = graph.numVars();
    const int tau_max = graph.tauMax();

    CompiledGraph out;
    for (int j = 0; j < n; ++j) {
        out.observed_vars.push_back(j);
        out.links[j];
    }

    int next_free = n;

    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < n; ++j) {
            for (int tau = 0; tau <= tau_max; ++tau) {
                EdgeType type = graph.at(i, j, tau);
                if (type == EdgeType::None) continue;

                if (tau == 0) {
                    if (type != reverse(graph.at(j, i, 0))) {
                        throw InconsistentGraphError(
                            "graph needs consistent lag-zero patterns, but (" +
                            std::to_string(i) + ", " + std::to_string(j) + ", 0) = '" +
                            toString(type) + "' while (" + std::to_string(j) + ", " +
                            std::to_string(i) + ", 0) = '" +
                            toString(graph.at(j, i, 0)) + "'");
                    }
                    // Each contemporaneous pair once
                    if (j <= i) continue;
                } else if (type == EdgeType::Reversed) {
                    throw InvalidLaggedEdgeError(
                        "Lagged links can only be '-->', '<->' or '---', got '<--' at (" +
                        std::to_string(i) + ", " + std::to_string(j) + ", " +
                        std::to_string(tau) + ")");
                }

                addEdge(out, i, j, tau, type, next_free);
            }
        }
    }

    logger()->debug("Compiled {} observed, {} latent, {} selection variables",
                    out.observed_vars.size(), out.latent_vars.size(),
                    out.selection_vars.size());
    return out;
}

void GraphCompiler::addEdge(CompiledGraph& out, int i, int j, int tau,
                            EdgeType type, int& next_free) const {
    switch (type) {
        case EdgeType::Directed:
            out.links[j].emplace_back(i, -tau);
            break;
        case EdgeType::Reversed:
            out.links[i].emplace_back(j, -tau);
            break;
        case EdgeType::Bidirected: {
            int latent = next_free++;
            out.links[latent];
            out.latent_vars.push_back(latent);
            out.links[i].emplace_back(latent, 0);
            out.links[j].emplace_back(latent, -tau);
            break;
        }
        case EdgeType::Undirected: {
            int selection = next_free++;
            auto& parents = out.links[selection];
            out.selection_vars.push_back(selection);
            parents.emplace_back(i, -tau);
            parents.emplace_back(j, 0);
            break;
        }
        case EdgeType::None:
            break;
    }
}

} // namespace tsdsep
