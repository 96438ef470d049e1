#pragma once

#include "graph/edge_type_array.hpp"
#include "graph/link.hpp"

#include <vector>

namespace tsdsep {

// ─── CompiledGraph ────────────────────────────────────────────
// Canonical DAG over observed plus synthetic variables.
// Observed variables keep their indices [0, N); latent and
// selection variables are appended from N on.

struct CompiledGraph {
    LinkMap links;
    std::vector<int> observed_vars;
    std::vector<int> latent_vars;
    std::vector<int> selection_vars;

    int numVariables() const { return static_cast<int>(links.size()); }
};

// ─── GraphCompiler ────────────────────────────────────────────
// Turns an edge-type array (DAG or MAG) into parent links.
//
//   i --> j   adds i as parent of j
//   i <-> j   adds a latent L with L --> i and L --> j
//   i --- j   adds a selection S with i --> S and j --> S
//
// This is the canonical DAG construction for ancestral graphs
// (Richardson & Spirtes 2002).

class GraphCompiler {
public:
    GraphCompiler() = default;

    /// Throws InconsistentGraphError on mismatched lag-zero mirrors
    /// and InvalidLaggedEdgeError on a lagged "<--".
    CompiledGraph compile(const EdgeTypeArray& graph) const;

private:
    void addEdge(CompiledGraph& out, int i, int j, int tau,
                 EdgeType type, int& next_free) const;
};

} // namespace tsdsep
