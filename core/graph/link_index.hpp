#pragma once

#include "graph/link.hpp"
#include "graph/node.hpp"

#include <unordered_map>
#include <vector>

namespace tsdsep {

// ─── LinkIndex ────────────────────────────────────────────────
// Read-only adjacency views over a LinkMap in the time-unrolled
// graph. Parents come straight from the links; children from an
// inverted table built once at construction.

class LinkIndex {
public:
    /// Throws ConfigurationError if a link source is not a key of `links`.
    explicit LinkIndex(const LinkMap& links);

    /// Lagged parents of `node`: (source, node.lag + link.lag) for every
    /// active link of node.var.
    NodeList parentsOf(const Node& node, bool exclude_contemporaneous = false) const;

    /// Lagged children of `node`: (target, node.lag + |link.lag|).
    /// May return lags > 0; callers truncate to their horizon.
    NodeList childrenOf(const Node& node, bool exclude_contemporaneous = false) const;

    int numVariables() const { return static_cast<int>(links_.size()); }
    bool contains(int var) const { return links_.count(var) > 0; }
    const LinkMap& links() const { return links_; }

private:
    struct ChildLink {
        int child;
        int delay;  // >= 0
    };

    LinkMap links_;
    std::unordered_map<int, std::vector<ChildLink>> children_;
};

} // namespace tsdsep
