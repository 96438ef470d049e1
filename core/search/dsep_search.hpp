#pragma once

#include "graph/link_index.hpp"
#include "graph/node.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace tsdsep {

/// How a path touches a node.
enum class Mark {
    Start,      // the query node a frontier grows from
    Tail,       // path leaves through an outgoing edge:  v -->
    Arrowhead   // path enters through an incoming edge: --> v
};

/// Marks held by a visited node, each with the (node, mark) it was
/// reached from. A node may hold Tail and Arrowhead at once.
struct Visit {
    struct Entry {
        bool present = false;
        Node prev;
        Mark prev_mark = Mark::Start;
    };

    bool start = false;
    Entry tail;
    Entry arrowhead;

    const Entry& entry(Mark mark) const { return mark == Mark::Tail ? tail : arrowhead; }
};

using VisitTable = std::unordered_map<Node, Visit, NodeHash>;
using Fringe = std::vector<std::pair<Node, Mark>>;

// ─── DSeparationSearch ────────────────────────────────────────
// Bidirectional breadth-first search for a d-connecting path in
// the time series graph truncated at lag -max_lag.
//
// Paths only traverse the motifs
//   <-- v <--,  <-- v -->,  --> v -->  (v not conditioned)
//   --> [v] <--                        (v conditioned)
// and nodes (var, t) must satisfy -max_lag <= t <= 0.

class DSeparationSearch {
public:
    DSeparationSearch(const LinkIndex& index, std::vector<int> selection_vars);

    /// First open path between some x in X and some y in Y given Z,
    /// ordered from x to y. Empty if X and Y are d-separated.
    /// With `backdoor`, only paths entering x with an arrowhead count.
    std::optional<NodeList> findPath(const NodeList& X,
                                     const NodeList& Y,
                                     const NodeList& Z,
                                     int max_lag,
                                     bool backdoor = false) const;

private:
    using NodeSet = std::unordered_set<Node, NodeHash>;

    std::optional<NodeList> searchPair(const Node& x, const Node& y,
                                       const NodeSet& conds, int max_lag,
                                       bool backdoor) const;

    const LinkIndex& index_;
    std::vector<int> selection_vars_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace tsdsep
