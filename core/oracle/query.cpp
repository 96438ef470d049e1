#include "oracle/query.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <initializer_list>
#include <sstream>
#include <string>
#include <unordered_set>

namespace tsdsep {

namespace {

NodeList unique(const NodeList& nodes) {
    NodeList result;
    std::unordered_set<Node, NodeHash> seen;
    for (const Node& n : nodes) {
        if (seen.insert(n).second) result.push_back(n);
    }
    return result;
}

bool contains(const NodeList& nodes, const Node& n) {
    return std::find(nodes.begin(), nodes.end(), n) != nodes.end();
}

std::string describe(const NodeList& nodes) {
    std::ostringstream oss;
    oss << nodes;
    return oss.str();
}

} // namespace

Query canonicalizeQuery(const NodeList& X, const NodeList& Y, const NodeList& Z,
                        int num_vars) {
    Query q;
    q.X = unique(X);
    q.Y = unique(Y);
    for (const Node& z : unique(Z)) {
        if (!contains(q.X, z) && !contains(q.Y, z)) q.Z.push_back(z);
    }

    if (q.X.empty() || q.Y.empty()) {
        throw MalformedQueryError("X and Y must be non-empty lists of (var, -lag) nodes");
    }

    for (const NodeList* part : {&q.X, &q.Y, &q.Z}) {
        for (const Node& n : *part) {
            if (n.lag > 0) {
                throw MalformedQueryError("nodes are " + describe(*part) +
                                          ", but all lags must be non-positive");
            }
            if (n.var < 0 || n.var >= num_vars) {
                throw MalformedQueryError("var index " + std::to_string(n.var) +
                                          " must be in [0, " +
                                          std::to_string(num_vars - 1) + "]");
            }
        }
    }

    bool any_present = std::any_of(q.Y.begin(), q.Y.end(),
                                   [](const Node& n) { return n.lag == 0; });
    if (!any_present) {
        throw MalformedQueryError("Y-nodes are " + describe(q.Y) +
                                  ", but one of the Y-nodes must have zero lag");
    }
    return q;
}

} // namespace tsdsep
