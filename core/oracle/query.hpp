#pragma once

#include "graph/node.hpp"

#include <tuple>

namespace tsdsep {

/// Canonical (X, Y, Z) of an independence query. Doubles as the
/// result cache key.
struct Query {
    NodeList X;
    NodeList Y;
    NodeList Z;

    bool operator<(const Query& other) const {
        return std::tie(X, Y, Z) < std::tie(other.X, other.Y, other.Z);
    }
    bool operator==(const Query& other) const {
        return X == other.X && Y == other.Y && Z == other.Z;
    }
};

/// Remove duplicates (first occurrence wins), drop from Z every node
/// already in X or Y, and check that all lags are non-positive, all
/// variables lie in [0, num_vars) and some Y node has lag zero.
/// Throws MalformedQueryError.
Query canonicalizeQuery(const NodeList& X, const NodeList& Y, const NodeList& Z,
                        int num_vars);

} // namespace tsdsep
