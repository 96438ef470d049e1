#pragma once

#include <map>
#include <vector>

namespace tsdsep {

/// A directed link source(t + lag) --> target(t), stored under its target.
/// Only links with a nonzero coefficient are edges of the graph.
struct Link {
    int source = 0;
    int lag = 0;                // <= 0, relative to the target
    double coefficient = 1.0;

    Link() = default;
    Link(int source, int lag, double coefficient = 1.0)
        : source(source), lag(lag), coefficient(coefficient) {}

    bool active() const { return coefficient != 0.0; }
};

/// Incoming links (direct parents) per variable.
using LinkMap = std::map<int, std::vector<Link>>;

} // namespace tsdsep
