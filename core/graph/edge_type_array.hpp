#pragma once

#include "graph/edge_type.hpp"
#include "common/errors.hpp"

#include <string>
#include <vector>

namespace tsdsep {

/// Dense (source, target, lag) array of edge types, lag in [0, tau_max].
/// Cell (i, j, tau) describes the link between i(t - tau) and j(t).
class EdgeTypeArray {
public:
    EdgeTypeArray() = default;
    EdgeTypeArray(int num_vars, int tau_max)
        : n_(num_vars), tau_max_(tau_max) {
        if (num_vars < 0 || tau_max < 0) {
            throw ConfigurationError("EdgeTypeArray dimensions must be non-negative");
        }
        cells_.assign(static_cast<size_t>(n_) * n_ * (tau_max_ + 1), EdgeType::None);
    }

    int numVars() const { return n_; }
    int tauMax() const { return tau_max_; }

    EdgeType at(int i, int j, int tau) const { return cells_[index(i, j, tau)]; }

    void set(int i, int j, int tau, EdgeType type) { cells_[index(i, j, tau)] = type; }
    void set(int i, int j, int tau, const std::string& code) {
        set(i, j, tau, parseEdgeType(code));
    }

    /// Set (i,j,0) and its mirror (j,i,0) in one call.
    void setContemporaneous(int i, int j, EdgeType type) {
        set(i, j, 0, type);
        set(j, i, 0, reverse(type));
    }

private:
    size_t index(int i, int j, int tau) const {
        if (i < 0 || i >= n_ || j < 0 || j >= n_ || tau < 0 || tau > tau_max_) {
            throw ConfigurationError(
                "EdgeTypeArray index (" + std::to_string(i) + ", " +
                std::to_string(j) + ", " + std::to_string(tau) + ") out of range");
        }
        return (static_cast<size_t>(i) * n_ + j) * (tau_max_ + 1) + tau;
    }

    int n_ = 0;
    int tau_max_ = 0;
    std::vector<EdgeType> cells_;
};

} // namespace tsdsep
