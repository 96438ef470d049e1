#pragma once

#include <spdlog/fmt/ostr.h>

#include <cstddef>
#include <functional>
#include <ostream>
#include <vector>

namespace tsdsep {

/// A vertex of the time-unrolled graph: variable `var` at time t + `lag`.
/// Lags are non-positive; lag 0 is the present.
struct Node {
    int var = 0;
    int lag = 0;

    Node() = default;
    Node(int var, int lag) : var(var), lag(lag) {}

    bool operator==(const Node& other) const {
        return var == other.var && lag == other.lag;
    }
    bool operator!=(const Node& other) const { return !(*this == other); }
    bool operator<(const Node& other) const {
        return var != other.var ? var < other.var : lag < other.lag;
    }
};

using NodeList = std::vector<Node>;

inline std::ostream& operator<<(std::ostream& os, const Node& n) {
    return os << "(" << n.var << ", " << n.lag << ")";
}

inline std::ostream& operator<<(std::ostream& os, const NodeList& nodes) {
    os << "[";
    for (size_t i = 0; i < nodes.size(); ++i) {
        if (i > 0) os << ", ";
        os << nodes[i];
    }
    return os << "]";
}

struct NodeHash {
    size_t operator()(const Node& n) const {
        return std::hash<long long>()(
            (static_cast<long long>(n.var) << 32) ^
            static_cast<unsigned int>(n.lag));
    }
};

} // namespace tsdsep

#if FMT_VERSION >= 90000
template <> struct fmt::formatter<tsdsep::Node> : fmt::ostream_formatter {};
template <> struct fmt::formatter<tsdsep::NodeList> : fmt::ostream_formatter {};
#endif
