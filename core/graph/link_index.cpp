#include "graph/link_index.hpp"
#include "common/errors.hpp"

#include <cstdlib>
#include <string>

namespace tsdsep {

LinkIndex::LinkIndex(const LinkMap& links) : links_(links) {
    for (const auto& [var, _] : links_) {
        children_[var];  // ensure entry exists
    }

    for (const auto& [target, parents] : links_) {
        for (const Link& link : parents) {
            if (!links_.count(link.source)) {
                throw ConfigurationError(
                    "Link source " + std::to_string(link.source) + " of variable " +
                    std::to_string(target) + " is not a variable of the graph");
            }
            if (link.lag > 0) {
                throw ConfigurationError(
                    "Link lags must be non-positive, got " + std::to_string(link.lag) +
                    " for " + std::to_string(link.source) + " --> " +
                    std::to_string(target));
            }
            if (!link.active()) continue;
            children_[link.source].push_back({target, std::abs(link.lag)});
        }
    }
}

NodeList LinkIndex::parentsOf(const Node& node, bool exclude_contemporaneous) const {
    NodeList result;
    auto it = links_.find(node.var);
    if (it == links_.end()) return result;

    result.reserve(it->second.size());
    for (const Link& link : it->second) {
        if (!link.active()) continue;
        if (exclude_contemporaneous && link.lag == 0) continue;
        result.emplace_back(link.source, node.lag + link.lag);
    }
    return result;
}

NodeList LinkIndex::childrenOf(const Node& node, bool exclude_contemporaneous) const {
    NodeList result;
    auto it = children_.find(node.var);
    if (it == children_.end()) return result;

    result.reserve(it->second.size());
    for (const ChildLink& c : it->second) {
        if (exclude_contemporaneous && c.delay == 0) continue;
        result.emplace_back(c.child, node.lag + c.delay);
    }
    return result;
}

} // namespace tsdsep
