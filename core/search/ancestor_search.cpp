#include "search/ancestor_search.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"

#include <algorithm>
#include <cstdlib>
#include <set>
#include <tuple>
#include <unordered_set>
#include <utility>

namespace tsdsep {

AncestorSearch::AncestorSearch(const LinkIndex& index, std::vector<int> selection_vars)
    : index_(index), selection_vars_(std::move(selection_vars)), logger_(logger()) {}

AncestorResult AncestorSearch::run(const NodeList& seeds,
                                   const NodeList& conds,
                                   AncestorMode mode,
                                   std::optional<int> max_lag) const {
    AncestorResult result;

    int bound = 0;
    if (mode == AncestorMode::MaxLag) {
        if (!max_lag.has_value()) {
            throw MissingBoundError("max_lag must be set in max-lag ancestor mode");
        }
        bound = std::abs(*max_lag);
    }

    std::unordered_set<Node, NodeHash> conditioned;
    for (const Node& z : conds) {
        if (std::find(seeds.begin(), seeds.end(), z) == seeds.end()) {
            conditioned.insert(z);
        }
    }
    // Selection variables are conditioned on at lags 0..bound. In
    // non-repeating mode the bound is not known yet, so only lag 0.
    for (int s : selection_vars_) {
        for (int tau = 0; tau <= bound; ++tau) {
            conditioned.insert(Node(s, -tau));
        }
    }

    for (const Node& y : seeds) {
        if (result.ancestors.count(y)) continue;
        NodeList& ancestors = result.ancestors[y];
        std::unordered_set<Node, NodeHash> recorded;

        if (mode == AncestorMode::NonRepeating) {
            bound = std::max(bound, std::abs(y.lag));
        }

        // (parent var, child var, lag difference) of every followed link
        std::set<std::tuple<int, int, int>> seen_links;

        NodeList this_level{y};
        while (!this_level.empty()) {
            NodeList next_level;
            for (const Node& v : this_level) {
                for (const Node& par : index_.parentsOf(v)) {
                    if (conditioned.count(par) || recorded.count(par)) continue;

                    auto link = std::make_tuple(par.var, v.var, std::abs(v.lag - par.lag));
                    bool admit = false;
                    if (mode == AncestorMode::NonRepeating) {
                        admit = seen_links.count(link) == 0;
                    } else {
                        admit = std::abs(par.lag) <= bound;
                    }
                    if (!admit) continue;

                    ancestors.push_back(par);
                    recorded.insert(par);
                    if (mode == AncestorMode::NonRepeating) {
                        bound = std::max(bound, std::abs(par.lag));
                    }
                    next_level.push_back(par);
                    seen_links.insert(link);
                }
            }
            this_level = std::move(next_level);
        }

        logger_->trace("Ancestors of {}: {}", y, ancestors);
    }

    result.max_lag = bound;
    return result;
}

} // namespace tsdsep
