#pragma once

#include "graph/link_index.hpp"
#include "graph/node.hpp"

#include <spdlog/spdlog.h>

#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace tsdsep {

enum class AncestorMode {
    /// Skip links whose time-shifted copy was already followed. The
    /// deepest admitted ancestor gives a sufficient truncation horizon.
    NonRepeating,
    /// Follow every link down to an explicit maximum lag.
    MaxLag
};

struct AncestorResult {
    /// Ancestors per seed, in discovery order.
    std::map<Node, NodeList> ancestors;
    /// Deepest |lag| reached (NonRepeating) or the bound used (MaxLag).
    int max_lag = 0;
};

// ─── AncestorSearch ───────────────────────────────────────────
// Level-by-level walk up the parent links from each seed. A parent
// is not entered if it is conditioned on (Z plus the selection
// variables) or already recorded for the same seed.

class AncestorSearch {
public:
    AncestorSearch(const LinkIndex& index, std::vector<int> selection_vars);

    /// Non-blocked ancestors of every seed given `conds`.
    /// Throws MissingBoundError if mode is MaxLag and max_lag is unset.
    AncestorResult run(const NodeList& seeds,
                       const NodeList& conds,
                       AncestorMode mode,
                       std::optional<int> max_lag = std::nullopt) const;

private:
    const LinkIndex& index_;
    std::vector<int> selection_vars_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace tsdsep
