#include "search/dsep_search.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"

#include <algorithm>
#include <string>

namespace tsdsep {

namespace {

using NodeSet = std::unordered_set<Node, NodeHash>;
using Connection = std::optional<std::pair<Node, Mark>>;

// ─── FringeWalker ─────────────────────────────────────────────
// One round of expansion for either frontier. `this_path` is the
// table of the side being expanded, `other_path` the opposite one.

class FringeWalker {
public:
    FringeWalker(const LinkIndex& index, const NodeSet& conds, int max_lag,
                 bool backdoor, const Node& x, spdlog::logger& log)
        : index_(index), conds_(conds), max_lag_(max_lag),
          backdoor_(backdoor), x_(x), log_(log) {}

    Connection walk(const Fringe& level, Fringe& fringe,
                    VisitTable& this_path, const VisitTable& other_path) const {
        // Backdoor paths leave x against an arrow
        if (backdoor_ && level.size() == 1 && level[0].first == x_ &&
            level[0].second == Mark::Start) {
            return toParents(x_, fringe, this_path, other_path);
        }

        for (const auto& [v, mark] : level) {
            Connection found;
            if (conds_.count(v)) {
                // --> [v] <--
                if (mark == Mark::Arrowhead || mark == Mark::Start) {
                    found = toParents(v, fringe, this_path, other_path);
                }
            } else if (mark == Mark::Tail || mark == Mark::Start) {
                // <-- v <--  or  <-- v -->
                found = toParents(v, fringe, this_path, other_path);
                if (!found) found = toChildren(v, fringe, this_path, other_path);
            } else {
                // --> v -->
                found = toChildren(v, fringe, this_path, other_path);
            }
            if (found) return found;
        }

        log_.trace("Updated fringe holds {} nodes", fringe.size());
        return std::nullopt;
    }

private:
    bool inHorizon(const Node& w) const { return w.lag <= 0 && -w.lag <= max_lag_; }

    Connection toParents(const Node& v, Fringe& fringe,
                         VisitTable& this_path, const VisitTable& other_path) const {
        for (const Node& w : index_.parentsOf(v)) {
            if (backdoor_ && w == x_) continue;
            // Conditioned parents block the path
            if (conds_.count(w) || !inHorizon(w)) continue;

            auto it = this_path.find(w);
            if (it == this_path.end() || (!it->second.tail.present && !it->second.start)) {
                log_.trace("Walk parent: {} --> {}", v, w);
                fringe.emplace_back(w, Mark::Tail);
                this_path[w].tail = {true, v, Mark::Arrowhead};
            }

            // w is a non-collider here and not conditioned, so any
            // visit from the other side composes.
            if (other_path.count(w)) {
                log_.trace("Found connection: {} (tail)", w);
                return std::make_pair(w, Mark::Tail);
            }
        }
        return std::nullopt;
    }

    Connection toChildren(const Node& v, Fringe& fringe,
                          VisitTable& this_path, const VisitTable& other_path) const {
        for (const Node& w : index_.childrenOf(v)) {
            // Conditioned children may be entered
            if (!inHorizon(w)) continue;

            auto it = this_path.find(w);
            if (it == this_path.end() || (!it->second.arrowhead.present && !it->second.start)) {
                log_.trace("Walk child:  {} --> {}", v, w);
                fringe.emplace_back(w, Mark::Arrowhead);
                this_path[w].arrowhead = {true, v, Mark::Tail};
            }

            auto other = other_path.find(w);
            if (other == other_path.end()) continue;
            const Visit& seen = other->second;
            bool conditioned = conds_.count(w) > 0;
            if ((seen.tail.present && !conditioned) ||
                (seen.arrowhead.present && conditioned) ||
                seen.start) {
                log_.trace("Found connection: {} (arrowhead)", w);
                return std::make_pair(w, Mark::Arrowhead);
            }
        }
        return std::nullopt;
    }

    const LinkIndex& index_;
    const NodeSet& conds_;
    int max_lag_;
    bool backdoor_;
    Node x_;
    spdlog::logger& log_;
};

const Visit& lookup(const VisitTable& table, const Node& n) {
    auto it = table.find(n);
    if (it == table.end()) {
        throw SearchError("Path reconstruction reached unvisited node (" +
                          std::to_string(n.var) + ", " + std::to_string(n.lag) + ")");
    }
    return it->second;
}

/// Follow the stored predecessors in `table` from `meeting` until `end`
/// is appended to `path`, inferring the mark held at every step.
void traceBack(const VisitTable& table, const Node& meeting, const Node& end,
               const NodeSet& conds, NodeList& path) {
    Node node = meeting;
    Mark mark = lookup(table, node).tail.present ? Mark::Tail : Mark::Arrowhead;

    const size_t step_limit = 2 * table.size() + 1;
    size_t steps = 0;

    while (path.back() != end) {
        if (++steps > step_limit) {
            throw SearchError("Path reconstruction did not terminate");
        }
        const Visit::Entry& entry = lookup(table, node).entry(mark);
        if (!entry.present) {
            throw SearchError("Path reconstruction found no predecessor");
        }

        Node prev = entry.prev;
        path.push_back(prev);

        if (entry.prev_mark == Mark::Arrowhead) {
            // prev was left towards its parent: it was standing on a
            // tail unless conditioned, then on an arrowhead
            mark = conds.count(prev) ? Mark::Arrowhead : Mark::Tail;
        } else {
            const Visit::Entry& prev_tail = lookup(table, prev).tail;
            bool came_back = prev_tail.present && prev_tail.prev == node &&
                             prev_tail.prev_mark == mark;
            mark = (prev_tail.present && !came_back) ? Mark::Tail : Mark::Arrowhead;
        }
        node = prev;
    }
}

} // namespace

DSeparationSearch::DSeparationSearch(const LinkIndex& index, std::vector<int> selection_vars)
    : index_(index), selection_vars_(std::move(selection_vars)), logger_(logger()) {}

std::optional<NodeList> DSeparationSearch::findPath(const NodeList& X,
                                                    const NodeList& Y,
                                                    const NodeList& Z,
                                                    int max_lag,
                                                    bool backdoor) const {
    NodeSet conds;
    for (const Node& z : Z) {
        if (std::find(X.begin(), X.end(), z) != X.end()) continue;
        if (std::find(Y.begin(), Y.end(), z) != Y.end()) continue;
        conds.insert(z);
    }
    for (int s : selection_vars_) {
        for (int tau = 0; tau <= max_lag; ++tau) {
            conds.insert(Node(s, -tau));
        }
    }

    for (const Node& x : X) {
        for (const Node& y : Y) {
            auto path = searchPair(x, y, conds, max_lag, backdoor);
            if (path) return path;
        }
    }
    return std::nullopt;
}

std::optional<NodeList> DSeparationSearch::searchPair(const Node& x, const Node& y,
                                                      const NodeSet& conds, int max_lag,
                                                      bool backdoor) const {
    // pred grows from x, succ from y
    VisitTable pred;
    VisitTable succ;
    pred[x].start = true;
    succ[y].start = true;

    Fringe forward{{x, Mark::Start}};
    Fringe reverse{{y, Mark::Start}};

    FringeWalker walker(index_, conds, max_lag, backdoor, x, *logger_);

    while (!forward.empty() && !reverse.empty()) {
        Connection found;
        if (forward.size() <= reverse.size()) {
            logger_->trace("Walk from X since len(X_fringe)={} <= len(Y_fringe)={}",
                           forward.size(), reverse.size());
            Fringe level;
            level.swap(forward);
            found = walker.walk(level, forward, pred, succ);
        } else {
            logger_->trace("Walk from Y since len(X_fringe)={} > len(Y_fringe)={}",
                           forward.size(), reverse.size());
            Fringe level;
            level.swap(reverse);
            found = walker.walk(level, reverse, succ, pred);
        }

        if (found) {
            const Node& meeting = found->first;
            NodeList path{meeting};
            traceBack(pred, meeting, x, conds, path);
            std::reverse(path.begin(), path.end());
            traceBack(succ, meeting, y, conds, path);
            return path;
        }
    }
    return std::nullopt;
}

} // namespace tsdsep
