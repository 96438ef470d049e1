#pragma once

#include "graph/edge_type_array.hpp"
#include "graph/graph_compiler.hpp"
#include "graph/link.hpp"
#include "graph/link_index.hpp"
#include "oracle/oracle_types.hpp"
#include "oracle/query.hpp"
#include "search/ancestor_search.hpp"
#include "search/dsep_search.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstddef>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tsdsep {

// ─── OracleCI ─────────────────────────────────────────────────
// Oracle conditional independence test X _|_ Y | Z on a known
// time series graph. X and Y are independent given Z exactly when
// they are d-separated given Z.
//
// Usable wherever a statistical test is expected, typically to
// unit test causal discovery methods against the true graph.
//
// Queries use external indices, i.e. positions in observed_vars.
// Results are memoised per canonical (X, Y, Z); concurrent callers
// of the same query share a single computation.

class OracleCI {
public:
    /// Oracle over explicit parent links.
    /// Throws ConfigurationError on an empty map, sources outside the
    /// map, or unsorted / duplicated / out-of-range variable lists.
    explicit OracleCI(LinkMap links, OracleConfig config = {});

    /// Oracle over a DAG or MAG edge-type array. Latent and selection
    /// variables are added for "<->" and "---" edges; the observed
    /// and selection lists of `config` are replaced by the compiled ones.
    explicit OracleCI(const EdgeTypeArray& graph, OracleConfig config = {});

    OracleCI(const OracleCI&) = delete;
    OracleCI& operator=(const OracleCI&) = delete;

    /// (0, 1) if X and Y are d-separated given Z, else (1, 0).
    /// tau_max is unused and kept for interface parity.
    TestResult runTest(const NodeList& X, const NodeList& Y,
                       const NodeList& Z = {}, int tau_max = 0);

    /// 0 if X and Y are d-separated given Z, else 1.
    double getMeasure(const NodeList& X, const NodeList& Y,
                      const NodeList& Z = {}, int tau_max = 0);

    /// Open path between X and Y given Z, if any. Without `max_lag`
    /// the horizon comes from the non-repeating ancestor search.
    /// `backdoor` restricts to paths that start with an arrowhead at x.
    ShortestPathResult getShortestPath(const NodeList& X, const NodeList& Y,
                                       const NodeList& Z,
                                       std::optional<int> max_lag = std::nullopt,
                                       bool compute_ancestors = false,
                                       bool backdoor = false);

    /// d-separation in compiled indices, uncached.
    bool isDSeparated(const NodeList& X, const NodeList& Y, const NodeList& Z,
                      std::optional<int> max_lag = std::nullopt);

    /// Always throws UnsupportedOperationError.
    double getModelSelectionCriterion(int j, const NodeList& parents,
                                      int tau_max = 0) const;

    std::string measure() const { return "oracle_ci"; }
    int numVariables() const { return index_.numVariables(); }
    const LinkMap& links() const { return index_.links(); }
    const std::vector<int>& observedVars() const { return observed_vars_; }
    const std::vector<int>& selectionVars() const { return selection_vars_; }

    /// Horizon used by the most recent search.
    int lastMaxLag() const { return last_max_lag_.load(); }

    /// Number of d-separation searches run to fill the cache.
    size_t searchCount() const { return search_count_.load(); }
    size_t cacheSize() const;

private:
    OracleCI(CompiledGraph compiled, int verbosity);

    Query prepare(const NodeList& X, const NodeList& Y, const NodeList& Z) const;
    NodeList toInternal(const NodeList& nodes) const;

    bool cachedDSeparation(const Query& q);
    bool computeDSeparation(const Query& q, std::optional<int> max_lag);
    int maxLagFromXYZ(const Query& q) const;

    LinkIndex index_;
    std::vector<int> observed_vars_;
    std::vector<int> selection_vars_;
    std::unordered_map<int, int> external_index_;  // compiled var → observed position

    AncestorSearch ancestor_search_;
    DSeparationSearch dsep_search_;

    mutable std::mutex cache_mutex_;
    std::map<Query, std::shared_future<bool>> cache_;
    std::atomic<size_t> search_count_{0};
    std::atomic<int> last_max_lag_{0};

    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace tsdsep
