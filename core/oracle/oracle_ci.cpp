#include "oracle/oracle_ci.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"

#include <algorithm>
#include <exception>
#include <numeric>
#include <utility>

namespace tsdsep {

namespace {

const LinkMap& requireLinks(const LinkMap& links) {
    if (links.empty()) {
        throw ConfigurationError("Either links or graph must be specified");
    }
    int expected = 0;
    for (const auto& [var, _] : links) {
        if (var != expected++) {
            throw ConfigurationError("Link variables must be numbered 0..N-1, missing " +
                                     std::to_string(expected - 1));
        }
    }
    return links;
}

std::vector<int> checkedVarList(const std::string& name,
                                const std::optional<std::vector<int>>& vars,
                                int n, bool default_all) {
    if (!vars.has_value()) {
        std::vector<int> all;
        if (default_all) {
            all.resize(n);
            std::iota(all.begin(), all.end(), 0);
        }
        return all;
    }

    const std::vector<int>& list = *vars;
    for (int v : list) {
        if (v < 0 || v >= n) {
            throw ConfigurationError(name + " must be subset of range(N), got " +
                                     std::to_string(v));
        }
    }
    if (!std::is_sorted(list.begin(), list.end())) {
        throw ConfigurationError(name + " must be ordered");
    }
    if (std::adjacent_find(list.begin(), list.end()) != list.end()) {
        throw ConfigurationError(name + " must not contain duplicates");
    }
    return list;
}

} // namespace

// ─── Construction ─────────────────────────────────────────────

OracleCI::OracleCI(LinkMap links, OracleConfig config)
    : index_(requireLinks(links)),
      observed_vars_(checkedVarList("observed_vars", config.observed_vars,
                                    index_.numVariables(), true)),
      selection_vars_(checkedVarList("selection_vars", config.selection_vars,
                                     index_.numVariables(), false)),
      ancestor_search_(index_, selection_vars_),
      dsep_search_(index_, selection_vars_),
      logger_(logger()) {
    for (size_t pos = 0; pos < observed_vars_.size(); ++pos) {
        external_index_[observed_vars_[pos]] = static_cast<int>(pos);
    }
    logger_->set_level(levelForVerbosity(config.verbosity));
    logger_->debug("Oracle over {} variables ({} observed, {} selected)",
                   numVariables(), observed_vars_.size(), selection_vars_.size());
}

OracleCI::OracleCI(const EdgeTypeArray& graph, OracleConfig config)
    : OracleCI(GraphCompiler().compile(graph), config.verbosity) {}

OracleCI::OracleCI(CompiledGraph compiled, int verbosity)
    : OracleCI(std::move(compiled.links),
               OracleConfig{compiled.observed_vars, compiled.selection_vars, verbosity}) {}

// ─── Independence test interface ──────────────────────────────

TestResult OracleCI::runTest(const NodeList& X, const NodeList& Y,
                             const NodeList& Z, int /*tau_max*/) {
    Query q = prepare(X, Y, Z);
    TestResult result = cachedDSeparation(q) ? TestResult{0.0, 1.0}
                                             : TestResult{1.0, 0.0};
    logger_->debug("        val = {:.3f} | pval = {:.5f}", result.value, result.pvalue);
    return result;
}

double OracleCI::getMeasure(const NodeList& X, const NodeList& Y,
                            const NodeList& Z, int /*tau_max*/) {
    Query q = prepare(X, Y, Z);
    return cachedDSeparation(q) ? 0.0 : 1.0;
}

double OracleCI::getModelSelectionCriterion(int /*j*/, const NodeList& /*parents*/,
                                            int /*tau_max*/) const {
    throw UnsupportedOperationError("Model selection not implemented for " + measure());
}

ShortestPathResult OracleCI::getShortestPath(const NodeList& X, const NodeList& Y,
                                             const NodeList& Z,
                                             std::optional<int> max_lag,
                                             bool compute_ancestors,
                                             bool backdoor) {
    Query q = prepare(X, Y, Z);
    logger_->debug("Testing X={} d-sep Y={} given Z={} in TSG", q.X, q.Y, q.Z);

    ShortestPathResult result;
    result.max_lag = max_lag.has_value() ? *max_lag : maxLagFromXYZ(q);
    last_max_lag_.store(result.max_lag);

    auto path = dsep_search_.findPath(q.X, q.Y, q.Z, result.max_lag, backdoor);
    if (path) {
        NodeList observed;
        for (const Node& n : *path) {
            auto it = external_index_.find(n.var);
            if (it != external_index_.end()) observed.emplace_back(it->second, n.lag);
        }
        logger_->debug("Open path {} (observed {})", *path, observed);
        result.path = std::move(observed);
    } else {
        logger_->debug("No open path");
    }

    if (compute_ancestors) {
        logger_->debug("Compute ancestors up to lag {}", result.max_lag);
        result.ancestors_x = ancestor_search_.run(q.X, q.Z, AncestorMode::MaxLag,
                                                  result.max_lag).ancestors;
        result.ancestors_y = ancestor_search_.run(q.Y, q.Z, AncestorMode::MaxLag,
                                                  result.max_lag).ancestors;
        result.ancestors_z = ancestor_search_.run(q.Z, q.Z, AncestorMode::MaxLag,
                                                  result.max_lag).ancestors;
    }
    return result;
}

bool OracleCI::isDSeparated(const NodeList& X, const NodeList& Y, const NodeList& Z,
                            std::optional<int> max_lag) {
    return computeDSeparation(canonicalizeQuery(X, Y, Z, numVariables()), max_lag);
}

size_t OracleCI::cacheSize() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return cache_.size();
}

// ─── Internals ────────────────────────────────────────────────

NodeList OracleCI::toInternal(const NodeList& nodes) const {
    NodeList result;
    result.reserve(nodes.size());
    for (const Node& n : nodes) {
        if (n.var < 0 || n.var >= static_cast<int>(observed_vars_.size())) {
            throw MalformedQueryError("var index " + std::to_string(n.var) +
                                      " must be in [0, " +
                                      std::to_string(observed_vars_.size()) + ")");
        }
        result.emplace_back(observed_vars_[n.var], n.lag);
    }
    return result;
}

Query OracleCI::prepare(const NodeList& X, const NodeList& Y, const NodeList& Z) const {
    return canonicalizeQuery(toInternal(X), toInternal(Y), toInternal(Z), numVariables());
}

bool OracleCI::cachedDSeparation(const Query& q) {
    std::promise<bool> promise;
    std::shared_future<bool> result;
    bool owner = false;
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = cache_.find(q);
        if (it != cache_.end()) {
            result = it->second;
        } else {
            result = promise.get_future().share();
            cache_.emplace(q, result);
            owner = true;
        }
    }

    if (owner) {
        try {
            search_count_.fetch_add(1);
            promise.set_value(computeDSeparation(q, std::nullopt));
        } catch (...) {
            // Waiters see the failure; later calls recompute.
            promise.set_exception(std::current_exception());
            std::lock_guard<std::mutex> lock(cache_mutex_);
            cache_.erase(q);
            throw;
        }
    }
    return result.get();
}

bool OracleCI::computeDSeparation(const Query& q, std::optional<int> max_lag) {
    logger_->debug("Testing X={} d-sep Y={} given Z={} in TSG", q.X, q.Y, q.Z);

    int lag = 0;
    if (max_lag.has_value()) {
        lag = *max_lag;
        logger_->debug("Set max. time lag to: {}", lag);
    } else {
        lag = maxLagFromXYZ(q);
    }
    last_max_lag_.store(lag);

    bool separated = !dsep_search_.findPath(q.X, q.Y, q.Z, lag).has_value();
    logger_->debug("d-separated: {}", separated);
    return separated;
}

int OracleCI::maxLagFromXYZ(const Query& q) const {
    int lag_x = ancestor_search_.run(q.X, q.Z, AncestorMode::NonRepeating).max_lag;
    int lag_y = ancestor_search_.run(q.Y, q.Z, AncestorMode::NonRepeating).max_lag;
    int lag_z = ancestor_search_.run(q.Z, q.Z, AncestorMode::NonRepeating).max_lag;

    int max_lag = std::max({lag_x, lag_y, lag_z});
    logger_->debug("Max. non-repeated ancestral time lag: {}", max_lag);
    return max_lag;
}

} // namespace tsdsep
