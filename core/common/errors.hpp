#pragma once

#include <stdexcept>
#include <string>

namespace tsdsep {

// ─── Error taxonomy ───────────────────────────────────────────
// All oracle failures are programming or input errors. They are
// raised at the point of detection and never retried.

class OracleError : public std::runtime_error {
public:
    explicit OracleError(const std::string& what) : std::runtime_error(what) {}
};

/// Missing graph definition, or malformed observed/selection lists.
class ConfigurationError : public OracleError {
public:
    explicit ConfigurationError(const std::string& what) : OracleError(what) {}
};

/// Lag-zero cells (i,j,0) and (j,i,0) are not structural reverses.
class InconsistentGraphError : public OracleError {
public:
    explicit InconsistentGraphError(const std::string& what) : OracleError(what) {}
};

/// Lagged cell holding something other than -->, <-> or ---.
class InvalidLaggedEdgeError : public OracleError {
public:
    explicit InvalidLaggedEdgeError(const std::string& what) : OracleError(what) {}
};

/// X, Y, Z violate the query invariants.
class MalformedQueryError : public OracleError {
public:
    explicit MalformedQueryError(const std::string& what) : OracleError(what) {}
};

/// Ancestor search in max-lag mode without a bound.
class MissingBoundError : public OracleError {
public:
    explicit MissingBoundError(const std::string& what) : OracleError(what) {}
};

/// Operations of the independence-test interface the oracle cannot serve.
class UnsupportedOperationError : public OracleError {
public:
    explicit UnsupportedOperationError(const std::string& what) : OracleError(what) {}
};

/// Internal inconsistency in the search tables.
class SearchError : public OracleError {
public:
    explicit SearchError(const std::string& what) : OracleError(what) {}
};

} // namespace tsdsep
