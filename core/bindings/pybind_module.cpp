// PyBind11 bindings for the tsdsep core.
// Exposes the oracle test, graph compilation and the search components to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DTSDSEP_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "common/errors.hpp"
#include "graph/node.hpp"
#include "graph/link.hpp"
#include "graph/edge_type.hpp"
#include "graph/edge_type_array.hpp"
#include "graph/graph_compiler.hpp"
#include "oracle/oracle_types.hpp"
#include "oracle/oracle_ci.hpp"

#include <algorithm>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace py = pybind11;

namespace {

// (var, lag) tuples, as used by the Python test interface
using PyNode = std::pair<int, int>;

tsdsep::NodeList toNodes(const std::vector<PyNode>& nodes) {
    tsdsep::NodeList result;
    result.reserve(nodes.size());
    for (const auto& [var, lag] : nodes) result.emplace_back(var, lag);
    return result;
}

std::vector<PyNode> fromNodes(const tsdsep::NodeList& nodes) {
    std::vector<PyNode> result;
    result.reserve(nodes.size());
    for (const auto& n : nodes) result.emplace_back(n.var, n.lag);
    return result;
}

// Accepts {j: [(i, tau), ...]}, {j: [((i, tau), coeff), ...]} and
// {j: [((i, tau), coeff, func), ...]}. The function is dropped.
tsdsep::Link toLink(const py::handle& entry) {
    auto props = entry.cast<py::tuple>();
    if (props.size() == 2 && !py::isinstance<py::tuple>(props[0])) {
        return tsdsep::Link(props[0].cast<int>(), props[1].cast<int>());
    }
    if (props.size() == 2 || props.size() == 3) {
        auto source = props[0].cast<py::tuple>();
        return tsdsep::Link(source[0].cast<int>(), source[1].cast<int>(),
                            props[1].cast<double>());
    }
    throw tsdsep::ConfigurationError("Links must be (i, tau), ((i, tau), coeff) "
                                     "or ((i, tau), coeff, func)");
}

tsdsep::LinkMap toLinkMap(const py::dict& links) {
    tsdsep::LinkMap result;
    for (const auto& [key, value] : links) {
        auto& parents = result[key.cast<int>()];
        for (const auto& entry : value.cast<py::list>()) {
            parents.push_back(toLink(entry));
        }
    }
    return result;
}

// Nested [N][N][tau_max + 1] lists of edge codes
tsdsep::EdgeTypeArray toEdgeTypeArray(
    const std::vector<std::vector<std::vector<std::string>>>& graph) {
    const int n = static_cast<int>(graph.size());
    const int tau_max = n > 0 && !graph[0].empty()
                            ? static_cast<int>(graph[0][0].size()) - 1 : 0;
    tsdsep::EdgeTypeArray array(n, std::max(tau_max, 0));
    for (int i = 0; i < n; ++i) {
        if (static_cast<int>(graph[i].size()) != n) {
            throw tsdsep::ConfigurationError("graph must have shape [N, N, tau_max + 1]");
        }
        for (int j = 0; j < n; ++j) {
            if (static_cast<int>(graph[i][j].size()) != tau_max + 1) {
                throw tsdsep::ConfigurationError("graph must have shape [N, N, tau_max + 1]");
            }
            for (int tau = 0; tau <= tau_max; ++tau) {
                array.set(i, j, tau, graph[i][j][tau]);
            }
        }
    }
    return array;
}

std::map<PyNode, std::vector<PyNode>> fromAncestors(
    const std::map<tsdsep::Node, tsdsep::NodeList>& ancestors) {
    std::map<PyNode, std::vector<PyNode>> result;
    for (const auto& [node, list] : ancestors) {
        result[{node.var, node.lag}] = fromNodes(list);
    }
    return result;
}

tsdsep::OracleConfig makeConfig(std::optional<std::vector<int>> observed_vars,
                                std::optional<std::vector<int>> selection_vars,
                                int verbosity) {
    tsdsep::OracleConfig config;
    config.observed_vars = std::move(observed_vars);
    config.selection_vars = std::move(selection_vars);
    config.verbosity = verbosity;
    return config;
}

} // namespace

PYBIND11_MODULE(tsdsep_bindings, m) {
    m.doc() = "Time series d-separation oracle";

    // ── Errors ──
    auto base = py::register_exception<tsdsep::OracleError>(m, "OracleError", PyExc_ValueError);
    py::register_exception<tsdsep::ConfigurationError>(m, "ConfigurationError", base.ptr());
    py::register_exception<tsdsep::InconsistentGraphError>(m, "InconsistentGraphError", base.ptr());
    py::register_exception<tsdsep::InvalidLaggedEdgeError>(m, "InvalidLaggedEdgeError", base.ptr());
    py::register_exception<tsdsep::MalformedQueryError>(m, "MalformedQueryError", base.ptr());
    py::register_exception<tsdsep::MissingBoundError>(m, "MissingBoundError", base.ptr());
    py::register_exception<tsdsep::UnsupportedOperationError>(
        m, "UnsupportedOperationError", PyExc_NotImplementedError);
    py::register_exception<tsdsep::SearchError>(m, "SearchError", base.ptr());

    // ── CompiledGraph ──
    py::class_<tsdsep::CompiledGraph>(m, "CompiledGraph")
        .def_readonly("observed_vars",  &tsdsep::CompiledGraph::observed_vars)
        .def_readonly("latent_vars",    &tsdsep::CompiledGraph::latent_vars)
        .def_readonly("selection_vars", &tsdsep::CompiledGraph::selection_vars)
        .def_property_readonly("links", [](const tsdsep::CompiledGraph& g) {
            std::map<int, std::vector<PyNode>> links;
            for (const auto& [var, parents] : g.links) {
                auto& out = links[var];
                for (const auto& link : parents) out.emplace_back(link.source, link.lag);
            }
            return links;
        });

    m.def("get_links_from_graph", [](const std::vector<std::vector<std::vector<std::string>>>& graph) {
        return tsdsep::GraphCompiler().compile(toEdgeTypeArray(graph));
    }, py::arg("graph"));

    // ── OracleCI ──
    py::class_<tsdsep::OracleCI>(m, "OracleCI")
        .def(py::init([](const py::dict& links,
                         std::optional<std::vector<int>> observed_vars,
                         std::optional<std::vector<int>> selection_vars,
                         int verbosity) {
                 return std::make_unique<tsdsep::OracleCI>(
                     toLinkMap(links),
                     makeConfig(std::move(observed_vars), std::move(selection_vars), verbosity));
             }),
             py::arg("links"), py::arg("observed_vars") = py::none(),
             py::arg("selection_vars") = py::none(), py::arg("verbosity") = 0)
        .def_static("from_graph", [](const std::vector<std::vector<std::vector<std::string>>>& graph,
                                     int verbosity) {
                        return std::make_unique<tsdsep::OracleCI>(
                            toEdgeTypeArray(graph), makeConfig(std::nullopt, std::nullopt, verbosity));
                    },
                    py::arg("graph"), py::arg("verbosity") = 0)
        .def_property_readonly("measure", &tsdsep::OracleCI::measure)
        .def_property_readonly("observed_vars", &tsdsep::OracleCI::observedVars)
        .def_property_readonly("selection_vars", &tsdsep::OracleCI::selectionVars)
        .def_property_readonly("max_lag", &tsdsep::OracleCI::lastMaxLag)
        .def_property_readonly("N", &tsdsep::OracleCI::numVariables)
        .def("run_test", [](tsdsep::OracleCI& self, const std::vector<PyNode>& X,
                            const std::vector<PyNode>& Y, const std::vector<PyNode>& Z,
                            int tau_max) {
                 auto r = self.runTest(toNodes(X), toNodes(Y), toNodes(Z), tau_max);
                 return std::make_pair(r.value, r.pvalue);
             },
             py::arg("X"), py::arg("Y"), py::arg("Z") = std::vector<PyNode>{},
             py::arg("tau_max") = 0)
        .def("get_measure", [](tsdsep::OracleCI& self, const std::vector<PyNode>& X,
                               const std::vector<PyNode>& Y, const std::vector<PyNode>& Z,
                               int tau_max) {
                 return self.getMeasure(toNodes(X), toNodes(Y), toNodes(Z), tau_max);
             },
             py::arg("X"), py::arg("Y"), py::arg("Z") = std::vector<PyNode>{},
             py::arg("tau_max") = 0)
        .def("get_shortest_path", [](tsdsep::OracleCI& self, const std::vector<PyNode>& X,
                                     const std::vector<PyNode>& Y, const std::vector<PyNode>& Z,
                                     std::optional<int> max_lag, bool compute_ancestors,
                                     bool backdoor) -> py::object {
                 auto r = self.getShortestPath(toNodes(X), toNodes(Y), toNodes(Z),
                                               max_lag, compute_ancestors, backdoor);
                 py::object path = r.path ? py::cast(fromNodes(*r.path))
                                          : py::object(py::bool_(false));
                 if (!compute_ancestors) return path;
                 return py::make_tuple(path,
                                       fromAncestors(*r.ancestors_x),
                                       fromAncestors(*r.ancestors_y),
                                       fromAncestors(*r.ancestors_z));
             },
             py::arg("X"), py::arg("Y"), py::arg("Z"), py::arg("max_lag") = py::none(),
             py::arg("compute_ancestors") = false, py::arg("backdoor") = false)
        .def("get_model_selection_criterion", [](const tsdsep::OracleCI& self, int j,
                                                 const std::vector<PyNode>& parents,
                                                 int tau_max) {
                 return self.getModelSelectionCriterion(j, toNodes(parents), tau_max);
             },
             py::arg("j"), py::arg("parents"), py::arg("tau_max") = 0);
}
