// PyBind11 bindings for the dagstore core.
// Exposes a Dag keyed by int64 ids with arbitrary Python payloads.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DDAGSTORE_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "dag/dag.hpp"
#include "dag/dag_error.hpp"
#include "logging/logging.hpp"
#include "verification/verification.hpp"

#include <cstdint>
#include <set>
#include <utility>
#include <vector>

namespace py = pybind11;

namespace {

using PyDag = dagstore::Dag<int64_t, py::object, py::object>;

// Materialised because Python may hold the result past the next mutation.
template <typename Range>
std::vector<std::pair<int64_t, py::object>> toList(const Range& range) {
    std::vector<std::pair<int64_t, py::object>> items;
    for (const auto& [id, data] : range) {
        items.emplace_back(id, data);
    }
    return items;
}

py::tuple removedToTuple(dagstore::RemovedNode<py::object, py::object> removed) {
    py::list edges;
    for (auto& e : removed.edges) edges.append(std::move(e));
    return py::make_tuple(std::move(removed.data), edges);
}

} // namespace

PYBIND11_MODULE(dagstore_bindings, m) {
    m.doc() = "dagstore C++ Core Bindings";

    // ── DagError ──
    static py::exception<dagstore::DagError> dag_error(m, "DagError");
    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p) std::rethrow_exception(p);
        } catch (const dagstore::DagError& e) {
            py::object instance = dag_error(e.what());
            instance.attr("kind") = dagstore::toString(e.kind());
            PyErr_SetObject(dag_error.ptr(), instance.ptr());
        }
    });

    // ── Dag ──
    py::class_<PyDag>(m, "Dag")
        .def(py::init<>())
        .def("insert_node", &PyDag::insertNode,
             py::arg("node_id"), py::arg("data") = py::none())
        .def("remove_node", [](PyDag& self, int64_t id) {
            return removedToTuple(self.removeNode(id));
        }, py::arg("node_id"))
        .def("contains_node", &PyDag::containsNode)
        .def("get_node", [](const PyDag& self, int64_t id) -> py::object {
            const py::object* data = self.getNode(id);
            return data ? *data : py::object(py::none());
        })
        .def("node_ids", &PyDag::getNodeIds)
        .def("node_count", &PyDag::nodeCount)
        .def("insert_edge", &PyDag::insertEdge,
             py::arg("source"), py::arg("target"), py::arg("data") = py::none())
        .def("remove_edge", &PyDag::removeEdge)
        .def("contains_edge", &PyDag::containsEdge)
        .def("get_edge", [](const PyDag& self, int64_t from, int64_t to) -> py::object {
            const py::object* data = self.getEdge(from, to);
            return data ? *data : py::object(py::none());
        })
        .def("edge_count", &PyDag::edgeCount)
        .def("roots", [](const PyDag& self) { return toList(self.roots()); })
        .def("leaves", [](const PyDag& self) { return toList(self.leaves()); })
        .def("children", [](const PyDag& self, int64_t id) { return toList(self.children(id)); })
        .def("parents", [](const PyDag& self, int64_t id) { return toList(self.parents(id)); })
        .def("in_degree", &PyDag::inDegree)
        .def("out_degree", &PyDag::outDegree)
        .def("extract_subgraph", &PyDag::extractSubgraph)
        .def("clone", &PyDag::clone)
        .def("clear", &PyDag::clear)
        .def("__len__", &PyDag::nodeCount);

    // ── VerificationResult ──
    py::class_<dagstore::VerificationResult>(m, "VerificationResult")
        .def(py::init<>())
        .def_readwrite("passed", &dagstore::VerificationResult::passed)
        .def_readwrite("check_name", &dagstore::VerificationResult::check_name)
        .def_readwrite("message", &dagstore::VerificationResult::message);

    m.def("check_integrity", [](const PyDag& dag) {
        dagstore::IntegrityChecker<int64_t, py::object, py::object> checker;
        return checker.check(dag);
    }, py::arg("dag"));

    m.def("set_log_level", [](const std::string& level) {
        dagstore::LogConfig config;
        config.level = spdlog::level::from_str(level);
        dagstore::configureLogging(config);
    }, py::arg("level"));
}
