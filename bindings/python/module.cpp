/*
  Pybind11 module exposing BitGraph-Core C++ APIs to Python.

  Notes:
    - Node sets (Bits) are returned as sorted lists of int node ids.
    - Paths are returned as Path objects; Path.items() gives a list of ints.
    - IndexOutOfRange maps to IndexError, InvalidArgument to ValueError and
      UnsupportedFormatVersion to RuntimeError.
    - The GIL is released around path enumeration and scoring.
*/
#include <pybind11/functional.h>
#include <pybind11/operators.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "bitgraph/core/bits.hpp"
#include "bitgraph/core/error.hpp"
#include "bitgraph/core/graph.hpp"
#include "bitgraph/core/graph_builder.hpp"
#include "bitgraph/core/options.hpp"
#include "bitgraph/core/pair_set.hpp"
#include "bitgraph/core/path.hpp"
#include "bitgraph/core/scoring.hpp"
#include "bitgraph/core/types.hpp"

namespace py = pybind11;
using namespace bitgraph::core;

namespace {

// Forwards walk() callbacks to Python callables.
class PyVisitor final : public GraphVisitor {
public:
  PyVisitor(py::function enter, py::object exit) : enter_(std::move(enter)), exit_(std::move(exit)) {}
  void enter(NodeId node, int depth) override { enter_(node, depth); }
  void exit(NodeId node, int depth) override {
    if (!exit_.is_none()) exit_(node, depth);
  }

private:
  py::function enter_;
  py::object exit_;
};

Bits as_bits(const Graph& g, const std::vector<NodeId>& ids) {
  return bits_of(static_cast<std::size_t>(g.num_nodes()), ids);
}

std::vector<Bits> as_edge_sets(const std::vector<std::vector<NodeId>>& lists) {
  const auto n = lists.size();
  std::vector<Bits> sets;
  sets.reserve(n);
  for (const auto& ids : lists) {
    Bits b(n);
    for (auto id : ids) {
      if (id < 0) throw py::index_error("node id must be >= 0");
      if (static_cast<std::size_t>(id) >= b.size()) b.resize(static_cast<std::size_t>(id) + 1);
      b.set(static_cast<std::size_t>(id));
    }
    sets.push_back(std::move(b));
  }
  return sets;
}

} // namespace

PYBIND11_MODULE(_bitgraph_core, m) {
  m.doc() = "BitGraph-Core C++ bindings";

  py::register_exception_translator([](std::exception_ptr p) {
    try {
      if (p) std::rethrow_exception(p);
    } catch (const IndexOutOfRange& e) {
      PyErr_SetString(PyExc_IndexError, e.what());
    } catch (const InvalidArgument& e) {
      PyErr_SetString(PyExc_ValueError, e.what());
    } catch (const UnsupportedFormatVersion& e) {
      PyErr_SetString(PyExc_RuntimeError, e.what());
    }
  });

  py::enum_<Direction>(m, "Direction")
      .value("DOWN", Direction::Down)
      .value("UP", Direction::Up);

  py::class_<EigenvectorCentralityOptions>(m, "EigenvectorCentralityOptions")
      .def(py::init<>())
      .def(py::init([](int max_iterations, double min_difference, bool use_in_edges,
                       bool ignore_self_edges, bool normalize) {
        EigenvectorCentralityOptions o;
        o.max_iterations = max_iterations; o.min_difference = min_difference;
        o.use_in_edges = use_in_edges; o.ignore_self_edges = ignore_self_edges; o.normalize = normalize;
        return o;
      }),
        py::kw_only(),
        py::arg("max_iterations") = 400,
        py::arg("min_difference") = 0.000001,
        py::arg("use_in_edges") = false,
        py::arg("ignore_self_edges") = true,
        py::arg("normalize") = true)
      .def_readwrite("max_iterations", &EigenvectorCentralityOptions::max_iterations)
      .def_readwrite("min_difference", &EigenvectorCentralityOptions::min_difference)
      .def_readwrite("use_in_edges", &EigenvectorCentralityOptions::use_in_edges)
      .def_readwrite("ignore_self_edges", &EigenvectorCentralityOptions::ignore_self_edges)
      .def_readwrite("normalize", &EigenvectorCentralityOptions::normalize);

  py::class_<PageRankOptions>(m, "PageRankOptions")
      .def(py::init<>())
      .def(py::init([](double min_difference, double damping_factor, int max_iterations, bool normalize) {
        PageRankOptions o;
        o.min_difference = min_difference; o.damping_factor = damping_factor;
        o.max_iterations = max_iterations; o.normalize = normalize;
        return o;
      }),
        py::kw_only(),
        py::arg("min_difference") = 0.0000000000000004,
        py::arg("damping_factor") = 0.85,
        py::arg("max_iterations") = 1000,
        py::arg("normalize") = true)
      .def_readwrite("min_difference", &PageRankOptions::min_difference)
      .def_readwrite("damping_factor", &PageRankOptions::damping_factor)
      .def_readwrite("max_iterations", &PageRankOptions::max_iterations)
      .def_readwrite("normalize", &PageRankOptions::normalize);

  py::class_<Path>(m, "Path")
      .def(py::init<>())
      .def(py::init([](const std::vector<NodeId>& nodes) { return Path(nodes); }), py::arg("nodes"))
      .def("add", &Path::add, py::arg("node"), py::return_value_policy::reference_internal)
      .def("append", &Path::append, py::arg("other"), py::return_value_policy::reference_internal)
      .def("replace", &Path::replace, py::arg("index"), py::arg("other"),
           py::return_value_policy::reference_internal)
      .def("reversed", &Path::reversed)
      .def("parent_path", &Path::parent_path)
      .def("child_path", &Path::child_path)
      .def("contains_path", [](const Path& p, const Path& other) { return p.contains(other); }, py::arg("other"))
      .def("__contains__", [](const Path& p, NodeId node) { return p.contains(node); })
      .def("index_of", &Path::index_of)
      .def("start", &Path::start)
      .def("end", &Path::end)
      .def("__getitem__", &Path::get)
      .def("__len__", &Path::size)
      .def("items", [](const Path& p) {
        auto s = p.items();
        return std::vector<NodeId>(s.begin(), s.end());
      })
      .def("__str__", &Path::to_string)
      .def("__repr__", [](const Path& p) { return "Path(" + p.to_string() + ")"; })
      .def(py::self == py::self)
      .def("__lt__", [](const Path& a, const Path& b) { return a < b; });

  py::class_<PairSet>(m, "PairSet")
      .def(py::init<std::int32_t>(), py::arg("size"))
      .def("add", &PairSet::add, py::return_value_policy::reference_internal)
      .def("remove", &PairSet::remove, py::return_value_policy::reference_internal)
      .def("contains", &PairSet::contains)
      .def("size", &PairSet::size)
      .def("pair_count", &PairSet::pair_count)
      .def("empty", &PairSet::empty)
      .def("inverse", &PairSet::inverse)
      .def("retain_all", &PairSet::retain_all)
      .def("removing_all", &PairSet::removing_all)
      .def("intersects", &PairSet::intersects)
      .def("pairs", &PairSet::pairs)
      .def("to_graph", &PairSet::to_graph)
      .def("__str__", &PairSet::to_string)
      .def(py::self == py::self);

  py::class_<Graph>(m, "Graph")
      .def_static("from_edges",
          [](const std::vector<std::vector<NodeId>>& outbound) {
            return Graph::from_edges(as_edge_sets(outbound));
          },
          py::arg("outbound"))
      .def_static("from_edge_pairs",
          [](const std::vector<std::vector<NodeId>>& outbound,
             const std::vector<std::vector<NodeId>>& inbound) {
            return Graph::from_edge_pairs(as_edge_sets(outbound), as_edge_sets(inbound));
          },
          py::arg("outbound"), py::arg("inbound"))
      .def_static("from_bytes", [](const py::bytes& data) {
        std::string s = data;
        std::vector<std::uint8_t> buf(s.begin(), s.end());
        return Graph::from_bytes(buf);
      })
      .def("to_bytes", [](const Graph& g) {
        auto buf = g.to_bytes();
        return py::bytes(reinterpret_cast<const char*>(buf.data()), buf.size());
      })
      .def("num_nodes", &Graph::num_nodes)
      .def("total_cardinality", &Graph::total_cardinality)
      .def("contains_edge", &Graph::contains_edge)
      .def("has_outbound_edge", &Graph::has_outbound_edge)
      .def("has_inbound_edge", &Graph::has_inbound_edge)
      .def("children", [](const Graph& g, NodeId n) { return bits_to_vector(g.children(n)); })
      .def("parents", [](const Graph& g, NodeId n) { return bits_to_vector(g.parents(n)); })
      .def("neighbors", [](const Graph& g, NodeId n) { return bits_to_vector(g.neighbors(n)); })
      .def("edge_list", &Graph::edge_list)
      .def("top_level_or_orphan_nodes", [](const Graph& g) { return bits_to_vector(g.top_level_or_orphan_nodes()); })
      .def("bottom_level_nodes", [](const Graph& g) { return bits_to_vector(g.bottom_level_nodes()); })
      .def("connectors", [](const Graph& g) { return bits_to_vector(g.connectors()); })
      .def("orphans", [](const Graph& g) { return bits_to_vector(g.orphans()); })
      .def("walk",
          [](const Graph& g, py::function enter, py::object exit, std::optional<NodeId> start) {
            PyVisitor v(std::move(enter), std::move(exit));
            if (start) g.walk(*start, v); else g.walk(v);
          },
          py::arg("enter"), py::arg("exit") = py::none(), py::arg("start") = py::none())
      .def("walk_upwards",
          [](const Graph& g, py::function enter, py::object exit, std::optional<NodeId> start) {
            PyVisitor v(std::move(enter), std::move(exit));
            if (start) g.walk_upwards(*start, v); else g.walk_upwards(v);
          },
          py::arg("enter"), py::arg("exit") = py::none(), py::arg("start") = py::none())
      .def("depth_first_search", &Graph::depth_first_search,
           py::arg("start"), py::arg("direction"), py::arg("consumer"))
      .def("breadth_first_search", &Graph::breadth_first_search,
           py::arg("start"), py::arg("direction"), py::arg("consumer"))
      .def("abortable_depth_first_search", &Graph::abortable_depth_first_search,
           py::arg("start"), py::arg("direction"), py::arg("predicate"))
      .def("abortable_breadth_first_search", &Graph::abortable_breadth_first_search,
           py::arg("start"), py::arg("direction"), py::arg("predicate"))
      .def("closure_of", [](const Graph& g, NodeId n) { return bits_to_vector(g.closure_of(n)); })
      .def("reverse_closure_of", [](const Graph& g, NodeId n) { return bits_to_vector(g.reverse_closure_of(n)); })
      .def("closure_union", [](const Graph& g, const std::vector<NodeId>& nodes) {
        return bits_to_vector(g.closure_union(std::span<const NodeId>(nodes)));
      })
      .def("closure_disjunction", [](const Graph& g, const std::vector<NodeId>& nodes) {
        return bits_to_vector(g.closure_disjunction(std::span<const NodeId>(nodes)));
      })
      .def("is_reachable_from", &Graph::is_reachable_from)
      .def("is_recursive", &Graph::is_recursive)
      .def("is_indirectly_recursive", &Graph::is_indirectly_recursive)
      .def("disjoint_nodes", [](const Graph& g) { return bits_to_vector(g.disjoint_nodes()); })
      .def("by_closure_size", &Graph::by_closure_size)
      .def("topological_sort", [](const Graph& g, const std::vector<NodeId>& subset) {
        return g.topological_sort(as_bits(g, subset));
      })
      .def("paths_between", [](const Graph& g, NodeId src, NodeId dst) {
        py::gil_scoped_release release;
        return g.paths_between(src, dst);
      })
      .def("undirected_paths_between", [](const Graph& g, NodeId src, NodeId dst) {
        py::gil_scoped_release release;
        return g.undirected_paths_between(src, dst);
      })
      .def("shortest_path_between", &Graph::shortest_path_between)
      .def("distance", &Graph::distance)
      .def("omitting", [](const Graph& g, const std::vector<NodeId>& nodes) {
        return g.omitting(nodes);
      })
      .def("diff", [](const Graph& g, const Graph& other) {
        std::pair<Graph, Graph> out;
        g.diff(other, [&](const Graph& added, const Graph& removed) { out = {added, removed}; });
        return out;
      })
      .def("to_pair_set", &Graph::to_pair_set)
      .def("eigenvector_centrality", [](const Graph& g, const EigenvectorCentralityOptions& opts) {
        py::gil_scoped_release release;
        return eigenvector_centrality(g, opts);
      }, py::arg("options") = EigenvectorCentralityOptions{})
      .def("page_rank", [](const Graph& g, const PageRankOptions& opts) {
        py::gil_scoped_release release;
        return page_rank(g, opts);
      }, py::arg("options") = PageRankOptions{})
      .def("__str__", &Graph::to_string)
      .def(py::self == py::self);

  py::class_<GraphBuilder>(m, "GraphBuilder")
      .def(py::init<>())
      .def(py::init<std::int32_t>(), py::arg("expected_size"))
      .def("add_edge", &GraphBuilder::add_edge, py::return_value_policy::reference_internal)
      .def("add_orphan", &GraphBuilder::add_orphan, py::return_value_policy::reference_internal)
      .def("build", &GraphBuilder::build);
}
