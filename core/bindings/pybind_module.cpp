// PyBind11 bindings for the weave C++ core.
// Exposes the session graph, its engines and persistence to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>

#include "compression/compression_engine.hpp"
#include "compression/error_suppression.hpp"
#include "config/config.hpp"
#include "graph/edge.hpp"
#include "graph/errors.hpp"
#include "graph/graph_snapshot.hpp"
#include "graph/graph_store.hpp"
#include "graph/node.hpp"
#include "log/log.hpp"
#include "persistence/persistence_manager.hpp"
#include "persistence/provider_registry.hpp"
#include "plasticity/hebbian_weights.hpp"
#include "synapse/synaptic_linker.hpp"

namespace py = pybind11;

// Metadata crosses the boundary as a JSON string.
template <typename T>
void defMetadata(py::class_<T>& cls) {
    cls.def_property("metadata_json",
        [](const T& self) { return self.metadata.dump(); },
        [](T& self, const std::string& text) {
            weave::Metadata parsed = weave::Metadata::parse(text);
            if (!parsed.is_object()) throw weave::WeaveError("metadata must be a JSON object");
            self.metadata = std::move(parsed);
        });
}

PYBIND11_MODULE(weave_bindings, m) {
    m.doc() = "weave session knowledge graph";

    py::register_exception<weave::WeaveError>(m, "WeaveError", PyExc_RuntimeError);

    m.def("set_log_level", &weave::log::setLevel);

    // ── Enums ──
    py::enum_<weave::NodeType>(m, "NodeType")
        .value("CONCEPT", weave::NodeType::Concept)
        .value("DECISION", weave::NodeType::Decision)
        .value("MILESTONE", weave::NodeType::Milestone)
        .value("ERROR", weave::NodeType::Error)
        .value("CORRECTION", weave::NodeType::Correction)
        .value("CODE_ENTITY", weave::NodeType::CodeEntity);

    py::enum_<weave::EdgeType>(m, "EdgeType")
        .value("RELATES", weave::EdgeType::Relates)
        .value("CAUSES", weave::EdgeType::Causes)
        .value("CORRECTS", weave::EdgeType::Corrects)
        .value("IMPLEMENTS", weave::EdgeType::Implements)
        .value("DEPENDS_ON", weave::EdgeType::DependsOn)
        .value("BLOCKS", weave::EdgeType::Blocks);

    // ── Node ──
    py::class_<weave::Node> node(m, "Node");
    node.def(py::init<>())
        .def_readwrite("id", &weave::Node::id)
        .def_readwrite("type", &weave::Node::type)
        .def_readwrite("label", &weave::Node::label)
        .def_readwrite("description", &weave::Node::description)
        .def_readwrite("frequency", &weave::Node::frequency)
        .def_readwrite("created_at", &weave::Node::created_at)
        .def_readwrite("updated_at", &weave::Node::updated_at);
    defMetadata(node);

    m.def("make_node",
          [](weave::NodeType type, std::string label, std::optional<std::string> description) {
              return weave::makeNode(type, std::move(label), std::move(description));
          },
          py::arg("type"), py::arg("label"), py::arg("description") = py::none());

    // ── Edge ──
    py::class_<weave::Edge> edge(m, "Edge");
    edge.def(py::init<>())
        .def_readwrite("id", &weave::Edge::id)
        .def_readwrite("source_id", &weave::Edge::source_id)
        .def_readwrite("target_id", &weave::Edge::target_id)
        .def_readwrite("type", &weave::Edge::type)
        .def_readwrite("weight", &weave::Edge::weight)
        .def_readwrite("created_at", &weave::Edge::created_at)
        .def_readwrite("updated_at", &weave::Edge::updated_at);
    defMetadata(edge);

    m.def("make_edge",
          [](std::string source, std::string target, weave::EdgeType type, double weight) {
              return weave::makeEdge(std::move(source), std::move(target), type, weight);
          },
          py::arg("source_id"), py::arg("target_id"), py::arg("type"), py::arg("weight") = 1.0);

    // ── Configs ──
    py::class_<weave::LinkerConfig>(m, "LinkerConfig")
        .def(py::init<>())
        .def_readwrite("threshold", &weave::LinkerConfig::threshold)
        .def_readwrite("max_connections", &weave::LinkerConfig::max_connections)
        .def_readwrite("embed_workers", &weave::LinkerConfig::embed_workers);

    py::class_<weave::HebbianConfig>(m, "HebbianConfig")
        .def(py::init<>())
        .def_readwrite("strength", &weave::HebbianConfig::strength)
        .def_readwrite("decay_rate", &weave::HebbianConfig::decay_rate)
        .def_readwrite("prune_threshold", &weave::HebbianConfig::prune_threshold)
        .def_readwrite("max_weight", &weave::HebbianConfig::max_weight);

    py::class_<weave::CompressionConfig>(m, "CompressionConfig")
        .def(py::init<>())
        .def_readwrite("max_context_bytes", &weave::CompressionConfig::max_context_bytes)
        .def_readwrite("threshold", &weave::CompressionConfig::threshold)
        .def_readwrite("target_reduction", &weave::CompressionConfig::target_reduction);

    py::class_<weave::PersistenceConfig>(m, "PersistenceConfig")
        .def(py::init<>())
        .def_readwrite("provider", &weave::PersistenceConfig::provider)
        .def_readwrite("data_dir", &weave::PersistenceConfig::data_dir)
        .def_readwrite("sqlite_file", &weave::PersistenceConfig::sqlite_file);

    py::class_<weave::WeaveConfig>(m, "WeaveConfig")
        .def(py::init<>())
        .def_readwrite("linker", &weave::WeaveConfig::linker)
        .def_readwrite("hebbian", &weave::WeaveConfig::hebbian)
        .def_readwrite("compression", &weave::WeaveConfig::compression)
        .def_readwrite("persistence", &weave::WeaveConfig::persistence)
        .def_readwrite("log_level", &weave::WeaveConfig::log_level);

    m.def("configure", &weave::configure, py::arg("config_path") = "");

    // ── Engines ──
    py::class_<weave::SynapticLinker, std::shared_ptr<weave::SynapticLinker>>(m, "SynapticLinker")
        .def(py::init([](const weave::LinkerConfig& config) {
                 return std::make_shared<weave::SynapticLinker>(config);
             }),
             py::arg("config") = weave::LinkerConfig{})
        .def("link_retroactively", [](const weave::SynapticLinker& self, const weave::Node& n,
                                      weave::GraphStore& graph) {
            return self.linkRetroactively(n, graph);
        });

    py::class_<weave::HebbianWeights, std::shared_ptr<weave::HebbianWeights>>(m, "HebbianWeights")
        .def(py::init([](const weave::HebbianConfig& config) {
                 return std::make_shared<weave::HebbianWeights>(config);
             }),
             py::arg("config") = weave::HebbianConfig{})
        .def("decay", [](const weave::HebbianWeights& self, weave::GraphStore& graph) {
            return self.decay(graph);
        })
        .def("prune", [](const weave::HebbianWeights& self, weave::GraphStore& graph,
                         std::optional<double> min_weight) {
            return self.prune(graph, min_weight);
        }, py::arg("graph"), py::arg("min_weight") = py::none());

    py::class_<weave::CompressionEngine>(m, "CompressionEngine")
        .def(py::init<weave::CompressionConfig>(), py::arg("config") = weave::CompressionConfig{})
        .def("is_archived", &weave::CompressionEngine::isArchived)
        .def("archived_node_count", [](const weave::CompressionEngine& self) {
            return self.getArchiveStats().archived_node_count;
        })
        .def("clear_archives", &weave::CompressionEngine::clearArchives);

    py::class_<weave::Correction>(m, "Correction")
        .def_readonly("correction_node", &weave::Correction::correction_node)
        .def_readonly("correction_edge", &weave::Correction::correction_edge);

    // ── GraphStore ──
    py::class_<weave::GraphStore>(m, "GraphStore")
        .def(py::init<std::string, double>(),
             py::arg("chat_id"), py::arg("compression_threshold") = 0.75)
        .def(py::init<std::string, const weave::CompressionConfig&>(),
             py::arg("chat_id"), py::arg("compression"))
        .def("add_node", &weave::GraphStore::addNode)
        .def("get_node", &weave::GraphStore::getNode, py::return_value_policy::reference_internal)
        .def("delete_node", &weave::GraphStore::deleteNode)
        .def("increment_frequency", &weave::GraphStore::incrementFrequency)
        .def("node_count", &weave::GraphStore::nodeCount)
        .def("add_edge", &weave::GraphStore::addEdge)
        .def("get_edge", &weave::GraphStore::getEdge, py::return_value_policy::reference_internal)
        .def("delete_edge", &weave::GraphStore::deleteEdge)
        .def("reinforce_edge", &weave::GraphStore::reinforceEdge,
             py::arg("edge_id"), py::arg("factor") = 1.1)
        .def("edge_count", &weave::GraphStore::edgeCount)
        .def("edges_from", &weave::GraphStore::edgesFrom)
        .def("edges_to", &weave::GraphStore::edgesTo)
        .def("query_by_label", &weave::GraphStore::queryByLabel)
        .def("query_by_type", &weave::GraphStore::queryByType)
        .def("all_nodes", &weave::GraphStore::allNodes)
        .def("all_edges", &weave::GraphStore::allEdges)
        .def("set_synaptic_linker", &weave::GraphStore::setSynapticLinker)
        .def("set_hebbian_weights", &weave::GraphStore::setHebbianWeights)
        .def("context_window_usage",
             py::overload_cast<>(&weave::GraphStore::contextWindowUsage, py::const_))
        .def("context_window_usage",
             py::overload_cast<const weave::CompressionEngine&>(
                 &weave::GraphStore::contextWindowUsage, py::const_))
        .def("should_compress",
             py::overload_cast<>(&weave::GraphStore::shouldCompress, py::const_))
        .def("should_compress",
             py::overload_cast<const weave::CompressionEngine&>(
                 &weave::GraphStore::shouldCompress, py::const_))
        .def("compress",
             py::overload_cast<weave::CompressionEngine&, double>(&weave::GraphStore::compress))
        .def("compress",
             py::overload_cast<weave::CompressionEngine&>(&weave::GraphStore::compress))
        .def("restore_archived", &weave::GraphStore::restoreArchived)
        .def("suppress_error", &weave::GraphStore::suppressError,
             py::arg("error_id"), py::arg("label"), py::arg("description") = py::none())
        .def("uncorrected_errors", &weave::GraphStore::uncorrectedErrors)
        .def("to_json", [](const weave::GraphStore& self) {
            return weave::snapshotToJson(self.snapshot()).dump();
        })
        .def_static("from_json", [](const std::string& text) {
            return weave::GraphStore::restore(
                weave::snapshotFromJson(nlohmann::json::parse(text)));
        })
        .def_property_readonly("chat_id", &weave::GraphStore::chatId);

    // ── Persistence ──
    py::class_<weave::Provider, std::shared_ptr<weave::Provider>>(m, "Provider")
        .def("name", &weave::Provider::name)
        .def("list", &weave::Provider::list, py::arg("prefix") = "")
        .def("close", &weave::Provider::close);

    m.def("open_provider", [](const std::string& name, const std::string& data_dir) {
        weave::PersistenceConfig config;
        config.provider = name;
        config.data_dir = data_dir;
        return std::shared_ptr<weave::Provider>(weave::ProviderRegistry().resolve(config));
    }, py::arg("name") = "", py::arg("data_dir") = "./weave-data");

    py::class_<weave::SessionInfo>(m, "SessionInfo")
        .def_readonly("chat_id", &weave::SessionInfo::chat_id)
        .def_readonly("created_at", &weave::SessionInfo::created_at)
        .def_readonly("updated_at", &weave::SessionInfo::updated_at)
        .def_readonly("node_count", &weave::SessionInfo::node_count)
        .def_readonly("edge_count", &weave::SessionInfo::edge_count);

    py::class_<weave::PersistenceManager>(m, "PersistenceManager")
        .def(py::init<std::shared_ptr<weave::Provider>>())
        .def("save_graph", &weave::PersistenceManager::saveGraph)
        .def("load_graph", &weave::PersistenceManager::loadGraph)
        .def("load_or_create_graph", &weave::PersistenceManager::loadOrCreateGraph,
             py::arg("chat_id"), py::arg("compression_threshold") = 0.75)
        .def("graph_exists", &weave::PersistenceManager::graphExists)
        .def("delete_graph", &weave::PersistenceManager::deleteGraph)
        .def("list_sessions", &weave::PersistenceManager::listSessions);
}
