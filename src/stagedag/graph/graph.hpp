/**
 * @file graph.hpp
 */
#pragma once
#include "stagedag/common/common.hpp"
#include "stagedag/graph/graph_diagnostics.hpp"
#include "stagedag/graph/graph_enums.hpp"
#include "stagedag/graph/graph_errors.hpp"
#include "stagedag/keys/key.hpp"
#include "stagedag/keys/value_expr.hpp"

namespace stagedag
{

/**
 * @brief What a configurable node contributes to evaluation and generated source.
 */
struct ConfigurableInfo
{
    /// Component name, used in labels and generated binding names.
    std::string name;

    /// Expression called with the argument and key bindings in generated source.
    std::string constructor;

    /// Keys the component is parameterized by.
    KeySet keys;

    /// Extra expressions the component needs resolved; their keys count as the node's keys.
    std::vector<AnyValue> values;
};

/**
 * @brief A directed edge from a dependent node to the node it depends on.
 */
struct Edge
{
    NodeIdx dependent;
    NodeIdx dependency;
    EdgeKind kind;
    size_t position;  ///< Argument position; 0 for functor and data-dependency edges.
    TrustLevel trust;
};

/**
 * @brief Arena of configurable components and the edges between them.
 *
 * @details
 * Nodes are added with `add_vertex()`, `add_configurable()` and `add_app()`,
 * each of which returns the new node's index. Argument children must exist
 * before the node that takes them, so argument edges alone can never form a
 * cycle; `add_data_dependency()` can link any two nodes and is where cycles
 * come from.
 *
 * @par Validation
 * With eager validation, `add_data_dependency()` rejects an edge that would
 * close a cycle. With deferred validation the edge is stored and
 * `toposort()` (and everything built on it) reports the cycle.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Concurrent reads (const methods) are safe if no concurrent writes occur.
 */
class Graph
{
public:
    explicit Graph(bool eager_validation = true);

    size_t node_count() const noexcept
    {
        return m_kinds.size();
    }

    NodeIdx add_vertex(std::string payload);

    /**
     * @brief Add a configurable taking @p ordered_args as its arguments.
     * @param extra_data_deps Nodes that must be evaluated first without being arguments.
     * @throws GraphError with `InvalidNodeIndex` for an unknown child.
     */
    NodeIdx add_configurable(ConfigurableInfo info, std::vector<NodeIdx> ordered_args,
                             std::vector<NodeIdx> extra_data_deps = {});

    /**
     * @brief Add an application of configurable @p base to @p args.
     * @throws GraphError with `InvalidNodeIndex` for an unknown node, or
     *         `InvalidAppBase` if @p base is not a configurable.
     */
    NodeIdx add_app(NodeIdx base, std::vector<NodeIdx> args);

    /**
     * @brief Require @p depends_on to be evaluated before @p node.
     * @throws GraphError with `InvalidNodeIndex` for an unknown node, or
     *         `CyclicGraph` for a self-dependency or (with eager validation)
     *         an edge that would close a cycle.
     */
    void add_data_dependency(NodeIdx node, NodeIdx depends_on);

    NodeKind kind(NodeIdx idx) const;

    /// Vertex payload, configurable name, or "app".
    const std::string& label(NodeIdx idx) const;

    /// Label and index, e.g. "http(2)", for messages.
    std::string display_name(NodeIdx idx) const;

    /**
     * @brief Component information of a configurable.
     * @return nullptr if the node is not a configurable.
     */
    const ConfigurableInfo* configurable(NodeIdx idx) const;

    /**
     * @brief The configurable an App applies.
     * @throws GraphError with `InvalidNodeIndex` if @p idx is not an App.
     */
    NodeIdx app_base(NodeIdx idx) const;

    /// Argument children in position order.
    const std::vector<NodeIdx>& arguments(NodeIdx idx) const;

    const std::vector<NodeIdx>& data_dependencies(NodeIdx idx) const;

    /// All edges in insertion order.
    const std::vector<Edge>& edges() const noexcept
    {
        return m_edges;
    }

    /**
     * @brief Keys of one node: its KeySet plus the keys its value expressions read.
     */
    KeySet node_keys(NodeIdx idx) const;

    /// Union of `node_keys()` over all nodes.
    KeySet keys() const;

    /**
     * @brief Order nodes so that every dependency comes before its dependents.
     *
     * @details
     * Kahn's algorithm: nodes that become ready are taken first-in first-out,
     * starting with ready nodes in index order and releasing dependents in
     * edge-insertion order, so unrelated nodes keep their insertion order.
     *
     * @throws GraphError with `CyclicGraph` naming the nodes on cycles.
     */
    std::vector<NodeIdx> toposort() const;

    std::shared_ptr<GraphDiagnostics> get_diagnostics() const;

private:
    void check_index(NodeIdx idx, const char* role) const;

    NodeIdx add_node(NodeKind kind, std::string label);

    void add_edge(NodeIdx dependent, NodeIdx dependency, EdgeKind kind, size_t position);

    /// Path from @p from to @p target following dependency -> dependent links.
    std::vector<NodeIdx> find_path(NodeIdx from, NodeIdx target) const;

    /// Runs Kahn's algorithm; fills @p cyclic with the nodes on cycles.
    std::vector<NodeIdx> kahn(std::vector<NodeIdx>& cyclic) const;

    std::string describe_nodes(const std::vector<NodeIdx>& nodes) const;

    bool m_eager_validation;

    // -------------------------------------------------------------------------
    // Node tracking, indexed by node index
    // -------------------------------------------------------------------------

    std::vector<NodeKind> m_kinds;
    std::vector<std::string> m_labels;
    std::vector<std::shared_ptr<const ConfigurableInfo>> m_configurables;
    std::vector<std::optional<NodeIdx>> m_app_bases;
    std::vector<std::vector<NodeIdx>> m_arguments;
    std::vector<std::vector<NodeIdx>> m_data_deps;

    // -------------------------------------------------------------------------
    // Edges
    // -------------------------------------------------------------------------

    std::vector<Edge> m_edges;

    /// Dependents of each node, for reachability checks.
    std::vector<std::vector<NodeIdx>> m_dependents;
};

} // namespace stagedag
