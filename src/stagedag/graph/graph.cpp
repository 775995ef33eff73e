/**
 * @file graph.cpp
 */
#include "stagedag/graph/graph.hpp"
#include "stagedag/common/log.hpp"
#include "stagedag/keys/value_eval.hpp"

#include <algorithm>
#include <queue>

namespace stagedag
{

const char* node_kind_name(NodeKind kind) noexcept
{
    switch (kind)
    {
    case NodeKind::Vertex:
        return "vertex";
    case NodeKind::Configurable:
        return "configurable";
    case NodeKind::App:
        return "app";
    }
    return "???";
}

const char* edge_kind_name(EdgeKind kind) noexcept
{
    switch (kind)
    {
    case EdgeKind::Functor:
        return "functor";
    case EdgeKind::Argument:
        return "argument";
    case EdgeKind::DataDependency:
        return "data dependency";
    }
    return "???";
}

// ============================================================================
// Constructor
// ============================================================================

Graph::Graph(bool eager_validation)
    : m_eager_validation(eager_validation)
{
}

// ============================================================================
// Node management
// ============================================================================

void Graph::check_index(NodeIdx idx, const char* role) const
{
    if (idx >= node_count())
    {
        throw GraphError(
            GraphErrorCode::InvalidNodeIndex,
            std::string{role} + " node index " + std::to_string(idx) + " does not exist");
    }
}

NodeIdx Graph::add_node(NodeKind kind, std::string label)
{
    NodeIdx idx = node_count();
    m_kinds.push_back(kind);
    m_labels.push_back(std::move(label));
    m_configurables.emplace_back();
    m_app_bases.emplace_back();
    m_arguments.emplace_back();
    m_data_deps.emplace_back();
    m_dependents.emplace_back();
    return idx;
}

void Graph::add_edge(NodeIdx dependent, NodeIdx dependency, EdgeKind kind, size_t position)
{
    TrustLevel trust = kind == EdgeKind::DataDependency ? TrustLevel::Low : TrustLevel::High;
    m_edges.push_back(Edge{dependent, dependency, kind, position, trust});
    m_dependents[dependency].push_back(dependent);
}

NodeIdx Graph::add_vertex(std::string payload)
{
    NodeIdx idx = add_node(NodeKind::Vertex, std::move(payload));
    STAGEDAG_LOG_DEBUG("graph", "Added vertex " << display_name(idx));
    return idx;
}

NodeIdx Graph::add_configurable(ConfigurableInfo info, std::vector<NodeIdx> ordered_args,
                                std::vector<NodeIdx> extra_data_deps)
{
    for (NodeIdx arg : ordered_args)
    {
        check_index(arg, "Argument");
    }
    for (NodeIdx dep : extra_data_deps)
    {
        check_index(dep, "Data dependency");
    }

    NodeIdx idx = add_node(NodeKind::Configurable, info.name);
    m_configurables[idx] = std::make_shared<const ConfigurableInfo>(std::move(info));
    for (size_t pos = 0; pos < ordered_args.size(); ++pos)
    {
        add_edge(idx, ordered_args[pos], EdgeKind::Argument, pos);
    }
    for (NodeIdx dep : extra_data_deps)
    {
        add_edge(idx, dep, EdgeKind::DataDependency, 0);
    }
    m_arguments[idx] = std::move(ordered_args);
    m_data_deps[idx] = std::move(extra_data_deps);

    STAGEDAG_LOG_DEBUG("graph", "Added configurable " << display_name(idx) << " with "
                                    << m_arguments[idx].size() << " argument(s)");
    return idx;
}

NodeIdx Graph::add_app(NodeIdx base, std::vector<NodeIdx> args)
{
    check_index(base, "App base");
    if (m_kinds[base] != NodeKind::Configurable)
    {
        throw GraphError(
            GraphErrorCode::InvalidAppBase,
            "App base " + display_name(base) + " is a " + node_kind_name(m_kinds[base]) +
                ", not a configurable",
            {base});
    }
    for (NodeIdx arg : args)
    {
        check_index(arg, "Argument");
    }

    NodeIdx idx = add_node(NodeKind::App, "app");
    m_app_bases[idx] = base;
    add_edge(idx, base, EdgeKind::Functor, 0);
    for (size_t pos = 0; pos < args.size(); ++pos)
    {
        add_edge(idx, args[pos], EdgeKind::Argument, pos);
    }
    m_arguments[idx] = std::move(args);

    STAGEDAG_LOG_DEBUG("graph", "Added app " << idx << " over " << display_name(base));
    return idx;
}

void Graph::add_data_dependency(NodeIdx node, NodeIdx depends_on)
{
    check_index(node, "Dependent");
    check_index(depends_on, "Dependency");

    if (node == depends_on)
    {
        throw GraphError(
            GraphErrorCode::CyclicGraph,
            "Node " + display_name(node) + " cannot depend on itself", {node});
    }

    // A cycle would exist if depends_on already (transitively) depends on node
    if (m_eager_validation)
    {
        std::vector<NodeIdx> path = find_path(node, depends_on);
        if (!path.empty())
        {
            std::sort(path.begin(), path.end());
            STAGEDAG_LOG_ERROR("graph", "Rejected data dependency " << display_name(node)
                                            << " -> " << display_name(depends_on));
            std::string message = "Adding dependency " + display_name(node) + " -> " +
                                  display_name(depends_on) +
                                  " would create a cycle among nodes: " + describe_nodes(path);
            throw GraphError(GraphErrorCode::CyclicGraph, message, std::move(path));
        }
    }

    add_edge(node, depends_on, EdgeKind::DataDependency, 0);
    m_data_deps[node].push_back(depends_on);
}

// ============================================================================
// Queries
// ============================================================================

NodeKind Graph::kind(NodeIdx idx) const
{
    check_index(idx, "Queried");
    return m_kinds[idx];
}

const std::string& Graph::label(NodeIdx idx) const
{
    check_index(idx, "Queried");
    return m_labels[idx];
}

std::string Graph::display_name(NodeIdx idx) const
{
    return label(idx) + "(" + std::to_string(idx) + ")";
}

const ConfigurableInfo* Graph::configurable(NodeIdx idx) const
{
    check_index(idx, "Queried");
    return m_configurables[idx].get();
}

NodeIdx Graph::app_base(NodeIdx idx) const
{
    check_index(idx, "Queried");
    if (!m_app_bases[idx])
    {
        throw GraphError(
            GraphErrorCode::InvalidNodeIndex,
            "Node " + display_name(idx) + " is not an app", {idx});
    }
    return *m_app_bases[idx];
}

const std::vector<NodeIdx>& Graph::arguments(NodeIdx idx) const
{
    check_index(idx, "Queried");
    return m_arguments[idx];
}

const std::vector<NodeIdx>& Graph::data_dependencies(NodeIdx idx) const
{
    check_index(idx, "Queried");
    return m_data_deps[idx];
}

KeySet Graph::node_keys(NodeIdx idx) const
{
    const ConfigurableInfo* info = configurable(idx);
    if (info == nullptr)
    {
        return {};
    }
    KeySet result = info->keys;
    for (const auto& v : info->values)
    {
        const KeySet& value_deps = deps(v);
        result.insert(value_deps.begin(), value_deps.end());
    }
    return result;
}

KeySet Graph::keys() const
{
    KeySet result;
    for (NodeIdx idx = 0; idx < node_count(); ++idx)
    {
        KeySet node_result = node_keys(idx);
        result.insert(node_result.begin(), node_result.end());
    }
    return result;
}

std::string Graph::describe_nodes(const std::vector<NodeIdx>& nodes) const
{
    std::string out;
    for (size_t i = 0; i < nodes.size(); ++i)
    {
        if (i > 0)
        {
            out += ", ";
        }
        out += display_name(nodes[i]);
    }
    return out;
}

// ============================================================================
// Ordering and cycle detection
// ============================================================================

std::vector<NodeIdx> Graph::find_path(NodeIdx from, NodeIdx target) const
{
    // Breadth-first search with parent links so the path can be reported
    std::vector<bool> visited(node_count(), false);
    std::vector<NodeIdx> parent(node_count(), node_count());
    std::queue<NodeIdx> frontier;
    frontier.push(from);
    visited[from] = true;

    while (!frontier.empty())
    {
        NodeIdx current = frontier.front();
        frontier.pop();
        if (current == target)
        {
            std::vector<NodeIdx> path;
            for (NodeIdx n = target; n != from; n = parent[n])
            {
                path.push_back(n);
            }
            path.push_back(from);
            std::reverse(path.begin(), path.end());
            return path;
        }
        for (NodeIdx next : m_dependents[current])
        {
            if (!visited[next])
            {
                visited[next] = true;
                parent[next] = current;
                frontier.push(next);
            }
        }
    }
    return {};
}

std::vector<NodeIdx> Graph::kahn(std::vector<NodeIdx>& cyclic) const
{
    const size_t n = node_count();
    std::vector<size_t> in_degree(n, 0);
    std::vector<std::vector<NodeIdx>> successors(n);

    for (const auto& edge : m_edges)
    {
        successors[edge.dependency].push_back(edge.dependent);
        ++in_degree[edge.dependent];
    }

    std::queue<NodeIdx> ready;
    for (NodeIdx idx = 0; idx < n; ++idx)
    {
        if (in_degree[idx] == 0)
        {
            ready.push(idx);
        }
    }

    std::vector<NodeIdx> order;
    order.reserve(n);
    while (!ready.empty())
    {
        NodeIdx idx = ready.front();
        ready.pop();
        order.push_back(idx);

        for (NodeIdx succ : successors[idx])
        {
            --in_degree[succ];
            if (in_degree[succ] == 0)
            {
                ready.push(succ);
            }
        }
    }

    cyclic.clear();
    if (order.size() == n)
    {
        return order;
    }

    // Nodes left with in-degree > 0 are on a cycle or downstream of one.
    // Keep only those that can reach themselves again.
    for (NodeIdx start = 0; start < n; ++start)
    {
        if (in_degree[start] == 0)
        {
            continue;
        }
        std::vector<bool> visited(n, false);
        std::vector<NodeIdx> stack(successors[start].begin(), successors[start].end());
        bool on_cycle = false;
        while (!stack.empty() && !on_cycle)
        {
            NodeIdx current = stack.back();
            stack.pop_back();
            if (current == start)
            {
                on_cycle = true;
                break;
            }
            if (visited[current] || in_degree[current] == 0)
            {
                continue;
            }
            visited[current] = true;
            for (NodeIdx succ : successors[current])
            {
                stack.push_back(succ);
            }
        }
        if (on_cycle)
        {
            cyclic.push_back(start);
        }
    }
    return order;
}

std::vector<NodeIdx> Graph::toposort() const
{
    std::vector<NodeIdx> cyclic;
    std::vector<NodeIdx> order = kahn(cyclic);
    if (!cyclic.empty())
    {
        std::string message = "Cycle detected among nodes: " + describe_nodes(cyclic);
        STAGEDAG_LOG_ERROR("graph", message);
        throw GraphError(GraphErrorCode::CyclicGraph, message, std::move(cyclic));
    }
    return order;
}

// ============================================================================
// Diagnostics
// ============================================================================

std::shared_ptr<GraphDiagnostics> Graph::get_diagnostics() const
{
    auto diagnostics = std::make_shared<GraphDiagnostics>();

    std::vector<NodeIdx> cyclic;
    std::vector<NodeIdx> order = kahn(cyclic);

    if (!cyclic.empty())
    {
        DiagnosticItem item;
        item.severity = DiagnosticSeverity::Error;
        item.category = DiagnosticCategory::Cycle;
        item.message = "Cycle detected among nodes: " + describe_nodes(cyclic);
        item.involved_nodes = cyclic;

        // Blame edges with both endpoints on a cycle, lower trust first
        std::vector<bool> on_cycle(node_count(), false);
        for (NodeIdx idx : cyclic)
        {
            on_cycle[idx] = true;
        }
        std::vector<std::pair<size_t, TrustLevel>> blamed_with_trust;
        for (size_t i = 0; i < m_edges.size(); ++i)
        {
            const Edge& edge = m_edges[i];
            if (on_cycle[edge.dependent] && on_cycle[edge.dependency])
            {
                blamed_with_trust.emplace_back(i, edge.trust);
            }
        }
        std::stable_sort(blamed_with_trust.begin(), blamed_with_trust.end(),
                         [](const auto& a, const auto& b) {
                             return static_cast<int>(a.second) < static_cast<int>(b.second);
                         });
        for (const auto& blamed : blamed_with_trust)
        {
            item.blamed_edges.push_back(blamed.first);
        }
        diagnostics->m_errors.push_back(std::move(item));
        return diagnostics;
    }

    if (order.empty())
    {
        return diagnostics;
    }

    // The last node in order is the one generated source returns
    NodeIdx final_node = order.back();
    for (NodeIdx idx : order)
    {
        if (idx != final_node && m_dependents[idx].empty())
        {
            DiagnosticItem item;
            item.severity = DiagnosticSeverity::Warning;
            item.category = DiagnosticCategory::UnusedNode;
            item.message = "Node " + display_name(idx) + " is not used by any other node";
            item.involved_nodes.push_back(idx);
            diagnostics->m_warnings.push_back(std::move(item));
        }
    }
    return diagnostics;
}

} // namespace stagedag
