/**
 * @file source_generator.cpp
 */
#include "stagedag/graph/source_generator.hpp"
#include "stagedag/common/log.hpp"
#include "stagedag/keys/descriptor.hpp"
#include "stagedag/keys/key_emit.hpp"

namespace stagedag
{

namespace
{

std::string key_binding(const AnyKey& key)
{
    return "key_" + to_identifier(key.name());
}

std::string node_binding(const Graph& graph, NodeIdx idx)
{
    switch (graph.kind(idx))
    {
    case NodeKind::Vertex:
        return "vertex_" + std::to_string(idx);
    case NodeKind::Configurable:
        return "node_" + to_identifier(graph.label(idx)) + "_" + std::to_string(idx);
    case NodeKind::App:
        return "app_" + std::to_string(idx);
    }
    throw GraphError(GraphErrorCode::InvariantViolation,
                     "Node " + std::to_string(idx) + " has an unknown kind", {idx});
}

void write_call(std::ostream& os, const std::string& callee,
                const std::vector<std::string>& args)
{
    os << callee << "(";
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (i > 0)
        {
            os << ", ";
        }
        os << args[i];
    }
    os << ")";
}

} // namespace

std::string generate_source(const Graph& graph, const EvalContext& ctx,
                            const SourceOptions& options)
{
    std::vector<NodeIdx> order = graph.toposort();
    KeySet keys = graph.keys();

    std::ostringstream oss;
    oss << "// Generated by stagedag. Do not edit.\n";
    oss << "#pragma once\n";
    oss << "#include <string>\n";
    oss << "#include <vector>\n";
    oss << "\n";
    oss << "namespace " << options.namespace_name << "\n{\n";

    // Keys
    if (!keys.empty())
    {
        oss << "\n";
    }
    for (const auto& key : keys)
    {
        oss << "inline const " << key.info().type_name() << " " << key_binding(key) << " = "
            << serialize(key, ctx) << ";\n";
    }

    KeySet runtime = filter_stage(Stage::Run, keys);
    if (!runtime.empty())
    {
        oss << "\ninline constexpr const char* runtime_keys[] = {";
        bool first = true;
        for (const auto& key : runtime)
        {
            if (!first)
            {
                oss << ", ";
            }
            oss << desc::quote(key.name());
            first = false;
        }
        oss << "};\n";
    }

    // Nodes
    if (!order.empty())
    {
        oss << "\n";
    }
    for (NodeIdx idx : order)
    {
        std::vector<std::string> args;
        for (NodeIdx arg : graph.arguments(idx))
        {
            args.push_back(node_binding(graph, arg));
        }

        oss << "inline auto " << node_binding(graph, idx) << " = ";
        switch (graph.kind(idx))
        {
        case NodeKind::Vertex:
            oss << graph.label(idx);
            break;
        case NodeKind::Configurable:
            for (const auto& key : graph.node_keys(idx))
            {
                args.push_back(key_binding(key));
            }
            write_call(oss, graph.configurable(idx)->constructor, args);
            break;
        case NodeKind::App:
            write_call(oss, node_binding(graph, graph.app_base(idx)), args);
            break;
        }
        oss << ";\n";
    }

    if (!order.empty())
    {
        oss << "\ninline auto root()\n{\n    return " << node_binding(graph, order.back())
            << ";\n}\n";
    }

    oss << "\n} // namespace " << options.namespace_name << "\n";

    STAGEDAG_LOG_INFO("codegen", "Generated bindings for " << keys.size() << " key(s) and "
                                     << order.size() << " node(s)");
    return oss.str();
}

} // namespace stagedag
