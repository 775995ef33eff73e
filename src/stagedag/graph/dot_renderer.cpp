/**
 * @file dot_renderer.cpp
 */
#include "stagedag/graph/dot_renderer.hpp"
#include "stagedag/common/log.hpp"

namespace stagedag
{

namespace
{

std::string escape_label(const std::string& text)
{
    std::string out;
    out.reserve(text.size());
    for (char c : text)
    {
        if (c == '"' || c == '\\')
        {
            out += '\\';
        }
        out += c;
    }
    return out;
}

const char* shape_of(NodeKind kind)
{
    switch (kind)
    {
    case NodeKind::Vertex:
        return "circle";
    case NodeKind::Configurable:
        return "box";
    case NodeKind::App:
        return "diamond";
    }
    return "ellipse";
}

} // namespace

std::string render_dot(const Graph& graph)
{
    std::ostringstream oss;
    oss << "digraph stagedag {\n";
    oss << "  rankdir=BT;\n";

    for (NodeIdx idx = 0; idx < graph.node_count(); ++idx)
    {
        std::string label = escape_label(graph.label(idx));
        KeySet keys = graph.node_keys(idx);
        if (!keys.empty())
        {
            label += "\\n";
            bool first = true;
            for (const auto& key : keys)
            {
                if (!first)
                {
                    label += ", ";
                }
                label += escape_label(key.name());
                first = false;
            }
        }
        oss << "  n" << idx << " [label=\"" << label << "\", shape="
            << shape_of(graph.kind(idx)) << "];\n";
    }

    for (const auto& edge : graph.edges())
    {
        oss << "  n" << edge.dependent << " -> n" << edge.dependency;
        switch (edge.kind)
        {
        case EdgeKind::Functor:
            oss << " [style=bold]";
            break;
        case EdgeKind::Argument:
            oss << " [label=\"" << edge.position << "\"]";
            break;
        case EdgeKind::DataDependency:
            oss << " [style=dashed]";
            break;
        }
        oss << ";\n";
    }

    oss << "}\n";
    STAGEDAG_LOG_DEBUG("graph", "Rendered dot for " << graph.node_count() << " node(s) and "
                                    << graph.edges().size() << " edge(s)");
    return oss.str();
}

} // namespace stagedag
