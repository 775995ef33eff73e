#include <gtest/gtest.h>
#include "stagedag/graph/dot_renderer.hpp"
#include "stagedag/keys/descriptor.inline.hpp"
#include "stagedag/keys/key.inline.hpp"

using namespace stagedag;

TEST(DotRendererTests, EmptyGraph)
{
    Graph graph;
    EXPECT_EQ(render_dot(graph), "digraph stagedag {\n  rankdir=BT;\n}\n");
}

TEST(DotRendererTests, ShapesEdgeStylesAndKeyLabels)
{
    KeyRegistry registry;
    auto port = registry.create<int>("port", "", Stage::Configure, 80, desc::integer());
    auto hosts = registry.create<std::string>("hosts", "", Stage::Run, "h", desc::string());

    Graph graph;
    graph.add_vertex("console_sink{}");
    graph.add_configurable(ConfigurableInfo{"http", "make_http", KeySet{port, hosts}, {}}, {});
    graph.add_app(1, {0});
    graph.add_vertex("clock");
    graph.add_data_dependency(1, 3);

    EXPECT_EQ(render_dot(graph),
              "digraph stagedag {\n"
              "  rankdir=BT;\n"
              "  n0 [label=\"console_sink{}\", shape=circle];\n"
              "  n1 [label=\"http\\nhosts, port\", shape=box];\n"
              "  n2 [label=\"app\", shape=diamond];\n"
              "  n3 [label=\"clock\", shape=circle];\n"
              "  n2 -> n1 [style=bold];\n"
              "  n2 -> n0 [label=\"0\"];\n"
              "  n1 -> n3 [style=dashed];\n"
              "}\n");
}

TEST(DotRendererTests, ArgumentEdgesAreLabelledByPosition)
{
    Graph graph;
    graph.add_vertex("a");
    graph.add_vertex("b");
    graph.add_configurable(ConfigurableInfo{"f", "make_f", {}, {}}, {1, 0});

    std::string dot = render_dot(graph);
    EXPECT_NE(dot.find("  n2 -> n1 [label=\"0\"];\n"), std::string::npos);
    EXPECT_NE(dot.find("  n2 -> n0 [label=\"1\"];\n"), std::string::npos);
}

TEST(DotRendererTests, LabelsAreEscaped)
{
    Graph graph;
    graph.add_vertex("say(\"hi\")");
    EXPECT_NE(render_dot(graph).find("label=\"say(\\\"hi\\\")\""), std::string::npos);
}
