#include <gtest/gtest.h>
#include "stagedag/graph/dot_renderer.hpp"
#include "stagedag/graph/evaluator.hpp"
#include "stagedag/graph/source_generator.hpp"
#include "stagedag/keys/key_term.hpp"
#include "stagedag/tool/sample_app.hpp"
#include "stagedag/tool/tool_options.hpp"

using namespace stagedag;

// ============================================================================
// Option Parsing Tests
// ============================================================================

TEST(ToolOptionsTests, Configure_WithOutputAndVerbosity)
{
    ToolOptions options = parse_tool_options({"configure", "-vv", "-o", "out.hpp",
                                              "--port=9000"});
    EXPECT_EQ(options.command, ToolCommand::Configure);
    EXPECT_EQ(options.verbosity, 2u);
    EXPECT_EQ(options.output, "out.hpp");
    EXPECT_EQ(options.key_args, (ArgList{"--port=9000"}));
}

TEST(ToolOptionsTests, Describe_WithEvalAndDot)
{
    ToolOptions options = parse_tool_options({"describe", "--eval", "--dot", "--verbose",
                                              "--output=graph.dot"});
    EXPECT_EQ(options.command, ToolCommand::Describe);
    EXPECT_TRUE(options.eval);
    EXPECT_TRUE(options.dot);
    EXPECT_EQ(options.verbosity, 1u);
    EXPECT_EQ(options.output, "graph.dot");
    EXPECT_TRUE(options.key_args.empty());
}

TEST(ToolOptionsTests, HelpWithoutCommand)
{
    ToolOptions options = parse_tool_options({"--help"});
    EXPECT_TRUE(options.help);
}

TEST(ToolOptionsTests, ArgumentsAfterSeparatorGoToKeys)
{
    ToolOptions options = parse_tool_options({"describe", "--", "-v"});
    EXPECT_EQ(options.verbosity, 0u);
    EXPECT_EQ(options.key_args, (ArgList{"--", "-v"}));
}

TEST(ToolOptionsTests, Errors)
{
    EXPECT_THROW(parse_tool_options({}), std::invalid_argument);
    EXPECT_THROW(parse_tool_options({"build"}), std::invalid_argument);
    EXPECT_THROW(parse_tool_options({"configure", "-o"}), std::invalid_argument);
    EXPECT_THROW(parse_tool_options({"configure", "--dot"}), std::invalid_argument);
}

TEST(ToolOptionsTests, UsageListsKeys)
{
    SampleApp app;
    std::string usage = tool_usage(app.graph.keys());
    EXPECT_NE(usage.find("usage: stagedag_tool"), std::string::npos);
    EXPECT_NE(usage.find("--log_level=VALUE"), std::string::npos);
    EXPECT_NE(usage.find("--port=VALUE"), std::string::npos);
}

// ============================================================================
// Sample Application Tests
// ============================================================================

TEST(SampleAppTests, GraphShape)
{
    SampleApp app;
    EXPECT_EQ(app.graph.node_count(), 4u);
    EXPECT_EQ(app.graph.kind(app.console), NodeKind::Vertex);
    EXPECT_EQ(app.graph.kind(app.app), NodeKind::App);
    EXPECT_EQ(app.graph.app_base(app.app), app.http);
    EXPECT_EQ(app.graph.arguments(app.app), std::vector<NodeIdx>{app.logger});
    EXPECT_TRUE(app.graph.get_diagnostics()->is_valid());
    EXPECT_FALSE(app.graph.get_diagnostics()->has_warnings());
}

TEST(SampleAppTests, ConfigureProducesSource)
{
    SampleApp app;
    TermOutcome outcome =
        term(Stage::Configure, app.graph.keys()).run({"--port=9000", "--hosts=ignored"});
    ASSERT_TRUE(outcome.ok());
    EvalContext ctx;
    outcome.apply(ctx, false);

    Evaluation evaluation = evaluate(app.graph, ctx, EvalMode::Full);
    EXPECT_EQ(evaluation.nodes[app.http].values[0]->as<std::string>(), "0.0.0.0:9000");

    std::string text = generate_source(app.graph, ctx);
    EXPECT_NE(text.find("inline const int key_port = 9000;\n"), std::string::npos);
    // Run-stage keys are not read at configure time
    EXPECT_NE(text.find("key_hosts = std::vector<std::string>{\"localhost\"};\n"),
              std::string::npos);
    EXPECT_NE(text.find("inline auto app_3 = node_http_2(node_logger_1);\n"), std::string::npos);
}

TEST(SampleAppTests, DescribeDotMentionsEveryNode)
{
    SampleApp app;
    std::string dot = render_dot(app.graph);
    EXPECT_NE(dot.find("n1 [label=\"logger\\nlog_level\", shape=box];"), std::string::npos);
    EXPECT_NE(dot.find("n2 [label=\"http\\nhosts, port\", shape=box];"), std::string::npos);
    EXPECT_NE(dot.find("n3 -> n2 [style=bold];"), std::string::npos);
}
