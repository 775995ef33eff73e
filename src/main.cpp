#include "stagedag/common/log.hpp"
#include "stagedag/graph/dot_renderer.hpp"
#include "stagedag/graph/evaluator.hpp"
#include "stagedag/graph/source_generator.hpp"
#include "stagedag/keys/key_emit.hpp"
#include "stagedag/keys/key_term.hpp"
#include "stagedag/tool/sample_app.hpp"
#include "stagedag/tool/tool_options.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace
{

using namespace stagedag;

std::string describe_listing(const Graph& graph, const EvalContext& ctx,
                             const Evaluation& evaluation)
{
    std::ostringstream oss;
    for (const auto& key : graph.keys())
    {
        oss << describe(key) << "\n";
        oss << "    " << describe_binding(key, ctx) << "\n";
    }
    oss << "\n";
    for (NodeIdx idx : evaluation.order)
    {
        oss << graph.display_name(idx) << " [" << node_kind_name(graph.kind(idx)) << "]\n";
        for (const auto& name : evaluation.nodes[idx].unresolved_keys)
        {
            oss << "    " << name << " is unresolved\n";
        }
    }
    oss << "\n" << evaluation.summary() << "\n";
    return oss.str();
}

void write_output(const std::string& path, const std::string& text)
{
    if (path.empty() || path == "-")
    {
        std::cout << text << std::flush;
        return;
    }
    std::ofstream out(path, std::ios::binary);
    if (!out)
    {
        throw std::runtime_error("cannot open '" + path + "' for writing");
    }
    out << text;
    if (!out.flush())
    {
        throw std::runtime_error("failed to write '" + path + "'");
    }
    STAGEDAG_LOG_INFO("tool", "Wrote " << text.size() << " bytes to " << path);
}

int run(int argc, char** argv)
{
    ToolOptions options = parse_tool_options(make_arg_list(argc, argv));
    Logger::init(LogConfig{level_from_verbosity(options.verbosity)});

    SampleApp sample;
    const Graph& graph = sample.graph;

    if (options.help)
    {
        std::cout << tool_usage(graph.keys()) << std::flush;
        return EXIT_SUCCESS;
    }

    auto diagnostics = graph.get_diagnostics();
    for (const auto& warning : diagnostics->warnings())
    {
        STAGEDAG_LOG_WARN("tool", warning.message);
    }

    std::optional<Stage> stage_filter;
    if (options.command == ToolCommand::Configure)
    {
        stage_filter = Stage::Configure;
    }
    TermOutcome outcome = term(stage_filter, graph.keys()).run(options.key_args);
    if (!outcome.ok())
    {
        for (const auto& failure : outcome.failures())
        {
            std::cerr << "stagedag_tool: " << failure.message << "\n";
        }
        std::cerr << std::flush;
        return EXIT_FAILURE;
    }

    EvalContext ctx;
    outcome.apply(ctx, false);

    std::string text;
    if (options.command == ToolCommand::Configure)
    {
        Evaluation evaluation = evaluate(graph, ctx, EvalMode::Full);
        STAGEDAG_LOG_DEBUG("tool", evaluation.summary());
        text = generate_source(graph, ctx);
    }
    else if (options.dot)
    {
        text = render_dot(graph);
    }
    else
    {
        EvalMode mode = options.eval ? EvalMode::Full : EvalMode::Partial;
        Evaluation evaluation = evaluate(graph, ctx, mode);
        text = describe_listing(graph, ctx, evaluation);
    }

    write_output(options.output, text);
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char** argv)
{
    try
    {
        return run(argc, argv);
    }
    catch (const std::exception& e)
    {
        std::cerr << "stagedag_tool: error: " << e.what() << "\n" << std::flush;
        return EXIT_FAILURE;
    }
}
