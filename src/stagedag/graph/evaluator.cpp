/**
 * @file evaluator.cpp
 */
#include "stagedag/graph/evaluator.hpp"
#include "stagedag/common/log.hpp"
#include "stagedag/keys/value_eval.hpp"

namespace stagedag
{

const char* eval_mode_name(EvalMode mode) noexcept
{
    switch (mode)
    {
    case EvalMode::Partial:
        return "partial";
    case EvalMode::Full:
        return "full";
    }
    return "???";
}

namespace
{

void evaluate_node_partial(const Graph& graph, NodeIdx idx, const EvalContext& ctx,
                           NodeEvaluation& out)
{
    for (const auto& key : graph.node_keys(idx))
    {
        const EvalContext::Binding* binding = ctx.find(key.name());
        if (binding != nullptr)
        {
            out.keys.emplace(key.name(), binding->value);
        }
        else
        {
            out.unresolved_keys.push_back(key.name());
        }
    }

    const ConfigurableInfo* info = graph.configurable(idx);
    if (info == nullptr)
    {
        return;
    }
    for (const auto& expr : info->values)
    {
        out.values.push_back(peek_cell(expr.node(), ctx));
    }
}

void evaluate_node_full(const Graph& graph, NodeIdx idx, const EvalContext& ctx,
                        NodeEvaluation& out)
{
    for (const auto& key : graph.node_keys(idx))
    {
        out.keys.emplace(key.name(), eval_cell(ExprNode::make_key_ref(key), ctx));
    }

    const ConfigurableInfo* info = graph.configurable(idx);
    if (info == nullptr)
    {
        return;
    }
    for (const auto& expr : info->values)
    {
        out.values.emplace_back(eval_cell(expr.node(), ctx));
    }
}

} // namespace

Evaluation evaluate(const Graph& graph, EvalContext& ctx, EvalMode mode)
{
    Evaluation result;
    result.mode = mode;
    result.order = graph.toposort();
    result.nodes.resize(graph.node_count());

    if (mode == EvalMode::Full)
    {
        result.defaults_filled = ctx.fill_defaults(graph.keys());
        STAGEDAG_LOG_DEBUG("eval", "Filled " << result.defaults_filled << " default(s)");
    }

    for (NodeIdx idx : result.order)
    {
        if (mode == EvalMode::Full)
        {
            try
            {
                evaluate_node_full(graph, idx, ctx, result.nodes[idx]);
            }
            catch (const KeyError& e)
            {
                // Re-raise with the node that needed the key
                throw KeyError(e.code(), e.key_name(),
                               std::string{e.what()} + " (node " + graph.display_name(idx) +
                                   ")");
            }
        }
        else
        {
            evaluate_node_partial(graph, idx, ctx, result.nodes[idx]);
        }
        STAGEDAG_LOG_TRACE("eval", "Evaluated " << graph.display_name(idx));
    }

    STAGEDAG_LOG_INFO("eval", result.summary());
    return result;
}

} // namespace stagedag
