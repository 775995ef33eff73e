/**
 * @file value_eval.hpp
 * @brief Interpreters over value expressions: dependency analysis and evaluation.
 */
#pragma once
#include "stagedag/keys/eval_context.hpp"
#include "stagedag/keys/value_expr.hpp"

namespace stagedag
{

/**
 * @brief Keys reachable from @p expr.
 *
 * @details
 * Computed structurally and memoized per node: empty for `Const`, the key
 * itself for `KeyRef`, the union of both children for `Apply`.
 */
const KeySet& deps(const AnyValue& expr);

/**
 * @brief Evaluate if every reachable key is bound in @p ctx.
 * @return The value, or nullopt as soon as an unbound key is reached.
 */
std::optional<ValueCell> peek_cell(const ExprNodePtr& node, const EvalContext& ctx);

/**
 * @brief Evaluate, requiring every reachable key to be bound.
 * @throws KeyError with `UnresolvedKeyInvariant` naming the first unbound key.
 */
ValueCell eval_cell(const ExprNodePtr& node, const EvalContext& ctx);

template <typename T>
std::optional<T> peek(const Value<T>& expr, const EvalContext& ctx)
{
    auto cell = peek_cell(expr.node(), ctx);
    if (!cell)
    {
        return std::nullopt;
    }
    return cell->template as<T>();
}

template <typename T>
T eval(const Value<T>& expr, const EvalContext& ctx)
{
    return eval_cell(expr.node(), ctx).template as<T>();
}

} // namespace stagedag
