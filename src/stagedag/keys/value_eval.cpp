/**
 * @file value_eval.cpp
 */
#include "stagedag/keys/value_eval.hpp"
#include "stagedag/common/log.hpp"

namespace stagedag
{

const KeySet& deps_of(const ExprNode& node)
{
    if (node.m_deps)
    {
        return *node.m_deps;
    }

    KeySet result;
    switch (node.m_kind)
    {
    case ExprKind::Const:
        break;
    case ExprKind::KeyRef:
        result.insert(*node.m_key);
        break;
    case ExprKind::Apply:
    {
        const KeySet& fn_deps = deps_of(*node.m_fn);
        const KeySet& arg_deps = deps_of(*node.m_arg);
        result.insert(fn_deps.begin(), fn_deps.end());
        result.insert(arg_deps.begin(), arg_deps.end());
        break;
    }
    }
    node.m_deps = std::move(result);
    return *node.m_deps;
}

const KeySet& deps(const AnyValue& expr)
{
    return deps_of(*expr.node());
}

std::optional<ValueCell> peek_cell(const ExprNodePtr& node, const EvalContext& ctx)
{
    switch (node->kind())
    {
    case ExprKind::Const:
        return node->constant();
    case ExprKind::KeyRef:
    {
        const EvalContext::Binding* binding = ctx.find(node->key().name());
        if (binding == nullptr)
        {
            return std::nullopt;
        }
        return binding->value;
    }
    case ExprKind::Apply:
    {
        auto fn = peek_cell(node->fn(), ctx);
        if (!fn)
        {
            return std::nullopt;
        }
        auto arg = peek_cell(node->arg(), ctx);
        if (!arg)
        {
            return std::nullopt;
        }
        return node->applier()(*fn, *arg);
    }
    }
    return std::nullopt;
}

ValueCell eval_cell(const ExprNodePtr& node, const EvalContext& ctx)
{
    switch (node->kind())
    {
    case ExprKind::Const:
        return node->constant();
    case ExprKind::KeyRef:
    {
        const AnyKey& key = node->key();
        const EvalContext::Binding* binding = ctx.find(key.name());
        if (binding == nullptr)
        {
            STAGEDAG_LOG_FATAL("eval", "Key '" << key.name()
                                                << "' reached evaluation without a value");
            throw KeyError(
                KeyErrorCode::UnresolvedKeyInvariant, key.name(),
                "Key '" + key.name() + "' has no resolved value; defaults must be "
                "filled before evaluation");
        }
        return binding->value;
    }
    case ExprKind::Apply:
    {
        ValueCell fn = eval_cell(node->fn(), ctx);
        ValueCell arg = eval_cell(node->arg(), ctx);
        return node->applier()(fn, arg);
    }
    }
    throw std::logic_error("Unknown expression kind");
}

} // namespace stagedag
