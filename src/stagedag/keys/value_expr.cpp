/**
 * @file value_expr.cpp
 */
#include "stagedag/keys/value_expr.hpp"

namespace stagedag
{

namespace
{

const char* kind_name(ExprKind kind)
{
    switch (kind)
    {
    case ExprKind::Const:
        return "Const";
    case ExprKind::KeyRef:
        return "KeyRef";
    case ExprKind::Apply:
        return "Apply";
    }
    return "???";
}

} // namespace

ExprNodePtr ExprNode::make_const(ValueCell value)
{
    auto node = std::make_shared<ExprNode>(Passkey{}, ExprKind::Const);
    node->m_constant = std::move(value);
    return node;
}

ExprNodePtr ExprNode::make_key_ref(AnyKey key)
{
    auto node = std::make_shared<ExprNode>(Passkey{}, ExprKind::KeyRef);
    node->m_key.emplace(std::move(key));
    return node;
}

ExprNodePtr ExprNode::make_apply(ExprNodePtr fn, ExprNodePtr arg, Applier applier)
{
    if (!fn || !arg || !applier)
    {
        throw std::invalid_argument("Apply node requires a function, an argument and an applier");
    }
    auto node = std::make_shared<ExprNode>(Passkey{}, ExprKind::Apply);
    node->m_fn = std::move(fn);
    node->m_arg = std::move(arg);
    node->m_applier = std::move(applier);
    return node;
}

void ExprNode::require_kind(ExprKind kind, const char* what) const
{
    if (m_kind != kind)
    {
        throw std::logic_error(
            std::string{what} + " requested from a " + kind_name(m_kind) + " node");
    }
}

const ValueCell& ExprNode::constant() const
{
    require_kind(ExprKind::Const, "constant");
    return m_constant;
}

const AnyKey& ExprNode::key() const
{
    require_kind(ExprKind::KeyRef, "key");
    return *m_key;
}

const ExprNodePtr& ExprNode::fn() const
{
    require_kind(ExprKind::Apply, "fn");
    return m_fn;
}

const ExprNodePtr& ExprNode::arg() const
{
    require_kind(ExprKind::Apply, "arg");
    return m_arg;
}

const Applier& ExprNode::applier() const
{
    require_kind(ExprKind::Apply, "applier");
    return m_applier;
}

} // namespace stagedag
