/**
 * @file value_expr.hpp
 * @brief Applicative expressions over keys: `pure`, `value` and `app`.
 *
 * @details
 * An expression is a tree of three node kinds:
 * - `Const`: a constant value, no dependencies;
 * - `KeyRef`: the resolved value of one key;
 * - `Apply`: a function-valued expression applied to an argument expression.
 *
 * Because expressions can only be built from these three forms, the set of
 * keys an expression depends on is known without evaluating it. The
 * interpreters (`deps`, `peek`, `eval`) live in value_eval.hpp.
 */
#pragma once
#include "stagedag/common/common.hpp"
#include "stagedag/common/value_cell.inline.hpp"
#include "stagedag/keys/key.hpp"
#include "stagedag/keys/key.inline.hpp"

namespace stagedag
{

enum class ExprKind
{
    Const,
    KeyRef,
    Apply
};

class ExprNode;
using ExprNodePtr = std::shared_ptr<const ExprNode>;

/**
 * @brief Applies a function cell to an argument cell.
 * @details Created by the typed `app()` which knows both cell types.
 */
using Applier = std::function<ValueCell(const ValueCell& fn, const ValueCell& arg)>;

/// Memoized dependency set of a node; see value_eval.hpp.
const KeySet& deps_of(const ExprNode& node);

/**
 * @brief Untyped expression node.
 *
 * @details
 * Nodes are immutable once built and shared between the expressions that
 * contain them. The only mutable state is the memoized dependency set.
 *
 * @par Thread safety
 * - No internal synchronization; the dependency memo is filled on first use.
 */
class ExprNode
{
    struct Passkey
    {
        explicit Passkey() = default;
    };

public:
    /// Reachable only through the factories below.
    ExprNode(Passkey, ExprKind kind)
        : m_kind(kind)
    {
    }

    static ExprNodePtr make_const(ValueCell value);

    static ExprNodePtr make_key_ref(AnyKey key);

    /**
     * @throws std::invalid_argument if a child or the applier is missing.
     */
    static ExprNodePtr make_apply(ExprNodePtr fn, ExprNodePtr arg, Applier applier);

    ExprKind kind() const noexcept
    {
        return m_kind;
    }

    /// @throws std::logic_error unless kind() is Const.
    const ValueCell& constant() const;

    /// @throws std::logic_error unless kind() is KeyRef.
    const AnyKey& key() const;

    /// @throws std::logic_error unless kind() is Apply.
    const ExprNodePtr& fn() const;

    /// @throws std::logic_error unless kind() is Apply.
    const ExprNodePtr& arg() const;

    /// @throws std::logic_error unless kind() is Apply.
    const Applier& applier() const;

private:
    friend const KeySet& deps_of(const ExprNode& node);

    void require_kind(ExprKind kind, const char* what) const;

    ExprKind m_kind;
    ValueCell m_constant;
    std::optional<AnyKey> m_key;
    ExprNodePtr m_fn;
    ExprNodePtr m_arg;
    Applier m_applier;
    mutable std::optional<KeySet> m_deps;
};

/**
 * @brief Type-erased expression handle.
 */
class AnyValue
{
public:
    explicit AnyValue(ExprNodePtr node)
        : m_node(std::move(node))
    {
    }

    const ExprNodePtr& node() const noexcept
    {
        return m_node;
    }

private:
    ExprNodePtr m_node;
};

/**
 * @brief Expression producing a value of type T.
 */
template <typename T>
class Value
{
public:
    using value_type = T;

    explicit Value(ExprNodePtr node)
        : m_node(std::move(node))
    {
    }

    const ExprNodePtr& node() const noexcept
    {
        return m_node;
    }

    operator AnyValue() const
    {
        return AnyValue{m_node};
    }

private:
    ExprNodePtr m_node;
};

// ============================================================================
// Constructors
// ============================================================================

/**
 * @brief Constant expression.
 */
template <typename T>
Value<std::decay_t<T>> pure(T&& x)
{
    return Value<std::decay_t<T>>{ExprNode::make_const(ValueCell::of(std::forward<T>(x)))};
}

/**
 * @brief The resolved value of @p key.
 */
template <typename T>
Value<T> value(const Key<T>& key)
{
    return Value<T>{ExprNode::make_key_ref(key.erase())};
}

/**
 * @brief Apply a function-valued expression to an argument expression.
 */
template <typename B, typename A>
Value<B> app(const Value<std::function<B(A)>>& f, const Value<A>& x)
{
    Applier applier = [](const ValueCell& fn, const ValueCell& arg)
    {
        const auto& callable = fn.as<std::function<B(A)>>();
        return ValueCell::of(callable(arg.as<A>()));
    };
    return Value<B>{ExprNode::make_apply(f.node(), x.node(), std::move(applier))};
}

/**
 * @brief Infix alias for `app`: `f * x * y` is `app(app(f, x), y)`.
 */
template <typename B, typename A>
Value<B> operator*(const Value<std::function<B(A)>>& f, const Value<A>& x)
{
    return app(f, x);
}

/**
 * @brief `app(pure(fn), x)` for a plain callable.
 */
template <typename F, typename A>
auto map(F fn, const Value<A>& x)
{
    using B = std::decay_t<std::invoke_result_t<F&, const A&>>;
    return app(pure(std::function<B(A)>(std::move(fn))), x);
}

} // namespace stagedag
