/**
 * @file eval_context.hpp
 */
#pragma once
#include "stagedag/common/common.hpp"
#include "stagedag/common/value_cell.inline.hpp"
#include "stagedag/keys/key.hpp"

namespace stagedag
{

/**
 * @brief Where a bound value came from.
 */
enum class Provenance
{
    CommandLine,  ///< Parsed from process arguments.
    Default,      ///< Filled from the key's default.
    Explicit      ///< Set programmatically.
};

const char* provenance_name(Provenance provenance) noexcept;

/**
 * @brief Resolved key values for one evaluation pass.
 *
 * @details
 * Maps key names to resolved values. Each key is bound at most once per
 * pass, either from the command line, programmatically, or by
 * `fill_defaults()`. The context is owned by a single pass and never shared
 * between passes.
 *
 * @par Thread safety
 * - No internal synchronization.
 */
class EvalContext
{
public:
    struct Binding
    {
        AnyKey key;
        ValueCell value;
        Provenance provenance;
    };

    /**
     * @brief Bind @p value to @p key.
     * @throws KeyError with `AlreadyBound` if the key is bound already, or
     *         `TypeMismatch` if the cell does not hold the key's value type.
     */
    void bind(const AnyKey& key, ValueCell value, Provenance provenance);

    /**
     * @brief Bind a typed value with `Explicit` provenance.
     */
    template <typename T>
    void set(const Key<T>& key, T value)
    {
        bind(key.erase(), ValueCell::of(std::move(value)), Provenance::Explicit);
    }

    bool is_bound(const std::string& name) const
    {
        return m_bindings.count(name) > 0;
    }

    bool is_bound(const AnyKey& key) const
    {
        return is_bound(key.name());
    }

    /**
     * @brief Look up a binding.
     * @return The binding, or nullptr if the key is unbound.
     */
    const Binding* find(const std::string& name) const;

    /// Where the value of @p name came from, or nullopt if unbound.
    std::optional<Provenance> provenance(const std::string& name) const
    {
        const Binding* binding = find(name);
        if (binding == nullptr)
        {
            return std::nullopt;
        }
        return binding->provenance;
    }

    /**
     * @brief The resolved value of @p key, if bound.
     */
    template <typename T>
    std::optional<T> get(const Key<T>& key) const
    {
        const Binding* binding = find(key.name());
        if (binding == nullptr)
        {
            return std::nullopt;
        }
        return binding->value.template as<T>();
    }

    /**
     * @brief Bind the default of every unbound key in @p keys.
     * @return The number of keys that were filled.
     */
    size_t fill_defaults(const KeySet& keys);

    size_t size() const noexcept
    {
        return m_bindings.size();
    }

    /// Names of all bound keys, in name order.
    std::vector<std::string> bound_names() const;

private:
    std::map<std::string, Binding> m_bindings;
};

} // namespace stagedag
