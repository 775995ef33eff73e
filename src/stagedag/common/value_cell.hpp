/**
 * @file value_cell.hpp
 * @brief Definition of ValueCell, the type-erased holder of a resolved value.
 * @see value_cell.inline.hpp for implementations of type-parameterized methods.
 */

#pragma once
#include "stagedag/common/common.hpp"

namespace stagedag
{

/**
 * @brief Exception thrown when a ValueCell is read as the wrong type.
 */
class ValueCellTypeError : public std::runtime_error
{
public:
    explicit ValueCellTypeError(const std::string& msg)
        : std::runtime_error(msg)
    {}
};

/**
 * @brief Exception thrown when reading an empty ValueCell.
 */
class ValueCellEmptyError : public std::runtime_error
{
public:
    ValueCellEmptyError()
        : std::runtime_error("ValueCell is empty")
    {}
};

/**
 * @brief An immutable, type-erased value shared between expressions and contexts.
 *
 * @details
 * A ValueCell holds one value of any copyable type behind a
 * `shared_ptr<const void>` together with the `type_index` of the stored type.
 * Copying a cell shares the stored value; the value itself can never be
 * modified through a cell. Only `of()` stores a value.
 *
 * Cells are the currency of the untyped layer: constant expression nodes,
 * key defaults, parsed command-line values and evaluation context bindings
 * are all cells. The typed layer (`Key<T>`, `Value<T>`) guarantees that the
 * stored type matches whenever it reads a cell back.
 *
 * @par Invariants
 * - `(m_ti == typeid(void))` if and only if `m_pvalue == nullptr`
 *
 * @par Thread Safety
 * - Safe for simultaneous reading and being copied from.
 */
class ValueCell
{
public:
    ValueCell() = default;

    /**
     * @brief Make a cell holding a copy (or move) of @p value.
     */
    template <typename T>
    static ValueCell of(T&& value);

    [[nodiscard]] bool has_value() const noexcept
    {
        return m_pvalue != nullptr;
    }

    /**
     * @brief Check if the stored type matches T.
     */
    template <typename T>
    [[nodiscard]] bool has_type() const noexcept;

    /**
     * @brief Get the type_index of the stored value, or typeid(void) if empty.
     */
    [[nodiscard]] std::type_index type() const noexcept
    {
        return m_ti;
    }

    /**
     * @brief Access the stored value.
     * @throws ValueCellEmptyError if empty.
     * @throws ValueCellTypeError if the stored type is not T.
     */
    template <typename T>
    [[nodiscard]] const T& as() const;

    /**
     * @brief Access the stored value, or nullptr if empty or of another type.
     */
    template <typename T>
    [[nodiscard]] const T* try_as() const noexcept;

    /**
     * @brief True if both cells share the same stored object.
     */
    [[nodiscard]] bool shares_with(const ValueCell& other) const noexcept
    {
        return m_pvalue == other.m_pvalue;
    }

private:
    /// @post has_value() == true && has_type<std::decay_t<T>>() == true
    template <typename T>
    void set(T&& value);

    std::shared_ptr<const void> m_pvalue{};
    std::type_index m_ti{typeid(void)};
};

} // namespace stagedag
