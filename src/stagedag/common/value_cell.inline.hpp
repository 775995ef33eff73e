/**
 * @file value_cell.inline.hpp
 * @brief Implementations for type-parameterized member methods in the ValueCell class.
 */
#pragma once
#include "stagedag/common/value_cell.hpp"

namespace stagedag
{

namespace detail
{

template <typename T>
using cell_storage_t = std::decay_t<T>;

} // namespace detail

template <typename T>
ValueCell ValueCell::of(T&& value)
{
    ValueCell cell;
    cell.set(std::forward<T>(value));
    return cell;
}

template <typename T>
bool ValueCell::has_type() const noexcept
{
    using StorageT = detail::cell_storage_t<T>;
    static_assert(!std::is_void_v<StorageT>, "ValueCell: T cannot be void");
    return m_ti == std::type_index{typeid(StorageT)};
}

template <typename T>
void ValueCell::set(T&& value)
{
    using StorageT = detail::cell_storage_t<T>;
    static_assert(!std::is_void_v<StorageT>, "ValueCell: T cannot be void");
    static_assert(!std::is_array_v<StorageT>, "ValueCell: T cannot be an array type");

    m_pvalue = std::make_shared<const StorageT>(std::forward<T>(value));
    m_ti = std::type_index{typeid(StorageT)};
}

template <typename T>
const T& ValueCell::as() const
{
    using StorageT = detail::cell_storage_t<T>;
    static_assert(!std::is_void_v<StorageT>, "ValueCell: T cannot be void");

    if (!m_pvalue)
    {
        throw ValueCellEmptyError{};
    }
    if (m_ti != std::type_index{typeid(StorageT)})
    {
        throw ValueCellTypeError{
            "ValueCell type mismatch: expected " + std::string{typeid(StorageT).name()} +
            ", got " + std::string{m_ti.name()}
        };
    }
    return *static_cast<const StorageT*>(m_pvalue.get());
}

template <typename T>
const T* ValueCell::try_as() const noexcept
{
    using StorageT = detail::cell_storage_t<T>;
    static_assert(!std::is_void_v<StorageT>, "ValueCell: T cannot be void");

    if (!m_pvalue || m_ti != std::type_index{typeid(StorageT)})
    {
        return nullptr;
    }
    return static_cast<const StorageT*>(m_pvalue.get());
}

} // namespace stagedag
