/**
 * @file key.inline.hpp
 * @brief Implementations for type-parameterized methods of keys and the registry.
 */
#pragma once
#include "stagedag/common/value_cell.inline.hpp"
#include "stagedag/keys/key.hpp"

namespace stagedag
{

template <typename T>
TypedKeyInfo<T>::TypedKeyInfo(std::string name, Stage stage, Doc doc, T default_value,
                              DescriptorPtr<T> descriptor)
    : KeyInfo(std::move(name), stage, std::move(doc), ValueCell::of(std::move(default_value)))
    , m_descriptor(std::move(descriptor))
{
}

template <typename T>
ParseResult<ValueCell> TypedKeyInfo<T>::parse_cell(const std::string& text) const
{
    auto parsed = m_descriptor->parse(text);
    if (!parsed)
    {
        return ParseResult<ValueCell>::failure(parsed.error());
    }
    return ParseResult<ValueCell>::success(ValueCell::of(parsed.value()));
}

template <typename T>
std::string TypedKeyInfo<T>::print_cell(const ValueCell& cell) const
{
    return m_descriptor->print(cell.as<T>());
}

template <typename T>
std::string TypedKeyInfo<T>::serialize_cell(const ValueCell& cell) const
{
    return m_descriptor->serialize(cell.as<T>());
}

template <typename T>
Key<T> KeyRegistry::create(const std::string& name, const std::string& doc_text, Stage stage,
                           T default_value, DescriptorPtr<T> descriptor)
{
    return create_raw<T>(Doc{{name}, doc_text}, stage, std::move(default_value), name,
                         std::move(descriptor));
}

template <typename T>
Key<T> KeyRegistry::create_raw(Doc doc, Stage stage, T default_value, const std::string& name,
                               DescriptorPtr<T> descriptor)
{
    if (!descriptor)
    {
        throw std::invalid_argument("Key '" + name + "' requires a descriptor");
    }
    auto info = std::make_shared<const TypedKeyInfo<T>>(
        name, stage, std::move(doc), std::move(default_value), std::move(descriptor));
    Key<T> key{info};
    register_key(key.erase());
    return key;
}

} // namespace stagedag
