/**
 * @file descriptor.hpp
 * @brief Value-type descriptors: parse, print, serialize and describe.
 * @see descriptor.inline.hpp for the list combinator.
 */
#pragma once
#include "stagedag/common/common.hpp"

namespace stagedag
{

/**
 * @brief Outcome of parsing raw text with a descriptor.
 *
 * @details
 * Either holds a value or an error message. Parsers never throw; malformed
 * input is always reported through `failure()`.
 */
template <typename T>
class ParseResult
{
public:
    static ParseResult success(T value)
    {
        ParseResult result;
        result.m_value.emplace(std::move(value));
        return result;
    }

    static ParseResult failure(std::string message)
    {
        ParseResult result;
        result.m_error = std::move(message);
        return result;
    }

    [[nodiscard]] bool ok() const noexcept
    {
        return m_value.has_value();
    }

    explicit operator bool() const noexcept
    {
        return ok();
    }

    /**
     * @brief The parsed value.
     * @throws std::logic_error if the parse failed.
     */
    const T& value() const
    {
        if (!m_value)
        {
            throw std::logic_error("ParseResult has no value: " + m_error);
        }
        return *m_value;
    }

    /**
     * @brief The error message, empty on success.
     */
    const std::string& error() const noexcept
    {
        return m_error;
    }

private:
    ParseResult() = default;

    std::optional<T> m_value;
    std::string m_error;
};

/**
 * @brief Describes how values of type T are read, shown and written as source.
 *
 * @details
 * A descriptor bundles four functions over T:
 * - `parse`: raw command-line text to a value, or an error message;
 * - `print`: a value to display text, with `parse(print(x)) == x`;
 * - `serialize`: a value to a C++ expression of type `type_name()` that
 *   reproduces the value in generated source;
 * - `description`: a short human name of the type for documentation.
 *
 * Descriptors are immutable and shared by every key of their type.
 */
template <typename T>
class Descriptor
{
    struct Passkey
    {
        explicit Passkey() = default;
    };

public:
    using Parser = std::function<ParseResult<T>(const std::string&)>;
    using Printer = std::function<std::string(const T&)>;
    using Serializer = std::function<std::string(const T&)>;

    struct Converter
    {
        Parser parse;
        Printer print;
    };

    static std::shared_ptr<const Descriptor> create(Serializer serializer,
                                                    Converter converter,
                                                    std::string description,
                                                    std::string type_name)
    {
        return std::make_shared<const Descriptor>(Passkey{}, std::move(serializer),
                                                  std::move(converter), std::move(description),
                                                  std::move(type_name));
    }

    ParseResult<T> parse(const std::string& text) const
    {
        return m_converter.parse(text);
    }

    std::string print(const T& value) const
    {
        return m_converter.print(value);
    }

    std::string serialize(const T& value) const
    {
        return m_serializer(value);
    }

    const Converter& converter() const noexcept
    {
        return m_converter;
    }

    const std::string& description() const noexcept
    {
        return m_description;
    }

    /// C++ spelling of T used in generated declarations.
    const std::string& type_name() const noexcept
    {
        return m_type_name;
    }

    /// Reachable only through create().
    Descriptor(Passkey, Serializer serializer, Converter converter, std::string description,
               std::string type_name)
        : m_serializer(std::move(serializer))
        , m_converter(std::move(converter))
        , m_description(std::move(description))
        , m_type_name(std::move(type_name))
    {
    }

private:
    Serializer m_serializer;
    Converter m_converter;
    std::string m_description;
    std::string m_type_name;
};

template <typename T>
using DescriptorPtr = std::shared_ptr<const Descriptor<T>>;

namespace desc
{

/// Identity parse and print; serialized as an escaped string literal.
DescriptorPtr<std::string> string();

/// Optionally signed decimal digits within the range of int.
DescriptorPtr<int> integer();

/// Exactly "true" or "false".
DescriptorPtr<bool> boolean();

/**
 * @brief Sequence of T, written as separator-delimited tokens.
 *
 * @details
 * The empty string parses to the empty list. Values print joined with the
 * separator and serialize as a `std::vector<T>{...}` literal. Within an
 * element, the separator and backslash are escaped with a backslash, and an
 * empty element prints as `\e`.
 */
template <typename T>
DescriptorPtr<std::vector<T>> list(const DescriptorPtr<T>& element, char separator = ',');

/**
 * @brief Render @p text as a C++ string literal, including the quotes.
 */
std::string quote(const std::string& text);

} // namespace desc

} // namespace stagedag
