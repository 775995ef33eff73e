/**
 * @file descriptor.inline.hpp
 * @brief Implementation of the list descriptor combinator.
 */
#pragma once
#include "stagedag/keys/descriptor.hpp"

namespace stagedag
{
namespace desc
{

template <typename T>
DescriptorPtr<std::vector<T>> list(const DescriptorPtr<T>& element, char separator)
{
    using List = std::vector<T>;

    typename Descriptor<List>::Parser parse = [element, separator](const std::string& text)
    {
        List items;
        if (text.empty())
        {
            return ParseResult<List>::success(std::move(items));
        }

        std::string token;
        auto flush = [&]() -> std::optional<std::string>
        {
            auto parsed = element->parse(token);
            if (!parsed)
            {
                return "invalid element '" + token + "': " + parsed.error();
            }
            items.push_back(parsed.value());
            token.clear();
            return std::nullopt;
        };

        for (size_t i = 0; i < text.size(); ++i)
        {
            char c = text[i];
            if (c == separator)
            {
                if (auto error = flush())
                {
                    return ParseResult<List>::failure(*error);
                }
                continue;
            }
            if (c != '\\')
            {
                token += c;
                continue;
            }
            if (i + 1 == text.size())
            {
                return ParseResult<List>::failure("dangling escape at end of '" + text + "'");
            }
            char next = text[++i];
            if (next == '\\' || next == separator)
            {
                token += next;
            }
            else if (next != 'e')
            {
                return ParseResult<List>::failure(std::string("invalid escape '\\") + next +
                                                  "' in '" + text + "'");
            }
        }
        if (auto error = flush())
        {
            return ParseResult<List>::failure(*error);
        }
        return ParseResult<List>::success(std::move(items));
    };

    // "\e" spells an empty element so that {""} differs from {}
    typename Descriptor<List>::Printer print = [element, separator](const List& items)
    {
        std::string out;
        for (size_t i = 0; i < items.size(); ++i)
        {
            if (i > 0)
            {
                out += separator;
            }
            std::string printed = element->print(items[i]);
            if (printed.empty())
            {
                out += "\\e";
                continue;
            }
            for (char c : printed)
            {
                if (c == '\\' || c == separator)
                {
                    out += '\\';
                }
                out += c;
            }
        }
        return out;
    };

    typename Descriptor<List>::Serializer serialize = [element](const List& items)
    {
        std::string out = "std::vector<" + element->type_name() + ">{";
        for (size_t i = 0; i < items.size(); ++i)
        {
            if (i > 0)
            {
                out += ", ";
            }
            out += element->serialize(items[i]);
        }
        out += "}";
        return out;
    };

    return Descriptor<List>::create(
        std::move(serialize),
        {std::move(parse), std::move(print)},
        element->description() + " list",
        "std::vector<" + element->type_name() + ">");
}

} // namespace desc
} // namespace stagedag
