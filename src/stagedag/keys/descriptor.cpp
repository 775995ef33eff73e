/**
 * @file descriptor.cpp
 */
#include "stagedag/keys/descriptor.hpp"

#include <cstdio>

namespace stagedag
{
namespace desc
{

std::string quote(const std::string& text)
{
    std::string out = "\"";
    for (char c : text)
    {
        switch (c)
        {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f)
            {
                // Octal escapes take at most three digits, so a following
                // digit can never be swallowed.
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\%03o", static_cast<unsigned char>(c));
                out += buf;
            }
            else
            {
                out += c;
            }
        }
    }
    out += "\"";
    return out;
}

DescriptorPtr<std::string> string()
{
    static const DescriptorPtr<std::string> instance = Descriptor<std::string>::create(
        [](const std::string& value) { return quote(value); },
        {[](const std::string& text) { return ParseResult<std::string>::success(text); },
         [](const std::string& value) { return value; }},
        "string",
        "std::string");
    return instance;
}

DescriptorPtr<int> integer()
{
    static const DescriptorPtr<int> instance = Descriptor<int>::create(
        [](const int& value) { return std::to_string(value); },
        {[](const std::string& text)
         {
             size_t pos = 0;
             bool negative = false;
             if (!text.empty() && text[0] == '-')
             {
                 negative = true;
                 pos = 1;
             }
             if (pos == text.size())
             {
                 return ParseResult<int>::failure(
                     "invalid value '" + text + "', expected an integer");
             }
             // Accumulate as a negative number so that INT_MIN is representable.
             long long acc = 0;
             for (; pos < text.size(); ++pos)
             {
                 char c = text[pos];
                 if (c < '0' || c > '9')
                 {
                     return ParseResult<int>::failure(
                         "invalid value '" + text + "', expected an integer");
                 }
                 acc = acc * 10 - (c - '0');
                 if (acc < static_cast<long long>(std::numeric_limits<int>::min()))
                 {
                     return ParseResult<int>::failure(
                         "value '" + text + "' is out of range");
                 }
             }
             if (!negative)
             {
                 acc = -acc;
                 if (acc > static_cast<long long>(std::numeric_limits<int>::max()))
                 {
                     return ParseResult<int>::failure(
                         "value '" + text + "' is out of range");
                 }
             }
             return ParseResult<int>::success(static_cast<int>(acc));
         },
         [](const int& value) { return std::to_string(value); }},
        "integer",
        "int");
    return instance;
}

DescriptorPtr<bool> boolean()
{
    static const DescriptorPtr<bool> instance = Descriptor<bool>::create(
        [](const bool& value) { return std::string{value ? "true" : "false"}; },
        {[](const std::string& text)
         {
             if (text == "true")
             {
                 return ParseResult<bool>::success(true);
             }
             if (text == "false")
             {
                 return ParseResult<bool>::success(false);
             }
             return ParseResult<bool>::failure(
                 "invalid value '" + text + "', expected either 'true' or 'false'");
         },
         [](const bool& value) { return std::string{value ? "true" : "false"}; }},
        "boolean",
        "bool");
    return instance;
}

} // namespace desc
} // namespace stagedag
