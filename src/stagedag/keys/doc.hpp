/**
 * @file doc.hpp
 */
#pragma once
#include "stagedag/common/common.hpp"

namespace stagedag
{

/**
 * @brief Argument-parser view of a Doc.
 */
struct ArgSpec
{
    /// Option spellings, e.g. {"--log_level", "-l"}; the first is primary.
    std::vector<std::string> flags;
    std::string docv;
    std::string doc;
    std::string section;
};

/**
 * @brief Command-line presentation metadata of a key.
 *
 * @details
 * A Doc names the flags a key answers to (the first name is the primary
 * one, the others are aliases), the placeholder shown for its value, its
 * help text and the help section it is listed under. One-letter names are
 * spelled `-x`, longer ones `--name`.
 */
class Doc
{
public:
    static constexpr const char* default_docv = "VALUE";
    static constexpr const char* default_section = "APPLICATION OPTIONS";

    /**
     * @throws std::invalid_argument if @p names is empty or contains an empty name.
     */
    explicit Doc(std::vector<std::string> names, std::string doc = {},
                 std::string docv = default_docv, std::string docs = default_section);

    const std::vector<std::string>& names() const noexcept
    {
        return m_names;
    }

    const std::string& doc() const noexcept
    {
        return m_doc;
    }

    const std::string& docv() const noexcept
    {
        return m_docv;
    }

    const std::string& docs() const noexcept
    {
        return m_docs;
    }

    ArgSpec to_arg_spec() const;

    /**
     * @brief Write the flag line and the indented help text.
     */
    void emit(std::ostream& os) const;

    /// "-x" for one-letter names, "--name" otherwise.
    static std::string flag_spelling(const std::string& name);

private:
    std::vector<std::string> m_names;
    std::string m_doc;
    std::string m_docv;
    std::string m_docs;
};

} // namespace stagedag
