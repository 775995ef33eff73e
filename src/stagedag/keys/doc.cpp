/**
 * @file doc.cpp
 */
#include "stagedag/keys/doc.hpp"

namespace stagedag
{

Doc::Doc(std::vector<std::string> names, std::string doc, std::string docv, std::string docs)
    : m_names(std::move(names))
    , m_doc(std::move(doc))
    , m_docv(std::move(docv))
    , m_docs(std::move(docs))
{
    if (m_names.empty())
    {
        throw std::invalid_argument("Doc requires at least one flag name");
    }
    for (const auto& name : m_names)
    {
        if (name.empty())
        {
            throw std::invalid_argument("Doc flag names cannot be empty");
        }
    }
}

std::string Doc::flag_spelling(const std::string& name)
{
    return name.size() == 1 ? "-" + name : "--" + name;
}

ArgSpec Doc::to_arg_spec() const
{
    ArgSpec spec;
    for (const auto& name : m_names)
    {
        spec.flags.push_back(flag_spelling(name));
    }
    spec.docv = m_docv;
    spec.doc = m_doc;
    spec.section = m_docs;
    return spec;
}

void Doc::emit(std::ostream& os) const
{
    for (size_t i = 0; i < m_names.size(); ++i)
    {
        if (i > 0)
        {
            os << ", ";
        }
        const std::string& name = m_names[i];
        os << flag_spelling(name) << (name.size() == 1 ? " " : "=") << m_docv;
    }
    os << "\n";
    if (!m_doc.empty())
    {
        os << "    " << m_doc << "\n";
    }
}

} // namespace stagedag
