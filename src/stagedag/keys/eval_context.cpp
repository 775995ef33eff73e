/**
 * @file eval_context.cpp
 */
#include "stagedag/keys/eval_context.hpp"
#include "stagedag/common/log.hpp"

namespace stagedag
{

const char* provenance_name(Provenance provenance) noexcept
{
    switch (provenance)
    {
    case Provenance::CommandLine:
        return "command line";
    case Provenance::Default:
        return "default";
    case Provenance::Explicit:
        return "explicit";
    }
    return "???";
}

void EvalContext::bind(const AnyKey& key, ValueCell value, Provenance provenance)
{
    if (value.type() != key.info().value_type())
    {
        throw KeyError(
            KeyErrorCode::TypeMismatch, key.name(),
            "Cannot bind a value of type " + std::string{value.type().name()} +
                " to key '" + key.name() + "' of type " + key.info().type_name());
    }
    auto [it, inserted] = m_bindings.emplace(key.name(), Binding{key, std::move(value), provenance});
    if (!inserted)
    {
        throw KeyError(
            KeyErrorCode::AlreadyBound, key.name(),
            "Key '" + key.name() + "' is already bound (from " +
                provenance_name(it->second.provenance) + ")");
    }
    STAGEDAG_LOG_TRACE("keys", "Bound '" << key.name() << "' from "
                                   << provenance_name(provenance));
}

const EvalContext::Binding* EvalContext::find(const std::string& name) const
{
    auto it = m_bindings.find(name);
    if (it == m_bindings.end())
    {
        return nullptr;
    }
    return &it->second;
}

size_t EvalContext::fill_defaults(const KeySet& keys)
{
    size_t filled = 0;
    for (const auto& key : keys)
    {
        if (!is_bound(key))
        {
            bind(key, key.info().default_cell(), Provenance::Default);
            ++filled;
        }
    }
    return filled;
}

std::vector<std::string> EvalContext::bound_names() const
{
    std::vector<std::string> names;
    names.reserve(m_bindings.size());
    for (const auto& [name, binding] : m_bindings)
    {
        names.push_back(name);
    }
    return names;
}

} // namespace stagedag
