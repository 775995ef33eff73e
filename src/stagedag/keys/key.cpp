/**
 * @file key.cpp
 */
#include "stagedag/keys/key.hpp"
#include "stagedag/common/log.hpp"

namespace stagedag
{

const char* stage_name(Stage stage) noexcept
{
    switch (stage)
    {
    case Stage::Configure:
        return "configure";
    case Stage::Run:
        return "run";
    case Stage::Both:
        return "both";
    }
    return "???";
}

std::string to_identifier(const std::string& name)
{
    std::string out;
    out.reserve(name.size());
    for (char c : name)
    {
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
            c == '_')
        {
            out += c;
        }
        else if (c == '-')
        {
            out += '_';
        }
    }
    if (out.empty() || (out[0] >= '0' && out[0] <= '9'))
    {
        throw KeyError(
            KeyErrorCode::IllegalKeyName, name,
            "'" + name + "' has no valid identifier form");
    }
    return out;
}

AnyKey::AnyKey(std::shared_ptr<const KeyInfo> info)
    : m_info(std::move(info))
{
    if (!m_info)
    {
        throw std::invalid_argument("AnyKey requires key information");
    }
}

KeySet filter_stage(Stage stage, const KeySet& keys)
{
    if (stage == Stage::Both)
    {
        return keys;
    }
    KeySet result;
    for (const auto& key : keys)
    {
        if (key.stage() == stage || key.stage() == Stage::Both)
        {
            result.insert(key);
        }
    }
    return result;
}

std::optional<AnyKey> KeyRegistry::find(const std::string& name) const
{
    auto it = m_keys.find(name);
    if (it == m_keys.end())
    {
        return std::nullopt;
    }
    return it->second;
}

KeySet KeyRegistry::keys() const
{
    KeySet result;
    for (const auto& [name, key] : m_keys)
    {
        result.insert(key);
    }
    return result;
}

void KeyRegistry::register_key(const AnyKey& key)
{
    std::string identifier = to_identifier(key.name());

    if (m_keys.count(key.name()) > 0)
    {
        throw KeyError(
            KeyErrorCode::DuplicateKeyName, key.name(),
            "A key named '" + key.name() + "' already exists");
    }
    auto clash = m_identifiers.find(identifier);
    if (clash != m_identifiers.end())
    {
        throw KeyError(
            KeyErrorCode::DuplicateKeyName, key.name(),
            "Key '" + key.name() + "' has the same identifier '" + identifier +
                "' as key '" + clash->second + "'");
    }
    m_keys.emplace(key.name(), key);
    m_identifiers.emplace(identifier, key.name());
    STAGEDAG_LOG_DEBUG("keys", "Registered key '" << key.name() << "' ("
                                   << key.info().description() << ", stage "
                                   << stage_name(key.stage()) << ")");
}

} // namespace stagedag
