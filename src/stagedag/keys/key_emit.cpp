/**
 * @file key_emit.cpp
 */
#include "stagedag/keys/key_emit.hpp"
#include "stagedag/common/log.hpp"

namespace stagedag
{

std::string serialize(const AnyKey& key, const EvalContext& ctx)
{
    const EvalContext::Binding* binding = ctx.find(key.name());
    if (binding == nullptr)
    {
        STAGEDAG_LOG_FATAL("codegen", "Key '" << key.name() << "' serialized without a value");
        throw KeyError(
            KeyErrorCode::UnresolvedKeyInvariant, key.name(),
            "Cannot serialize key '" + key.name() + "': it has no resolved value");
    }
    return key.info().serialize_cell(binding->value);
}

std::string describe(const AnyKey& key)
{
    const KeyInfo& info = key.info();
    std::ostringstream oss;
    oss << key.name() << " : " << info.description()
        << " [" << stage_name(key.stage()) << "]"
        << " = " << info.print_cell(info.default_cell());
    if (!info.doc().doc().empty())
    {
        oss << "  # " << info.doc().doc();
    }
    return oss.str();
}

std::string emit(const AnyKey& key)
{
    const KeyInfo& info = key.info();
    std::ostringstream oss;
    info.doc().emit(oss);
    oss << "    Type: " << info.description() << ". Stage: " << stage_name(key.stage())
        << ". Default: '" << info.print_cell(info.default_cell()) << "'.\n";
    return oss.str();
}

std::string describe_binding(const AnyKey& key, const EvalContext& ctx)
{
    const EvalContext::Binding* binding = ctx.find(key.name());
    if (binding == nullptr)
    {
        return key.name() + " is unset";
    }
    std::string text = key.name() + "=" + key.info().print_cell(binding->value);
    if (binding->provenance == Provenance::Default)
    {
        text += " (default)";
    }
    return text;
}

} // namespace stagedag
