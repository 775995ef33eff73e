/**
 * @file key_emit.hpp
 * @brief Source and documentation text for keys.
 */
#pragma once
#include "stagedag/keys/eval_context.hpp"
#include "stagedag/keys/key.hpp"

namespace stagedag
{

/**
 * @brief C++ expression reproducing the key's resolved value in @p ctx.
 * @throws KeyError with `UnresolvedKeyInvariant` if the key is unbound.
 */
std::string serialize(const AnyKey& key, const EvalContext& ctx);

/**
 * @brief One-line summary: name, type, stage, default and help text.
 */
std::string describe(const AnyKey& key);

/**
 * @brief Documentation block for a help page.
 */
std::string emit(const AnyKey& key);

/**
 * @brief `name=value`, marked ` (default)` when the value was default-filled,
 * or `name is unset` when @p ctx has no binding.
 */
std::string describe_binding(const AnyKey& key, const EvalContext& ctx);

} // namespace stagedag
