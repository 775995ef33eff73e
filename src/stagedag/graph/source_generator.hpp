/**
 * @file source_generator.hpp
 * @brief Generated C++ source for an evaluated Graph.
 */
#pragma once
#include "stagedag/common/common.hpp"
#include "stagedag/graph/graph.hpp"
#include "stagedag/keys/eval_context.hpp"

namespace stagedag
{

struct SourceOptions
{
    /// Namespace wrapping every generated binding.
    std::string namespace_name{"stagedag_gen"};
};

/**
 * @brief Emit a header defining one binding per key and per node.
 *
 * @details
 * Keys become `key_<identifier>` constants holding their resolved value in
 * @p ctx, in name order. Keys with a run-time stage are also listed in a
 * `runtime_keys` table. Nodes follow in topological order as `vertex_<idx>`,
 * `node_<identifier>_<idx>` or `app_<idx>`: vertices bind
 * their payload, configurables call their constructor with their argument
 * bindings (by position) followed by their key bindings (by name), and apps
 * call their base binding with their argument bindings. `root()` returns the
 * last binding.
 *
 * The same graph and context always produce the same text.
 *
 * @throws GraphError with `CyclicGraph` if the graph has a cycle.
 * @throws KeyError with `UnresolvedKeyInvariant` if a key of the graph is
 *         unbound in @p ctx, or `IllegalKeyName` for a configurable name
 *         with no identifier form.
 */
std::string generate_source(const Graph& graph, const EvalContext& ctx,
                            const SourceOptions& options = SourceOptions{});

} // namespace stagedag
