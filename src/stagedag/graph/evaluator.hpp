/**
 * @file evaluator.hpp
 * @brief Resolves the keys and value expressions of every node in a Graph.
 */
#pragma once
#include "stagedag/common/common.hpp"
#include "stagedag/graph/graph.hpp"
#include "stagedag/keys/eval_context.hpp"

namespace stagedag
{

enum class EvalMode
{
    Partial,  ///< Record only what is already resolvable; never fill defaults.
    Full      ///< Fill defaults, then resolve everything.
};

const char* eval_mode_name(EvalMode mode) noexcept;

/**
 * @brief What evaluation resolved for one node.
 */
struct NodeEvaluation
{
    /// Resolved keys of the node, by key name.
    std::map<std::string, ValueCell> keys;

    /// Names of keys that were not resolvable (Partial mode only).
    std::vector<std::string> unresolved_keys;

    /**
     * @brief Results of the node's value expressions, parallel to
     * `ConfigurableInfo::values`.
     * @details nullopt marks an expression that could not be resolved yet.
     */
    std::vector<std::optional<ValueCell>> values;
};

/**
 * @brief Result of evaluating a graph against a context.
 */
struct Evaluation
{
    EvalMode mode{EvalMode::Partial};

    /// Nodes in the order they were evaluated.
    std::vector<NodeIdx> order;

    /// Per-node results, indexed by NodeIdx.
    std::vector<NodeEvaluation> nodes;

    /// Number of keys bound from their defaults during this evaluation.
    size_t defaults_filled{0};

    /**
     * @brief Resolved value of key @p name on node @p idx.
     * @return nullptr if the node has no resolved key of that name.
     */
    const ValueCell* key_value(NodeIdx idx, const std::string& name) const
    {
        if (idx >= nodes.size())
        {
            return nullptr;
        }
        auto it = nodes[idx].keys.find(name);
        return it == nodes[idx].keys.end() ? nullptr : &it->second;
    }

    size_t resolved_key_count() const
    {
        size_t count = 0;
        for (const auto& node : nodes)
        {
            count += node.keys.size();
        }
        return count;
    }

    size_t unresolved_key_count() const
    {
        size_t count = 0;
        for (const auto& node : nodes)
        {
            count += node.unresolved_keys.size();
        }
        return count;
    }

    /**
     * @brief Get a summary string for logging.
     */
    std::string summary() const
    {
        std::string result = std::string{mode == EvalMode::Full ? "Full" : "Partial"} +
                             " evaluation of " + std::to_string(order.size()) + " node(s)";
        result += " (resolved=" + std::to_string(resolved_key_count());
        result += ", unresolved=" + std::to_string(unresolved_key_count());
        result += ", defaults=" + std::to_string(defaults_filled) + ")";
        return result;
    }
};

/**
 * @brief Resolve every node of @p graph in topological order.
 *
 * @details
 * `Partial` peeks each key and value expression and records only those
 * already resolvable; @p ctx is left untouched. `Full` first binds the
 * default of every unbound key of the graph into @p ctx, then evaluates
 * everything.
 *
 * @throws GraphError with `CyclicGraph` if the graph has a cycle.
 * @throws KeyError with `UnresolvedKeyInvariant` if a full evaluation meets
 *         an unbound key.
 */
Evaluation evaluate(const Graph& graph, EvalContext& ctx, EvalMode mode);

} // namespace stagedag
