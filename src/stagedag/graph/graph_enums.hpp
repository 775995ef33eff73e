/**
 * @file graph_enums.hpp
 */
#pragma once
#include "stagedag/common/common.hpp"

namespace stagedag
{

/**
 * @brief Type alias for node indices.
 *
 * @details
 * `NodeIdx` is a type alias for `size_t`. Nodes are numbered densely in the
 * order they are added to a Graph.
 */
using NodeIdx = size_t;

/**
 * @brief Kinds of graph nodes.
 */
enum class NodeKind
{
    Vertex,        ///< Opaque leaf data.
    Configurable,  ///< A component with keys and ordered argument children.
    App            ///< A configurable applied to argument nodes.
};

/**
 * @brief Kinds of graph edges.
 *
 * @details
 * Every edge points from a dependent node to the node it depends on. The
 * dependency is evaluated and emitted first.
 */
enum class EdgeKind
{
    Functor,        ///< From an App to the configurable it applies.
    Argument,       ///< Ordered argument; position is significant.
    DataDependency  ///< Unordered extra requirement.
};

/**
 * @brief Trust levels used when blaming edges for a cycle.
 *
 * @details
 * Functor and argument edges are structural and High; data dependencies
 * are user supplied and Low. Lower trust is blamed first.
 */
enum class TrustLevel
{
    Low,
    High
};

const char* node_kind_name(NodeKind kind) noexcept;

const char* edge_kind_name(EdgeKind kind) noexcept;

} // namespace stagedag
