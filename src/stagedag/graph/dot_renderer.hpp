/**
 * @file dot_renderer.hpp
 * @brief Graphviz dot rendering of a Graph.
 */
#pragma once
#include "stagedag/common/common.hpp"
#include "stagedag/graph/graph.hpp"

namespace stagedag
{

/**
 * @brief Render @p graph as a Graphviz digraph.
 *
 * @details
 * Nodes are named `n<idx>`. Vertices are circles, configurables boxes and
 * apps diamonds; a configurable's label lists its keys. Edges point from a
 * dependent to its dependency: functor edges are bold, argument edges are
 * labelled with their position and data dependencies are dashed.
 */
std::string render_dot(const Graph& graph);

} // namespace stagedag
