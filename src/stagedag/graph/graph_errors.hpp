/**
 * @file graph_errors.hpp
 */
#pragma once
#include "stagedag/common/common.hpp"
#include "stagedag/graph/graph_enums.hpp"

namespace stagedag
{

/**
 * @brief Error codes for Graph operations.
 */
enum class GraphErrorCode
{
    InvalidNodeIndex,
    InvalidAppBase,
    CyclicGraph,
    InvariantViolation
};

/**
 * @brief Exception class for Graph errors.
 *
 * @details
 * Thrown when an index is invalid, an App is built over something other
 * than a configurable, or the edges form a cycle. For cycles,
 * `involved_nodes()` lists the nodes that lie on a cycle in ascending
 * index order.
 */
class GraphError : public std::exception
{
public:
    GraphError(GraphErrorCode code, std::string message,
               std::vector<NodeIdx> involved_nodes = {})
        : m_code(code)
        , m_message(std::move(message))
        , m_involved_nodes(std::move(involved_nodes))
    {
    }

    GraphErrorCode code() const noexcept
    {
        return m_code;
    }

    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

    const std::vector<NodeIdx>& involved_nodes() const noexcept
    {
        return m_involved_nodes;
    }

private:
    GraphErrorCode m_code;
    std::string m_message;
    std::vector<NodeIdx> m_involved_nodes;
};

} // namespace stagedag
