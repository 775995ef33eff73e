/**
 * @file graph_diagnostics.hpp
 */
#pragma once
#include "stagedag/common/common.hpp"
#include "stagedag/graph/graph_enums.hpp"

namespace stagedag
{

enum class DiagnosticSeverity
{
    Warning,  ///< Non-blocking issue that may indicate a problem.
    Error     ///< Blocking issue that prevents evaluation.
};

enum class DiagnosticCategory
{
    Cycle,      ///< The edges form a cycle.
    UnusedNode  ///< A node other than the final one has no dependents.
};

/**
 * @brief A single diagnostic item (error or warning).
 *
 * @details
 * `blamed_edges` holds indices into `Graph::edges()`, ordered by suspicion
 * (lower trust first).
 */
struct DiagnosticItem
{
    DiagnosticSeverity severity;
    DiagnosticCategory category;
    std::string message;
    std::vector<NodeIdx> involved_nodes;
    std::vector<size_t> blamed_edges;
};

/**
 * @brief Diagnostics collected from a Graph by `Graph::get_diagnostics()`.
 *
 * @par Thread safety
 * - Once constructed, the data is immutable.
 */
class GraphDiagnostics
{
public:
    bool has_errors() const noexcept
    {
        return !m_errors.empty();
    }

    bool has_warnings() const noexcept
    {
        return !m_warnings.empty();
    }

    bool is_valid() const noexcept
    {
        return m_errors.empty();
    }

    const std::vector<DiagnosticItem>& errors() const noexcept
    {
        return m_errors;
    }

    const std::vector<DiagnosticItem>& warnings() const noexcept
    {
        return m_warnings;
    }

    // Allow Graph to populate diagnostics
    friend class Graph;

private:
    std::vector<DiagnosticItem> m_errors;
    std::vector<DiagnosticItem> m_warnings;
};

} // namespace stagedag
