/**
 * @file tool_options.hpp
 * @brief Options of stagedag_tool that are not keys.
 */
#pragma once
#include "stagedag/common/common.hpp"
#include "stagedag/keys/key_term.hpp"

namespace stagedag
{

enum class ToolCommand
{
    Configure,  ///< Evaluate configure-stage keys and write generated source.
    Describe    ///< List keys and bindings, or the graph as dot text.
};

struct ToolOptions
{
    ToolCommand command{ToolCommand::Describe};

    /// Number of -v flags.
    size_t verbosity{0};

    /// Output file; empty for standard output.
    std::string output;

    /// describe: full evaluation instead of partial.
    bool eval{false};

    /// describe: dot text instead of the key listing.
    bool dot{false};

    bool help{false};

    /// Arguments after the command, for the key terms.
    ArgList key_args;
};

/**
 * @brief Parse the tool's own options from @p args (program name excluded).
 *
 * @details
 * The first argument is the command. Tool options may appear anywhere after
 * it; everything else is passed through in `key_args`. `-h`/`--help` on its
 * own is accepted without a command.
 *
 * @throws std::invalid_argument for a missing or unknown command, an option
 *         without its value, or `--eval`/`--dot` given to `configure`.
 */
ToolOptions parse_tool_options(const ArgList& args);

/// Usage text, followed by the documentation of @p keys.
std::string tool_usage(const KeySet& keys);

} // namespace stagedag
