/**
 * @file tool_options.cpp
 */
#include "stagedag/tool/tool_options.hpp"
#include "stagedag/keys/key_emit.hpp"

namespace stagedag
{

namespace
{

bool is_verbose_flag(const std::string& arg)
{
    if (arg == "--verbose")
    {
        return true;
    }
    // -v, -vv, -vvv ...
    if (arg.size() < 2 || arg[0] != '-' || arg[1] != 'v')
    {
        return false;
    }
    return arg.find_first_not_of('v', 1) == std::string::npos;
}

} // namespace

ToolOptions parse_tool_options(const ArgList& args)
{
    ToolOptions options;

    if (args.empty())
    {
        throw std::invalid_argument("missing command, expected 'configure' or 'describe'");
    }

    size_t i = 0;
    if (args[0] == "-h" || args[0] == "--help")
    {
        options.help = true;
        ++i;
    }
    else if (args[0] == "configure")
    {
        options.command = ToolCommand::Configure;
        ++i;
    }
    else if (args[0] == "describe")
    {
        options.command = ToolCommand::Describe;
        ++i;
    }
    else
    {
        throw std::invalid_argument("unknown command '" + args[0] +
                                    "', expected 'configure' or 'describe'");
    }

    bool after_separator = false;
    for (; i < args.size(); ++i)
    {
        const std::string& arg = args[i];
        if (after_separator)
        {
            options.key_args.push_back(arg);
            continue;
        }
        if (arg == "--")
        {
            after_separator = true;
            options.key_args.push_back(arg);
        }
        else if (is_verbose_flag(arg))
        {
            options.verbosity += arg == "--verbose" ? 1 : arg.size() - 1;
        }
        else if (arg == "-h" || arg == "--help")
        {
            options.help = true;
        }
        else if (arg == "--eval")
        {
            options.eval = true;
        }
        else if (arg == "--dot")
        {
            options.dot = true;
        }
        else if (arg == "-o" || arg == "--output")
        {
            if (i + 1 >= args.size())
            {
                throw std::invalid_argument("option '" + arg + "' needs an argument");
            }
            options.output = args[++i];
        }
        else if (arg.rfind("--output=", 0) == 0)
        {
            options.output = arg.substr(9);
        }
        else if (arg.size() > 2 && arg.rfind("-o", 0) == 0)
        {
            options.output = arg.substr(2);
        }
        else
        {
            options.key_args.push_back(arg);
        }
    }

    if (options.command == ToolCommand::Configure && (options.eval || options.dot))
    {
        throw std::invalid_argument("options '--eval' and '--dot' only apply to 'describe'");
    }
    return options;
}

std::string tool_usage(const KeySet& keys)
{
    std::ostringstream oss;
    oss << "usage: stagedag_tool <configure|describe> [OPTION]... [KEY OPTION]...\n"
        << "\n"
        << "COMMON OPTIONS\n"
        << "  -v, --verbose     Increase verbosity (repeatable)\n"
        << "  -o, --output=FILE Write output to FILE instead of standard output\n"
        << "  -h, --help        Show this help\n"
        << "\n"
        << "DESCRIBE OPTIONS\n"
        << "  --eval            Fully evaluate, filling defaults\n"
        << "  --dot             Print the graph as Graphviz dot text\n";
    if (!keys.empty())
    {
        oss << "\n";
        for (const auto& key : keys)
        {
            oss << emit(key);
        }
    }
    return oss.str();
}

} // namespace stagedag
