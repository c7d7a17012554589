/**
 * @file command_line.cpp
 */
#include "stepview/config/command_line.hpp"

#include <algorithm>

namespace stepview
{

namespace
{

const char* const usage_banner =
    "usage: stepview -y <path> [-s] [-v] [-h]\n"
    "\n"
    "Print an ASCII diagram of a resolved pipeline step, followed by its\n"
    "parameters, flags and source path.\n"
    "\n"
    "options:\n"
    "  -h, --help          show this message and exit\n"
    "  -v, --verbose       log progress to stderr\n"
    "  -y, --yaml <path>   step description to render (required)\n"
    "  -s, --simple        draw plain arrows instead of labeled edges\n";

[[noreturn]] void throw_usage(const std::string& msg)
{
    throw UsageError(msg, usage_text());
}

void set_yaml_path(CommandLineOptions& options, const std::string& value)
{
    if (!options.yaml_path.empty())
    {
        throw_usage("option -y/--yaml given more than once");
    }
    if (value.empty())
    {
        throw_usage("option -y/--yaml needs a non-empty path");
    }
    options.yaml_path = value;
}

} // namespace

const std::string& usage_text()
{
    static const std::string text{usage_banner};
    return text;
}

CommandLineOptions parse_command_line(const std::vector<std::string>& args)
{
    CommandLineOptions options;

    if (std::any_of(args.begin(), args.end(), [](const std::string& arg) {
            return arg == "-h" || arg == "--help";
        }))
    {
        options.help = true;
        return options;
    }

    const std::string yaml_eq = "--yaml=";
    for (size_t i = 0; i < args.size(); ++i)
    {
        const std::string& arg = args[i];
        if (arg == "-y" || arg == "--yaml")
        {
            if (i + 1 >= args.size())
            {
                throw_usage("option " + arg + " needs a path");
            }
            set_yaml_path(options, args[++i]);
        }
        else if (arg.compare(0, yaml_eq.size(), yaml_eq) == 0)
        {
            set_yaml_path(options, arg.substr(yaml_eq.size()));
        }
        else if (arg == "-s" || arg == "--simple")
        {
            options.simple = true;
        }
        else if (arg == "-v" || arg == "--verbose")
        {
            options.verbose = true;
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            throw_usage("unknown option " + arg);
        }
        else
        {
            throw_usage("unexpected argument " + arg);
        }
    }

    if (options.yaml_path.empty())
    {
        throw_usage("the following option is required: -y/--yaml");
    }
    return options;
}

CommandLineOptions parse_command_line(int argc, char** argv)
{
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
    {
        args.emplace_back(argv[i]);
    }
    return parse_command_line(args);
}

} // namespace stepview
