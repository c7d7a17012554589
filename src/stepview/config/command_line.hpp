/**
 * @file command_line.hpp
 * @brief Command line options of the stepview tool.
 */
#pragma once
#include "stepview/common/common.hpp"
#include "stepview/common/stepview_exceptions.hpp"

namespace stepview
{

/**
 * @brief Options selected on the command line.
 */
struct CommandLineOptions
{
    /// Path of the step description (`-y`). Empty only when `help` is set.
    std::string yaml_path;

    /// Draw plain arrows instead of labeled edges (`-s`).
    bool simple{false};

    /// Log progress to stderr (`-v`).
    bool verbose{false};

    /// Print the usage banner and exit (`-h`).
    bool help{false};
};

/**
 * @brief Get the usage banner.
 */
const std::string& usage_text();

/**
 * @brief Parse command line arguments.
 *
 * @param args The arguments, not including the program name.
 * @return The parsed options. When `-h` is given the other options are not
 *         validated and `help` is set.
 * @throw UsageError if `-y` is missing, given twice, or lacks a value, or if
 *        an unknown option or a positional argument is present.
 */
CommandLineOptions parse_command_line(const std::vector<std::string>& args);

/**
 * @brief Parse `main()`'s arguments.
 * @see parse_command_line(const std::vector<std::string>&)
 */
CommandLineOptions parse_command_line(int argc, char** argv);

} // namespace stepview
