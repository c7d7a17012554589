#include "stepview/config/command_line.hpp"
#include "stepview/config/step_record_loader.hpp"
#include "stepview/render/step_renderer.hpp"

#include <iostream>
#include <stdexcept>

namespace
{

constexpr int usage_exit_code = 2;

void log_verbose(bool verbose, const std::string& message)
{
    if (verbose)
    {
        std::cerr << "[stepview] " << message << "\n" << std::flush;
    }
}

} // namespace

int main(int argc, char** argv)
{
    try
    {
        stepview::CommandLineOptions options = stepview::parse_command_line(argc, argv);
        if (options.help)
        {
            std::cout << stepview::usage_text() << std::flush;
            return EXIT_SUCCESS;
        }

        log_verbose(options.verbose, "loading " + options.yaml_path);
        stepview::StepRecord record = stepview::load_step_record(options.yaml_path);
        log_verbose(options.verbose,
                    "step '" + record.name + "': " + std::to_string(record.inputs.size()) +
                        " input(s), " + std::to_string(record.outputs.size()) + " output(s)");

        stepview::RenderOptions render_options;
        render_options.simple = options.simple;
        log_verbose(options.verbose, options.simple ? "rendering simple diagram" : "rendering diagram");

        std::cout << stepview::render_step(record, render_options) << std::flush;
    }
    catch (const stepview::UsageError& e)
    {
        std::cerr << e.usage() << "\nstepview: error: " << e.what() << "\n" << std::flush;
        return usage_exit_code;
    }
    catch (const stepview::StepViewError& e)
    {
        std::cerr << "\nError (" << stepview::to_string(e.code()) << "):\n" << e.what() << "\n"
                  << std::flush;
        return EXIT_FAILURE;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\nError:\n" << e.what() << "\n" << std::flush;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
