/**
 * @file step_record_loader.hpp
 * @brief Builds a StepRecord from a YAML step description.
 */
#pragma once
#include "stepview/common/common.hpp"
#include "stepview/common/step_record.hpp"
#include "stepview/common/stepview_exceptions.hpp"

namespace stepview
{

/**
 * @brief Load a step record from a YAML file.
 *
 * @details
 * Accepts the resolved record written by the graph resolver as well as a
 * plain step `configure.yml`. Keys the renderer has no use for (`commands`,
 * `preconditions`, `postconditions`, `debug`, ...) are ignored.
 *
 * @param path Path of the YAML file.
 * @return The loaded record.
 * @throw StepViewError with `FileNotFound` if the file cannot be opened,
 *        `MalformedInput` if it is not valid YAML or a key holds the wrong
 *        kind of node, or `MissingRequiredField` if `name` or `source` is absent.
 */
StepRecord load_step_record(const std::string& path);

/**
 * @brief Load a step record from YAML text.
 * @param text The YAML document.
 * @param origin Name used for the document in error messages.
 * @throw StepViewError as for `load_step_record()`, except `FileNotFound`.
 */
StepRecord load_step_record_from_string(const std::string& text,
                                        const std::string& origin = "<string>");

} // namespace stepview
