/**
 * @file stepview_exceptions.hpp
 */
#pragma once
#include "stepview/common/common.hpp"

namespace stepview
{

/**
 * @brief Error codes for loading and rendering a step record.
 */
enum class StepViewErrorCode
{
    MissingRequiredField,
    MalformedInput,
    FileNotFound
};

/**
 * @brief Get a short name for an error code, for use in messages.
 */
inline const char* to_string(StepViewErrorCode code) noexcept
{
    switch (code)
    {
        case StepViewErrorCode::MissingRequiredField:
            return "missing required field";
        case StepViewErrorCode::MalformedInput:
            return "malformed input";
        case StepViewErrorCode::FileNotFound:
            return "file not found";
    }
    return "unknown error";
}

/**
 * @brief Exception class for step record errors.
 *
 * @details
 * `StepViewError` is thrown when the configuration source cannot be turned
 * into a `StepRecord`: the file cannot be read, the YAML cannot be parsed,
 * a key holds the wrong kind of node, or a required field is absent.
 * Absent optional collections are never reported through this exception.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class StepViewError : public std::exception
{
public:
    /**
     * @brief Construct a StepViewError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     */
    StepViewError(StepViewErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    /**
     * @brief Get the error code.
     * @return The error code for this exception.
     */
    StepViewErrorCode code() const noexcept
    {
        return m_code;
    }

    /**
     * @brief Get the error message.
     * @return A C-string describing the error.
     */
    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    StepViewErrorCode m_code;
    std::string m_message;
};

/**
 * @brief Exception thrown when the command line is malformed.
 *
 * @details
 * Carries the usage banner so the caller can print it next to the message.
 */
class UsageError : public std::runtime_error
{
public:
    UsageError(const std::string& msg, std::string usage)
        : std::runtime_error(msg)
        , m_usage(std::move(usage))
    {}

    /**
     * @brief Get the usage banner to print with this error.
     */
    const std::string& usage() const noexcept
    {
        return m_usage;
    }

private:
    std::string m_usage;
};

} // namespace stepview
