/**
 * @file forest_exceptions.hpp
 */
#pragma once
#include "issueforest/common/common.hpp"
#include "issueforest/common/forest_diagnostics.hpp"

namespace issueforest
{

/**
 * @brief Error codes for issueforest operations.
 */
enum class ForestErrorCode
{
    InvalidNodeIndex,
    CyclicDependency,
    ParseFailed,
    ConfigurationError
};

/**
 * @brief Exception class for issueforest errors.
 *
 * @details
 * `ForestError` is thrown when a forest cannot be built, an arena index is out
 * of range, or an input or configuration file cannot be read. Each exception
 * carries an error code and a descriptive message.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class ForestError : public std::exception
{
public:
    /**
     * @brief Construct a ForestError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     */
    ForestError(ForestErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    ForestErrorCode code() const noexcept
    {
        return m_code;
    }

    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    ForestErrorCode m_code;
    std::string m_message;
};

/**
 * @brief Thrown by ForestBuilder::build() when the parent-child hierarchy has a cycle.
 *
 * @details
 * No partial forest exists when this is thrown. `path()` lists the issue IDs of
 * the cycle from the re-entry point through the point of detection, so the
 * first and last entries are the same ID.
 */
class CyclicDependencyError : public ForestError
{
public:
    CyclicDependencyError(std::vector<std::string> path,
                          std::shared_ptr<ForestDiagnostics> diagnostics)
        : ForestError(ForestErrorCode::CyclicDependency, describe(path))
        , m_path(std::move(path))
        , m_diagnostics(std::move(diagnostics))
    {
    }

    /**
     * @brief The offending issue ID path.
     */
    const std::vector<std::string>& path() const noexcept
    {
        return m_path;
    }

    /**
     * @brief Diagnostics gathered up to and including the cycle.
     */
    const std::shared_ptr<ForestDiagnostics>& diagnostics() const noexcept
    {
        return m_diagnostics;
    }

private:
    static std::string describe(const std::vector<std::string>& path)
    {
        std::string msg = "cyclic dependency detected: [";
        for (size_t i = 0; i < path.size(); ++i)
        {
            if (i > 0)
            {
                msg += " ";
            }
            msg += path[i];
        }
        msg += "]";
        return msg;
    }

    std::vector<std::string> m_path;
    std::shared_ptr<ForestDiagnostics> m_diagnostics;
};

} // namespace issueforest
