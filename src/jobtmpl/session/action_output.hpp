/**
 * @file action_output.hpp
 * @brief Recognition of directive lines printed by running actions.
 */
#pragma once
#include "jobtmpl/common/common.hpp"

namespace jobtmpl
{

enum class DirectiveKind
{
    None,      ///< Ordinary output line.
    SetEnv,    ///< `jobtmpl_env: NAME=VALUE`
    UnsetEnv,  ///< `jobtmpl_unset_env: NAME`
    Progress,  ///< `jobtmpl_progress: <0-100>`
    Status,    ///< `jobtmpl_status: <message>`
    Fail,      ///< `jobtmpl_fail: <message>`
    Malformed  ///< Directive prefix with an unusable payload.
};

struct OutputDirective
{
    DirectiveKind kind{DirectiveKind::None};
    /// Variable name (SetEnv, UnsetEnv).
    std::string name;
    /// Variable value, status or failure message, or the problem for Malformed.
    std::string text;
    /// Percentage in [0, 100] (Progress).
    double progress{0.0};
};

/**
 * @brief Classify one line of action output.
 *
 * @details
 * A directive must start at the beginning of the line; leading and trailing
 * whitespace around the payload is ignored, as is a trailing carriage return.
 */
OutputDirective parse_output_directive(const std::string& line);

/**
 * @brief Splits a byte stream into lines.
 */
class LineSplitter
{
public:
    /**
     * @brief Append bytes and return every line they complete.
     */
    std::vector<std::string> feed(const char* data, size_t size);

    /**
     * @brief The trailing partial line, if any; clears it.
     */
    std::optional<std::string> flush();

private:
    std::string m_pending;
};

} // namespace jobtmpl
