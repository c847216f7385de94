/**
 * @file diagnostics.hpp
 */
#pragma once
#include "jobtmpl/common/common.hpp"
#include "jobtmpl/common/errors.hpp"

namespace jobtmpl
{

// ============================================================================
// Diagnostic item types
// ============================================================================

/**
 * @brief Severity level for diagnostic items.
 */
enum class DiagnosticSeverity
{
    Warning,  ///< Non-blocking issue that may indicate a problem.
    Error     ///< Blocking issue that prevents the template from being used.
};

/**
 * @brief A single diagnostic item (error or warning).
 *
 * @details
 * `location` is a dotted path into the template document, for example
 * `steps[1].script.actions.onRun.args[0]`. `line` and `column` are 1-based
 * positions in the source text, or -1 when the parser could not tell.
 */
struct Diagnostic
{
    DiagnosticSeverity severity{DiagnosticSeverity::Error};
    ErrorCode code{ErrorCode::Validation};
    std::string location;
    std::string message;
    int line{-1};
    int column{-1};

    /**
     * @brief Render as `location: message` with the position when known.
     */
    std::string to_string() const
    {
        std::string result = location.empty() ? std::string("<document>") : location;
        if (line >= 0)
        {
            result += " (line " + std::to_string(line) + ", column " + std::to_string(column) + ")";
        }
        result += ": ";
        result += message;
        return result;
    }
};

// ============================================================================
// Diagnostics
// ============================================================================

/**
 * @brief Ordered collection of diagnostics produced by parsing and validation.
 *
 * @details
 * Items keep the order in which they were reported, which follows document
 * order within each validation phase.
 *
 * @par Error vs Warning
 * - **Errors** block use of the template (expansion, job creation, sessions).
 * - **Warnings** are informational, for example an ignored `userInterface`
 *   block that is not a mapping.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Concurrent reads are safe once populated.
 */
class Diagnostics
{
public:
    /**
     * @brief Check if any error was reported.
     */
    bool has_errors() const noexcept
    {
        return m_error_count > 0;
    }

    /**
     * @brief Check if any warning was reported.
     */
    bool has_warnings() const noexcept
    {
        return m_items.size() > m_error_count;
    }

    /**
     * @brief Check if the collection contains no errors (warnings are allowed).
     */
    bool is_valid() const noexcept
    {
        return m_error_count == 0;
    }

    /**
     * @brief All items in report order.
     */
    const std::vector<Diagnostic>& items() const noexcept
    {
        return m_items;
    }

    /**
     * @brief Error items only, in report order.
     */
    std::vector<Diagnostic> errors() const
    {
        std::vector<Diagnostic> result;
        for (const auto& item : m_items)
        {
            if (item.severity == DiagnosticSeverity::Error)
            {
                result.push_back(item);
            }
        }
        return result;
    }

    /**
     * @brief Warning items only, in report order.
     */
    std::vector<Diagnostic> warnings() const
    {
        std::vector<Diagnostic> result;
        for (const auto& item : m_items)
        {
            if (item.severity == DiagnosticSeverity::Warning)
            {
                result.push_back(item);
            }
        }
        return result;
    }

    void add(Diagnostic item)
    {
        if (item.severity == DiagnosticSeverity::Error)
        {
            ++m_error_count;
        }
        m_items.push_back(std::move(item));
    }

    void add_error(ErrorCode code, std::string location, std::string message,
                   int line = -1, int column = -1)
    {
        add(Diagnostic{DiagnosticSeverity::Error, code, std::move(location),
                       std::move(message), line, column});
    }

    void add_warning(std::string location, std::string message, int line = -1, int column = -1)
    {
        add(Diagnostic{DiagnosticSeverity::Warning, ErrorCode::Validation, std::move(location),
                       std::move(message), line, column});
    }

    /**
     * @brief Append every item of another collection.
     */
    void merge(const Diagnostics& other)
    {
        for (const auto& item : other.m_items)
        {
            add(item);
        }
    }

    /**
     * @brief Check whether an error with the given code was reported.
     */
    bool has_error_code(ErrorCode code) const noexcept
    {
        for (const auto& item : m_items)
        {
            if (item.severity == DiagnosticSeverity::Error && item.code == code)
            {
                return true;
            }
        }
        return false;
    }

    /**
     * @brief Throw the exception matching the first error, if any.
     *
     * @details
     * A `Validation` code raises `ValidationError` carrying a copy of every
     * item; other codes raise their own exception subclass.
     */
    void throw_if_errors() const;

private:
    std::vector<Diagnostic> m_items;
    size_t m_error_count{0};
};

} // namespace jobtmpl
