/**
 * @file errors.hpp
 */
#pragma once
#include "jobtmpl/common/common.hpp"

namespace jobtmpl
{

struct Diagnostic;

/**
 * @brief Error codes shared by exceptions and validation diagnostics.
 *
 * @details
 * Codes up to and including `PathMapping` are pre-execution errors: they are
 * detected before any Session starts. The remaining codes arise while a
 * Session runs.
 */
enum class ErrorCode
{
    Validation,
    CyclicDependency,
    FormatString,
    RangeExpansion,
    AssociationCardinality,
    UnresolvedReference,
    PathMapping,
    SessionSetup,
    ActionTimeout,
    ActionFailure
};

/**
 * @brief Get a stable name for an error code, e.g. `"CyclicDependencyError"`.
 */
const char* error_code_name(ErrorCode code) noexcept;

/**
 * @brief Base exception class for all engine errors.
 *
 * @details
 * `JobTemplateError` carries an error code and a descriptive message. The
 * message always names the offending entity (parameter, step, action or
 * placeholder text). Subclasses below exist so that callers can catch one
 * category precisely; they do not add state.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class JobTemplateError : public std::exception
{
public:
    /**
     * @brief Construct a JobTemplateError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     */
    JobTemplateError(ErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    /**
     * @brief Get the error code.
     */
    ErrorCode code() const noexcept
    {
        return m_code;
    }

    /**
     * @brief Get the error message.
     */
    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    ErrorCode m_code;
    std::string m_message;
};

/**
 * @brief Schema or referential problem in a template or its inputs.
 *
 * @details
 * When raised from a validation run, `diagnostics()` holds every error that
 * was found, not only the one summarized by `what()`.
 */
class ValidationError : public JobTemplateError
{
public:
    explicit ValidationError(std::string message)
        : JobTemplateError(ErrorCode::Validation, std::move(message))
    {
    }

    ValidationError(std::string message, std::shared_ptr<const std::vector<Diagnostic>> diagnostics)
        : JobTemplateError(ErrorCode::Validation, std::move(message))
        , m_diagnostics(std::move(diagnostics))
    {
    }

    /**
     * @brief Diagnostics collected by the validation run, or nullptr.
     */
    const std::shared_ptr<const std::vector<Diagnostic>>& diagnostics() const noexcept
    {
        return m_diagnostics;
    }

private:
    std::shared_ptr<const std::vector<Diagnostic>> m_diagnostics;
};

class CyclicDependencyError : public JobTemplateError
{
public:
    explicit CyclicDependencyError(std::string message)
        : JobTemplateError(ErrorCode::CyclicDependency, std::move(message))
    {
    }
};

class FormatStringError : public JobTemplateError
{
public:
    explicit FormatStringError(std::string message)
        : JobTemplateError(ErrorCode::FormatString, std::move(message))
    {
    }
};

class RangeExpansionError : public JobTemplateError
{
public:
    explicit RangeExpansionError(std::string message)
        : JobTemplateError(ErrorCode::RangeExpansion, std::move(message))
    {
    }
};

class AssociationCardinalityError : public JobTemplateError
{
public:
    explicit AssociationCardinalityError(std::string message)
        : JobTemplateError(ErrorCode::AssociationCardinality, std::move(message))
    {
    }
};

class UnresolvedReferenceError : public JobTemplateError
{
public:
    explicit UnresolvedReferenceError(std::string message)
        : JobTemplateError(ErrorCode::UnresolvedReference, std::move(message))
    {
    }
};

class PathMappingError : public JobTemplateError
{
public:
    explicit PathMappingError(std::string message)
        : JobTemplateError(ErrorCode::PathMapping, std::move(message))
    {
    }
};

class SessionSetupError : public JobTemplateError
{
public:
    explicit SessionSetupError(std::string message)
        : JobTemplateError(ErrorCode::SessionSetup, std::move(message))
    {
    }
};

class ActionTimeoutError : public JobTemplateError
{
public:
    explicit ActionTimeoutError(std::string message)
        : JobTemplateError(ErrorCode::ActionTimeout, std::move(message))
    {
    }
};

class ActionFailureError : public JobTemplateError
{
public:
    explicit ActionFailureError(std::string message)
        : JobTemplateError(ErrorCode::ActionFailure, std::move(message))
    {
    }
};

/**
 * @brief Throw the exception subclass matching `code`.
 */
[[noreturn]] void throw_error(ErrorCode code, std::string message);

} // namespace jobtmpl
