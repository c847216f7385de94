/**
 * @file errors.cpp
 */
#include "jobtmpl/common/errors.hpp"

namespace jobtmpl
{

const char* error_code_name(ErrorCode code) noexcept
{
    switch (code)
    {
    case ErrorCode::Validation:
        return "ValidationError";
    case ErrorCode::CyclicDependency:
        return "CyclicDependencyError";
    case ErrorCode::FormatString:
        return "FormatStringError";
    case ErrorCode::RangeExpansion:
        return "RangeExpansionError";
    case ErrorCode::AssociationCardinality:
        return "AssociationCardinalityError";
    case ErrorCode::UnresolvedReference:
        return "UnresolvedReferenceError";
    case ErrorCode::PathMapping:
        return "PathMappingError";
    case ErrorCode::SessionSetup:
        return "SessionSetupError";
    case ErrorCode::ActionTimeout:
        return "ActionTimeoutError";
    case ErrorCode::ActionFailure:
        return "ActionFailureError";
    }
    return "UnknownError";
}

void throw_error(ErrorCode code, std::string message)
{
    switch (code)
    {
    case ErrorCode::Validation:
        throw ValidationError(std::move(message));
    case ErrorCode::CyclicDependency:
        throw CyclicDependencyError(std::move(message));
    case ErrorCode::FormatString:
        throw FormatStringError(std::move(message));
    case ErrorCode::RangeExpansion:
        throw RangeExpansionError(std::move(message));
    case ErrorCode::AssociationCardinality:
        throw AssociationCardinalityError(std::move(message));
    case ErrorCode::UnresolvedReference:
        throw UnresolvedReferenceError(std::move(message));
    case ErrorCode::PathMapping:
        throw PathMappingError(std::move(message));
    case ErrorCode::SessionSetup:
        throw SessionSetupError(std::move(message));
    case ErrorCode::ActionTimeout:
        throw ActionTimeoutError(std::move(message));
    case ErrorCode::ActionFailure:
        throw ActionFailureError(std::move(message));
    }
    throw JobTemplateError(code, std::move(message));
}

} // namespace jobtmpl
