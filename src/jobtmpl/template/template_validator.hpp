/**
 * @file template_validator.hpp
 * @brief Semantic validation and cross-referencing of Job Templates.
 */
#pragma once
#include "jobtmpl/common/common.hpp"
#include "jobtmpl/common/diagnostics.hpp"
#include "jobtmpl/template/job_template.hpp"

namespace jobtmpl
{

/**
 * @brief Outcome of validating a template document.
 *
 * @details
 * `job_template` is set only when `diagnostics` holds no errors; in that case
 * every name-based reference in it has been resolved to a handle.
 */
struct ValidationResult
{
    Diagnostics diagnostics;
    std::shared_ptr<const JobTemplate> job_template;

    bool ok() const noexcept
    {
        return job_template != nullptr && diagnostics.is_valid();
    }
};

/**
 * @brief Check a parsed template and bind its references in place.
 *
 * @details
 * Checks, in order:
 * - names: identifier syntax and uniqueness per namespace;
 * - parameter constraints (through the per-type dispatch table);
 * - step dependencies: unknown, duplicate and self references, then cycles;
 * - task parameter ranges and combination expressions, including static
 *   association cardinality when every range is a literal;
 * - format string references against the scope of each field.
 *
 * Problems are appended to `diagnostics`; nothing is thrown for document
 * problems.
 */
void check_job_template(JobTemplate& tmpl, Diagnostics& diagnostics);

/**
 * @brief Parse and validate a template document (YAML or JSON text).
 */
ValidationResult validate(const std::string& document);

/**
 * @brief Read, parse and validate a template file.
 */
ValidationResult validate_file(const std::filesystem::path& file);

/**
 * @brief Validate and return the template, or throw.
 * @throw ValidationError, CyclicDependencyError, FormatStringError,
 *        RangeExpansionError or AssociationCardinalityError matching the
 *        first error found.
 */
std::shared_ptr<const JobTemplate> validate_or_throw(const std::string& document);

} // namespace jobtmpl
