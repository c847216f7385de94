/**
 * @file parameter_constraints.hpp
 * @brief Per-type checks for job parameter constraints and values.
 */
#pragma once
#include "jobtmpl/common/common.hpp"
#include "jobtmpl/common/diagnostics.hpp"
#include "jobtmpl/template/job_template.hpp"

namespace jobtmpl
{

/**
 * @brief Check that the constraints of `def` are internally consistent.
 *
 * @details
 * Reports `min > max`, a default or allowed value that violates the other
 * constraints, and a default missing from `allowedValues`. The check for each
 * parameter type comes from a dispatch table indexed by the type tag.
 */
void check_constraint_consistency(const JobParameterDefinition& def, Diagnostics& diagnostics);

/**
 * @brief Check a single value against the constraints of `def`.
 * @return A message describing the first violation, or nullopt if `text` is
 *         acceptable (including membership in `allowedValues`).
 */
std::optional<std::string> find_value_violation(const JobParameterDefinition& def,
                                                const std::string& text);

} // namespace jobtmpl
