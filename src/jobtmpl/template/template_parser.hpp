/**
 * @file template_parser.hpp
 * @brief Structural parsing of Job Template documents with yaml-cpp.
 */
#pragma once
#include "jobtmpl/common/common.hpp"
#include "jobtmpl/common/diagnostics.hpp"
#include "jobtmpl/template/job_template.hpp"

namespace jobtmpl
{

/**
 * @brief Outcome of parsing a template document.
 *
 * @details
 * `job_template` is set only when the document is structurally conformant
 * (no error diagnostics). It is not yet cross-referenced; pass it to
 * `validate_template()`.
 */
struct ParseResult
{
    std::shared_ptr<JobTemplate> job_template;
    Diagnostics diagnostics;
};

/**
 * @brief Parse a YAML or JSON template document.
 *
 * @details
 * Checks schema conformance: recognized `specificationVersion`, required
 * keys, node kinds, scalar formats, enumerations and unknown keys. Parsing
 * continues after a problem so that every structural error is reported.
 * Does not throw for document problems.
 */
ParseResult parse_job_template(const std::string& document);

/**
 * @brief Read and parse a template file.
 * @details An unreadable file yields a single error diagnostic.
 */
ParseResult load_job_template(const std::filesystem::path& file);

} // namespace jobtmpl
