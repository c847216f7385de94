/**
 * @file embedded_files.hpp
 * @brief Writing embedded files into a Session working directory.
 */
#pragma once
#include "jobtmpl/common/common.hpp"
#include "jobtmpl/format/resolver.hpp"
#include "jobtmpl/template/job_template.hpp"

namespace jobtmpl
{

/**
 * @brief Choose the on-disk path of each file in `files` inside `directory`.
 *
 * @details
 * A declared `filename` is used as is; otherwise the file's `name` is used.
 * Paths never collide: a derived name that clashes with an earlier path gets
 * a numeric suffix. The result is parallel to `files`.
 */
std::vector<std::filesystem::path> plan_embedded_file_paths(const std::vector<EmbeddedFile>& files,
                                                            const std::filesystem::path& directory);

/**
 * @brief Resolve the data of each file and write it to `paths[i]`.
 *
 * @details
 * Creates `directory` (mode 0700) when needed. Runnable files get mode 0700,
 * others 0600. `values` must already hold the file paths for the scope the
 * data may reference (`Task.File.*` or `Env.File.*`).
 *
 * @throw SessionSetupError on any I/O failure.
 * @throw UnresolvedReferenceError if the data references a missing value.
 */
void write_embedded_files(const std::vector<EmbeddedFile>& files,
                          const std::vector<std::filesystem::path>& paths,
                          const SymbolValues& values);

/**
 * @brief Create `directory` and its parents with owner-only permissions.
 * @throw SessionSetupError on failure.
 */
void create_private_directory(const std::filesystem::path& directory);

} // namespace jobtmpl
