/**
 * @file path_mapping.hpp
 * @brief Rewriting of filesystem paths from the submission host to the execution host.
 */
#pragma once
#include "jobtmpl/common/common.hpp"
#include "jobtmpl/common/enums.hpp"
#include "jobtmpl/common/errors.hpp"

namespace jobtmpl
{

/**
 * @brief Version string required in a path mapping configuration document.
 */
inline constexpr const char* k_path_mapping_version = "pathmapping-1.0";

/**
 * @brief One submission-host prefix and its replacement on the execution host.
 */
struct PathMappingRule
{
    PathFormat source_path_format{PathFormat::Posix};
    std::string source_path;
    std::string destination_path;
};

/**
 * @brief Split a path into comparable components.
 *
 * @details
 * The first component is the anchor when the path is absolute: `/` for POSIX,
 * a drive (`C:\`) or UNC share (`\\server\share\`) for Windows. Empty
 * components and trailing separators are dropped. Windows input accepts both
 * `\` and `/`.
 */
std::vector<std::string> split_path(const std::string& path, PathFormat format);

/**
 * @brief Immutable, validated rule set applied to PATH values.
 *
 * @details
 * `translate()` selects, among the rules whose `source_path` is a
 * component-wise prefix of the value, the one with the most components
 * (i.e. the longest prefix). On a tie, the rule appearing earliest in the
 * supplied list wins. The matched prefix is replaced by `destination_path`
 * and the remaining components are joined with the destination host's
 * separator. A value that matches no rule is returned unchanged.
 *
 * Comparison is case-sensitive for POSIX rules and case-insensitive for
 * WINDOWS rules.
 *
 * @par Thread safety
 * - Immutable after construction; concurrent reads are safe.
 */
class PathMapper
{
public:
    /**
     * @brief An empty mapper that leaves every path unchanged.
     */
    PathMapper();

    /**
     * @brief Construct from an ordered rule list.
     * @param rules Rules in priority order for equal-length matches.
     * @param destination_format Path convention of the execution host.
     * @throw PathMappingError if a rule has an empty source or destination path.
     */
    explicit PathMapper(std::vector<PathMappingRule> rules,
                        PathFormat destination_format = host_path_format());

    const std::vector<PathMappingRule>& rules() const noexcept
    {
        return m_rules;
    }

    bool empty() const noexcept
    {
        return m_rules.empty();
    }

    PathFormat destination_format() const noexcept
    {
        return m_destination_format;
    }

    /**
     * @brief Index of the rule that applies to `path`, considering every rule.
     */
    std::optional<size_t> match_rule(const std::string& path) const;

    /**
     * @brief Index of the rule that applies to `path`, considering only rules
     *        whose `source_path_format` equals `source_format`.
     */
    std::optional<size_t> match_rule(const std::string& path, PathFormat source_format) const;

    /**
     * @brief Rewrite `path` using every rule (each in its own source format).
     */
    std::string translate(const std::string& path) const;

    /**
     * @brief Rewrite `path` known to originate from a `source_format` host.
     */
    std::string translate(const std::string& path, PathFormat source_format) const;

private:
    struct CompiledRule
    {
        std::vector<std::string> components;
    };

    std::vector<PathMappingRule> m_rules;
    std::vector<CompiledRule> m_compiled;
    PathFormat m_destination_format;

    std::optional<size_t> find_rule(const std::string& path,
                                    std::optional<PathFormat> source_format) const;
    std::string apply_rule(size_t rule_idx, const std::string& path) const;
};

/**
 * @brief Parse a path mapping configuration document (JSON or YAML).
 * @throw PathMappingError on a wrong version, a missing or unknown key,
 *        an unknown `source_path_format`, or an empty `source_path`.
 */
std::vector<PathMappingRule> parse_path_mapping_rules(const std::string& document);

/**
 * @brief Read and parse a path mapping configuration file.
 * @throw PathMappingError if the file cannot be read or is malformed.
 */
std::vector<PathMappingRule> load_path_mapping_rules(const std::filesystem::path& file);

/**
 * @brief Serialize rules to the configuration document format (JSON).
 */
std::string emit_path_mapping_rules(const std::vector<PathMappingRule>& rules);

} // namespace jobtmpl
