/**
 * @file path_mapping.cpp
 */
#include "jobtmpl/pathmap/path_mapping.hpp"
#include "jobtmpl/common/logger.hpp"

#include <cctype>
#include <fstream>
#include <set>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace jobtmpl
{

namespace
{

char separator_of(PathFormat format) noexcept
{
    return format == PathFormat::Windows ? '\\' : '/';
}

std::string to_lower_ascii(const std::string& text)
{
    std::string result = text;
    for (char& c : result)
    {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

void split_components(const std::string& text, size_t pos, char sep,
                      std::vector<std::string>& out)
{
    while (pos <= text.size())
    {
        size_t next = text.find(sep, pos);
        if (next == std::string::npos)
        {
            next = text.size();
        }
        if (next > pos)
        {
            out.push_back(text.substr(pos, next - pos));
        }
        pos = next + 1;
    }
}

bool components_equal(const std::string& a, const std::string& b, PathFormat format)
{
    if (format == PathFormat::Windows)
    {
        return to_lower_ascii(a) == to_lower_ascii(b);
    }
    return a == b;
}

} // namespace

// ============================================================================
// Path splitting
// ============================================================================

std::vector<std::string> split_path(const std::string& path, PathFormat format)
{
    std::vector<std::string> components;

    if (format == PathFormat::Posix)
    {
        size_t pos = 0;
        if (!path.empty() && path[0] == '/')
        {
            components.push_back("/");
            pos = 1;
        }
        split_components(path, pos, '/', components);
        return components;
    }

    std::string normalized = path;
    std::replace(normalized.begin(), normalized.end(), '/', '\\');

    size_t pos = 0;
    if (normalized.size() >= 2 && normalized[0] == '\\' && normalized[1] == '\\')
    {
        // UNC: \\server\share is the anchor
        std::vector<std::string> unc_parts;
        split_components(normalized, 2, '\\', unc_parts);
        std::string anchor = "\\\\";
        size_t taken = 0;
        for (; taken < unc_parts.size() && taken < 2; ++taken)
        {
            anchor += unc_parts[taken] + "\\";
        }
        components.push_back(anchor);
        components.insert(components.end(), unc_parts.begin() + static_cast<std::ptrdiff_t>(taken),
                          unc_parts.end());
        return components;
    }
    if (normalized.size() >= 2 && std::isalpha(static_cast<unsigned char>(normalized[0])) &&
        normalized[1] == ':')
    {
        std::string anchor = normalized.substr(0, 2);
        pos = 2;
        if (normalized.size() > 2 && normalized[2] == '\\')
        {
            anchor += "\\";
            pos = 3;
        }
        components.push_back(anchor);
    }
    else if (!normalized.empty() && normalized[0] == '\\')
    {
        components.push_back("\\");
        pos = 1;
    }
    split_components(normalized, pos, '\\', components);
    return components;
}

// ============================================================================
// PathMapper
// ============================================================================

PathMapper::PathMapper()
    : m_destination_format(host_path_format())
{
}

PathMapper::PathMapper(std::vector<PathMappingRule> rules, PathFormat destination_format)
    : m_rules(std::move(rules))
    , m_destination_format(destination_format)
{
    m_compiled.reserve(m_rules.size());
    for (size_t i = 0; i < m_rules.size(); ++i)
    {
        const auto& rule = m_rules[i];
        if (rule.source_path.empty())
        {
            throw PathMappingError("Path mapping rule " + std::to_string(i) +
                                   " has an empty source_path");
        }
        if (rule.destination_path.empty())
        {
            throw PathMappingError("Path mapping rule " + std::to_string(i) +
                                   " has an empty destination_path");
        }
        m_compiled.push_back(CompiledRule{split_path(rule.source_path, rule.source_path_format)});
        if (m_compiled.back().components.empty())
        {
            throw PathMappingError("Path mapping rule " + std::to_string(i) +
                                   " has a source_path with no components: '" +
                                   rule.source_path + "'");
        }
    }
}

std::optional<size_t> PathMapper::match_rule(const std::string& path) const
{
    return find_rule(path, std::nullopt);
}

std::optional<size_t> PathMapper::match_rule(const std::string& path, PathFormat source_format) const
{
    return find_rule(path, source_format);
}

std::optional<size_t> PathMapper::find_rule(const std::string& path,
                                            std::optional<PathFormat> source_format) const
{
    std::optional<size_t> best;
    size_t best_length = 0;

    for (size_t i = 0; i < m_rules.size(); ++i)
    {
        const auto& rule = m_rules[i];
        if (source_format.has_value() && rule.source_path_format != *source_format)
        {
            continue;
        }

        const auto& prefix = m_compiled[i].components;
        auto components = split_path(path, rule.source_path_format);
        if (prefix.size() > components.size())
        {
            continue;
        }

        bool matches = true;
        for (size_t c = 0; c < prefix.size(); ++c)
        {
            if (!components_equal(prefix[c], components[c], rule.source_path_format))
            {
                matches = false;
                break;
            }
        }

        // Strictly longer wins, so the earliest rule keeps a tie
        if (matches && (!best.has_value() || prefix.size() > best_length))
        {
            best = i;
            best_length = prefix.size();
        }
    }

    return best;
}

std::string PathMapper::apply_rule(size_t rule_idx, const std::string& path) const
{
    const auto& rule = m_rules[rule_idx];
    auto components = split_path(path, rule.source_path_format);
    const size_t prefix_length = m_compiled[rule_idx].components.size();

    std::string result = rule.destination_path;
    if (components.size() == prefix_length)
    {
        return result;
    }

    const char sep = separator_of(m_destination_format);
    const char last = result.back();
    if (last != sep && !(m_destination_format == PathFormat::Windows && last == '/'))
    {
        result.push_back(sep);
    }

    for (size_t c = prefix_length; c < components.size(); ++c)
    {
        if (c > prefix_length)
        {
            result.push_back(sep);
        }
        result += components[c];
    }
    return result;
}

std::string PathMapper::translate(const std::string& path) const
{
    auto rule_idx = find_rule(path, std::nullopt);
    if (!rule_idx.has_value())
    {
        return path;
    }
    std::string mapped = apply_rule(*rule_idx, path);
    JOBTMPL_LOG_TRACE("Path mapped by rule " + std::to_string(*rule_idx) + ": '" + path +
                      "' -> '" + mapped + "'");
    return mapped;
}

std::string PathMapper::translate(const std::string& path, PathFormat source_format) const
{
    auto rule_idx = find_rule(path, source_format);
    if (!rule_idx.has_value())
    {
        return path;
    }
    return apply_rule(*rule_idx, path);
}

// ============================================================================
// Configuration documents
// ============================================================================

std::vector<PathMappingRule> parse_path_mapping_rules(const std::string& document)
{
    YAML::Node root;
    try
    {
        root = YAML::Load(document);
    }
    catch (const YAML::Exception& e)
    {
        throw PathMappingError(std::string("Path mapping document is not valid JSON/YAML: ") +
                               e.what());
    }

    if (!root.IsMap())
    {
        throw PathMappingError("Path mapping document must be an object");
    }

    for (const auto& entry : root)
    {
        const auto key = entry.first.as<std::string>();
        if (key != "version" && key != "path_mapping_rules")
        {
            throw PathMappingError("Unknown key in path mapping document: '" + key + "'");
        }
    }

    const YAML::Node version = root["version"];
    if (!version || !version.IsScalar() || version.as<std::string>() != k_path_mapping_version)
    {
        throw PathMappingError(std::string("Path mapping document version must be '") +
                               k_path_mapping_version + "'");
    }

    const YAML::Node rule_nodes = root["path_mapping_rules"];
    if (!rule_nodes || !rule_nodes.IsSequence())
    {
        throw PathMappingError("Path mapping document requires a 'path_mapping_rules' list");
    }

    static const std::set<std::string> k_rule_keys = {
        "source_path_format", "source_path", "destination_path"};

    std::vector<PathMappingRule> rules;
    for (size_t i = 0; i < rule_nodes.size(); ++i)
    {
        const YAML::Node node = rule_nodes[i];
        const std::string where = "path_mapping_rules[" + std::to_string(i) + "]";
        if (!node.IsMap())
        {
            throw PathMappingError(where + " must be an object");
        }
        for (const auto& entry : node)
        {
            const auto key = entry.first.as<std::string>();
            if (k_rule_keys.count(key) == 0)
            {
                throw PathMappingError(where + " has unknown key '" + key + "'");
            }
        }
        for (const auto& key : k_rule_keys)
        {
            if (!node[key] || !node[key].IsScalar())
            {
                throw PathMappingError(where + " requires a string '" + key + "'");
            }
        }

        const auto format_text = node["source_path_format"].as<std::string>();
        auto format = parse_path_format(format_text);
        if (!format.has_value())
        {
            throw PathMappingError(where + " has unknown source_path_format '" + format_text +
                                   "'; expected POSIX or WINDOWS");
        }

        PathMappingRule rule;
        rule.source_path_format = *format;
        rule.source_path = node["source_path"].as<std::string>();
        rule.destination_path = node["destination_path"].as<std::string>();
        if (rule.source_path.empty())
        {
            throw PathMappingError(where + " has an empty source_path");
        }
        rules.push_back(std::move(rule));
    }

    return rules;
}

std::vector<PathMappingRule> load_path_mapping_rules(const std::filesystem::path& file)
{
    std::ifstream in(file);
    if (!in)
    {
        throw PathMappingError("Cannot read path mapping file: " + file.string());
    }
    std::ostringstream content;
    content << in.rdbuf();
    return parse_path_mapping_rules(content.str());
}

std::string emit_path_mapping_rules(const std::vector<PathMappingRule>& rules)
{
    YAML::Emitter out;
    out.SetStringFormat(YAML::DoubleQuoted);
    out.SetMapFormat(YAML::Flow);
    out.SetSeqFormat(YAML::Flow);
    out << YAML::BeginMap;
    out << YAML::Key << "version" << YAML::Value << k_path_mapping_version;
    out << YAML::Key << "path_mapping_rules" << YAML::Value << YAML::BeginSeq;
    for (const auto& rule : rules)
    {
        out << YAML::BeginMap;
        out << YAML::Key << "source_path_format" << YAML::Value
            << to_string(rule.source_path_format);
        out << YAML::Key << "source_path" << YAML::Value << rule.source_path;
        out << YAML::Key << "destination_path" << YAML::Value << rule.destination_path;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
    return out.c_str();
}

} // namespace jobtmpl
