/**
 * @file format_string.cpp
 */
#include "jobtmpl/format/format_string.hpp"

#include <cctype>

namespace jobtmpl
{

namespace
{

struct ScopePrefix
{
    const char* prefix;
    SymbolScope scope;
};

// Longer prefixes first so that "Task.RawParam." is not read as something shorter
const ScopePrefix k_scope_prefixes[] = {
    {"Task.RawParam.", SymbolScope::TaskRawParam},
    {"Task.Param.", SymbolScope::TaskParam},
    {"Task.File.", SymbolScope::TaskFile},
    {"Env.File.", SymbolScope::EnvFile},
    {"RawParam.", SymbolScope::RawParam},
    {"Param.", SymbolScope::Param},
    {"Session.", SymbolScope::Session},
};

std::string trim(const std::string& text)
{
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])))
    {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])))
    {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::optional<SessionSymbol> parse_session_symbol(const std::string& name)
{
    if (name == "WorkingDirectory") return SessionSymbol::WorkingDirectory;
    if (name == "HasPathMappingRules") return SessionSymbol::HasPathMappingRules;
    if (name == "PathMappingRulesFile") return SessionSymbol::PathMappingRulesFile;
    return std::nullopt;
}

FormatReference parse_reference(const std::string& placeholder, const std::string& expression)
{
    if (expression.empty())
    {
        throw FormatStringError("Empty expression in placeholder '" + placeholder + "'");
    }

    for (const auto& entry : k_scope_prefixes)
    {
        const std::string prefix = entry.prefix;
        if (expression.compare(0, prefix.size(), prefix) != 0)
        {
            continue;
        }

        FormatReference ref;
        ref.placeholder = placeholder;
        ref.expression = expression;
        ref.scope = entry.scope;
        ref.name = expression.substr(prefix.size());
        if (!is_identifier(ref.name))
        {
            throw FormatStringError("Invalid symbol name '" + ref.name + "' in placeholder '" +
                                    placeholder + "'");
        }
        if (ref.scope == SymbolScope::Session)
        {
            auto symbol = parse_session_symbol(ref.name);
            if (!symbol.has_value())
            {
                throw FormatStringError("Unknown Session value '" + ref.name +
                                        "' in placeholder '" + placeholder + "'");
            }
            ref.handle = static_cast<size_t>(*symbol);
        }
        return ref;
    }

    throw FormatStringError("Unknown scope in placeholder '" + placeholder +
                            "'; expected Param, RawParam, Task.Param, Task.RawParam, "
                            "Task.File, Env.File or Session");
}

} // namespace

const char* scope_prefix(SymbolScope scope) noexcept
{
    switch (scope)
    {
    case SymbolScope::Param:        return "Param";
    case SymbolScope::RawParam:     return "RawParam";
    case SymbolScope::TaskParam:    return "Task.Param";
    case SymbolScope::TaskRawParam: return "Task.RawParam";
    case SymbolScope::TaskFile:     return "Task.File";
    case SymbolScope::EnvFile:      return "Env.File";
    case SymbolScope::Session:      return "Session";
    }
    return "Unknown";
}

bool is_identifier(const std::string& name) noexcept
{
    if (name.empty())
    {
        return false;
    }
    const auto first = static_cast<unsigned char>(name[0]);
    if (!std::isalpha(first) && first != '_')
    {
        return false;
    }
    for (char c : name)
    {
        const auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && uc != '_')
        {
            return false;
        }
    }
    return true;
}

FormatString FormatString::parse(const std::string& text)
{
    FormatString result;
    result.m_text = text;
    result.m_literals.clear();

    std::string current;
    size_t pos = 0;
    while (pos < text.size())
    {
        size_t open = text.find("{{", pos);
        if (open == std::string::npos)
        {
            current += text.substr(pos);
            break;
        }

        size_t close = text.find("}}", open + 2);
        if (close == std::string::npos)
        {
            throw FormatStringError("Unterminated placeholder starting at offset " +
                                    std::to_string(open) + " in '" + text + "'");
        }

        current += text.substr(pos, open - pos);
        const std::string placeholder = text.substr(open, close + 2 - open);
        const std::string expression = trim(text.substr(open + 2, close - open - 2));
        if (expression.find("{{") != std::string::npos)
        {
            throw FormatStringError("Nested placeholder in '" + placeholder + "'");
        }

        result.m_literals.push_back(std::move(current));
        current.clear();
        result.m_references.push_back(parse_reference(placeholder, expression));
        pos = close + 2;
    }
    result.m_literals.push_back(std::move(current));
    return result;
}

FormatString FormatString::literal(std::string text)
{
    FormatString result;
    result.m_literals.front() = text;
    result.m_text = std::move(text);
    return result;
}

bool FormatString::references_scope(SymbolScope scope) const noexcept
{
    for (const auto& ref : m_references)
    {
        if (ref.scope == scope)
        {
            return true;
        }
    }
    return false;
}

} // namespace jobtmpl
