/**
 * @file symbol_table.cpp
 */
#include "jobtmpl/format/symbol_table.hpp"

namespace jobtmpl
{

void SymbolTable::allow(SymbolScope scope, const std::vector<std::string>& names)
{
    auto& table = m_tables[static_cast<size_t>(scope)];
    table.emplace();
    for (size_t i = 0; i < names.size(); ++i)
    {
        // First declaration wins; duplicates are reported by the validator
        table->emplace(names[i], i);
    }
}

void SymbolTable::allow_session()
{
    allow(SymbolScope::Session, {"WorkingDirectory", "HasPathMappingRules", "PathMappingRulesFile"});
}

bool SymbolTable::allows(SymbolScope scope) const noexcept
{
    return m_tables[static_cast<size_t>(scope)].has_value();
}

std::optional<size_t> SymbolTable::lookup(SymbolScope scope, const std::string& name) const
{
    const auto& table = m_tables[static_cast<size_t>(scope)];
    if (!table.has_value())
    {
        return std::nullopt;
    }
    auto it = table->find(name);
    if (it == table->end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> bind_references(FormatString& format, const SymbolTable& symbols)
{
    std::vector<std::string> problems;
    const std::string where = symbols.description().empty()
                                  ? std::string()
                                  : " (" + symbols.description() + ")";

    for (auto& ref : format.references())
    {
        if (!symbols.allows(ref.scope))
        {
            problems.push_back("Unresolved reference '" + ref.placeholder + "': " +
                               scope_prefix(ref.scope) + " values are not available here" + where);
            continue;
        }
        auto handle = symbols.lookup(ref.scope, ref.name);
        if (!handle.has_value())
        {
            problems.push_back("Unresolved reference '" + ref.placeholder + "': no " +
                               scope_prefix(ref.scope) + " named '" + ref.name + "' is declared" +
                               where);
            continue;
        }
        ref.handle = *handle;
    }

    return problems;
}

} // namespace jobtmpl
