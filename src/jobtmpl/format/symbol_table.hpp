/**
 * @file symbol_table.hpp
 * @brief Name-to-handle tables for the scopes visible at one usage site.
 */
#pragma once
#include "jobtmpl/common/common.hpp"
#include "jobtmpl/format/format_string.hpp"
#include <array>

namespace jobtmpl
{

/**
 * @brief The symbols a format string may reference at one usage site.
 *
 * @details
 * The validator builds one table per usage scope: job scope allows `Param`
 * and `RawParam`; a step script adds `Task.*` and `Session`; an environment
 * script adds `Env.File` and `Session`. A scope that was never allowed makes
 * every reference into it unresolved.
 */
class SymbolTable
{
public:
    /**
     * @brief Make `scope` visible, with `names[i]` bound to handle `i`.
     */
    void allow(SymbolScope scope, const std::vector<std::string>& names);

    /**
     * @brief Make `Session.*` visible.
     */
    void allow_session();

    bool allows(SymbolScope scope) const noexcept;

    /**
     * @brief Handle of `name` in `scope`, if the scope is visible and declares it.
     */
    std::optional<size_t> lookup(SymbolScope scope, const std::string& name) const;

    /**
     * @brief Human-readable description of this usage scope, used in messages.
     */
    const std::string& description() const noexcept
    {
        return m_description;
    }

    void set_description(std::string description)
    {
        m_description = std::move(description);
    }

private:
    std::array<std::optional<std::unordered_map<std::string, size_t>>, k_symbol_scope_count> m_tables;
    std::string m_description;
};

/**
 * @brief Bind every reference in `format` to its handle.
 * @return One message per reference that does not resolve, each naming the
 *         placeholder text; empty when all references were bound.
 */
std::vector<std::string> bind_references(FormatString& format, const SymbolTable& symbols);

} // namespace jobtmpl
