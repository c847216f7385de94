/**
 * @file format_string.hpp
 * @brief Strings with `{{ Scope.Name }}` placeholders.
 */
#pragma once
#include "jobtmpl/common/common.hpp"
#include "jobtmpl/common/enums.hpp"
#include "jobtmpl/common/errors.hpp"

namespace jobtmpl
{

/**
 * @brief The scope a placeholder reference draws its value from.
 */
enum class SymbolScope
{
    Param,        ///< `Param.<name>`: job parameter, path-mapped inside a Session.
    RawParam,     ///< `RawParam.<name>`: job parameter as submitted.
    TaskParam,    ///< `Task.Param.<name>`: TaskRun binding, path-mapped.
    TaskRawParam, ///< `Task.RawParam.<name>`: TaskRun binding as expanded.
    TaskFile,     ///< `Task.File.<name>`: materialized step embedded file.
    EnvFile,      ///< `Env.File.<name>`: materialized environment embedded file.
    Session       ///< `Session.<name>`: Session metadata.
};

inline constexpr size_t k_symbol_scope_count = 7;

/**
 * @brief Fixed handles of the `Session.*` symbols.
 */
enum class SessionSymbol : size_t
{
    WorkingDirectory = 0,
    HasPathMappingRules = 1,
    PathMappingRulesFile = 2
};

inline constexpr size_t k_session_symbol_count = 3;

/**
 * @brief Prefix used in placeholder text for a scope, e.g. `"Task.Param"`.
 */
const char* scope_prefix(SymbolScope scope) noexcept;

/**
 * @brief One `{{ ... }}` placeholder inside a format string.
 */
struct FormatReference
{
    /// Placeholder exactly as written, braces included.
    std::string placeholder;
    /// Trimmed expression, e.g. `Task.Param.Frame`.
    std::string expression;
    SymbolScope scope{SymbolScope::Param};
    /// Symbol name within the scope, e.g. `Frame`.
    std::string name;
    /// Resolved handle into the scope's table; `k_unbound_handle` until bound.
    size_t handle{k_unbound_handle};
};

/**
 * @brief A parsed format string: literal text interleaved with references.
 *
 * @details
 * The string is stored as `literal[0] ref[0] literal[1] ... ref[n-1] literal[n]`.
 * Whitespace inside the braces is ignored. There is no escape syntax and no
 * nesting; a resolved value is never scanned for placeholders again.
 *
 * `Session.*` references are bound when parsed. Other references are bound to
 * handles by `bind_references()` during validation.
 */
class FormatString
{
public:
    /**
     * @brief An empty format string.
     */
    FormatString() = default;

    /**
     * @brief Parse `text`.
     * @throw FormatStringError for an unterminated `{{`, an empty expression,
     *        an unknown scope, an invalid symbol name, or an unknown
     *        `Session.*` symbol. The message names the placeholder.
     */
    static FormatString parse(const std::string& text);

    /**
     * @brief Wrap `text` verbatim with no placeholder processing.
     */
    static FormatString literal(std::string text);

    const std::string& text() const noexcept
    {
        return m_text;
    }

    const std::vector<std::string>& literals() const noexcept
    {
        return m_literals;
    }

    const std::vector<FormatReference>& references() const noexcept
    {
        return m_references;
    }

    std::vector<FormatReference>& references() noexcept
    {
        return m_references;
    }

    /**
     * @brief True if the string contains no placeholders.
     */
    bool is_literal() const noexcept
    {
        return m_references.empty();
    }

    /**
     * @brief True if any reference draws from `scope`.
     */
    bool references_scope(SymbolScope scope) const noexcept;

private:
    std::string m_text;
    std::vector<std::string> m_literals{std::string{}};
    std::vector<FormatReference> m_references;
};

/**
 * @brief Check that `name` is a valid identifier (`[A-Za-z_][A-Za-z0-9_]*`).
 */
bool is_identifier(const std::string& name) noexcept;

} // namespace jobtmpl
