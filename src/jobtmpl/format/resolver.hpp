/**
 * @file resolver.hpp
 * @brief Substitution of bound references with their values.
 */
#pragma once
#include "jobtmpl/common/common.hpp"
#include "jobtmpl/format/format_string.hpp"
#include <array>

namespace jobtmpl
{

/**
 * @brief Values for bound references, indexed by scope and handle.
 *
 * @details
 * A `SymbolValues` frame may point at a parent frame. Lookups that find no
 * value in this frame continue in the parent, so a Task frame layered over
 * the Session frame over the Job frame shares the job values without copying
 * them. Frames never mutate their parent.
 *
 * @par Thread safety
 * - No internal synchronization. A populated frame may be read concurrently.
 */
class SymbolValues
{
public:
    explicit SymbolValues(const SymbolValues* parent = nullptr)
        : m_parent(parent)
    {
    }

    /**
     * @brief Replace every value of `scope` in this frame.
     */
    void set_values(SymbolScope scope, std::vector<std::string> values);

    /**
     * @brief Set the value of one handle in this frame.
     */
    void set_value(SymbolScope scope, size_t handle, std::string value);

    void set_session_value(SessionSymbol symbol, std::string value)
    {
        set_value(SymbolScope::Session, static_cast<size_t>(symbol), std::move(value));
    }

    /**
     * @brief Value for `handle` in `scope`, searching parent frames.
     * @return nullptr if no frame provides the value.
     */
    const std::string* find(SymbolScope scope, size_t handle) const;

    const SymbolValues* parent() const noexcept
    {
        return m_parent;
    }

private:
    const SymbolValues* m_parent;
    std::array<std::vector<std::optional<std::string>>, k_symbol_scope_count> m_values;
};

/**
 * @brief Substitute every placeholder of `format` with its value.
 * @param format A format string whose references were bound.
 * @param values The value frames for the current usage scope.
 * @param context Describes the usage site in error messages, e.g.
 *        `"step 'Render' onRun args[0]"`.
 * @throw UnresolvedReferenceError naming the placeholder and `context` when a
 *        reference is unbound or has no value.
 */
std::string resolve(const FormatString& format, const SymbolValues& values,
                    const std::string& context = std::string());

} // namespace jobtmpl
