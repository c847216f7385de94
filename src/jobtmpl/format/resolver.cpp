/**
 * @file resolver.cpp
 */
#include "jobtmpl/format/resolver.hpp"

namespace jobtmpl
{

void SymbolValues::set_values(SymbolScope scope, std::vector<std::string> values)
{
    auto& slots = m_values[static_cast<size_t>(scope)];
    slots.clear();
    slots.reserve(values.size());
    for (auto& value : values)
    {
        slots.emplace_back(std::move(value));
    }
}

void SymbolValues::set_value(SymbolScope scope, size_t handle, std::string value)
{
    auto& slots = m_values[static_cast<size_t>(scope)];
    if (handle >= slots.size())
    {
        slots.resize(handle + 1);
    }
    slots[handle] = std::move(value);
}

const std::string* SymbolValues::find(SymbolScope scope, size_t handle) const
{
    for (const SymbolValues* frame = this; frame != nullptr; frame = frame->m_parent)
    {
        const auto& slots = frame->m_values[static_cast<size_t>(scope)];
        if (handle < slots.size() && slots[handle].has_value())
        {
            return &*slots[handle];
        }
    }
    return nullptr;
}

std::string resolve(const FormatString& format, const SymbolValues& values,
                    const std::string& context)
{
    const auto& literals = format.literals();
    const auto& references = format.references();

    std::string result = literals.front();
    for (size_t i = 0; i < references.size(); ++i)
    {
        const auto& ref = references[i];
        const std::string* value = nullptr;
        if (ref.handle != k_unbound_handle)
        {
            value = values.find(ref.scope, ref.handle);
        }
        if (value == nullptr)
        {
            std::string message = "Unresolved reference '" + ref.placeholder + "' in " +
                                  scope_prefix(ref.scope) + " scope";
            if (!context.empty())
            {
                message += " at " + context;
            }
            throw UnresolvedReferenceError(message);
        }
        result += *value;
        result += literals[i + 1];
    }
    return result;
}

} // namespace jobtmpl
