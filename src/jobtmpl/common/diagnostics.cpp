/**
 * @file diagnostics.cpp
 */
#include "jobtmpl/common/diagnostics.hpp"

#include <sstream>

namespace jobtmpl
{

void Diagnostics::throw_if_errors() const
{
    if (m_error_count == 0)
    {
        return;
    }

    const Diagnostic* first = nullptr;
    for (const auto& item : m_items)
    {
        if (item.severity == DiagnosticSeverity::Error)
        {
            first = &item;
            break;
        }
    }

    if (first->code != ErrorCode::Validation)
    {
        throw_error(first->code, first->to_string());
    }

    std::ostringstream oss;
    oss << "Template validation failed with " << m_error_count << " error(s):\n";
    for (const auto& item : m_items)
    {
        if (item.severity == DiagnosticSeverity::Error)
        {
            oss << "  - " << item.to_string() << "\n";
        }
    }
    throw ValidationError(oss.str(), std::make_shared<const std::vector<Diagnostic>>(m_items));
}

} // namespace jobtmpl
