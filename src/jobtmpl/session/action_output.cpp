/**
 * @file action_output.cpp
 */
#include "jobtmpl/session/action_output.hpp"
#include "jobtmpl/format/format_string.hpp"
#include "jobtmpl/template/parameter_value.hpp"

namespace jobtmpl
{

namespace
{

std::string trim(const std::string& text)
{
    const char* space = " \t\r\n";
    const size_t begin = text.find_first_not_of(space);
    if (begin == std::string::npos)
    {
        return std::string();
    }
    const size_t end = text.find_last_not_of(space);
    return text.substr(begin, end - begin + 1);
}

bool strip_prefix(const std::string& line, const char* prefix, std::string& payload)
{
    const std::string p(prefix);
    if (line.compare(0, p.size(), p) != 0)
    {
        return false;
    }
    payload = trim(line.substr(p.size()));
    return true;
}

OutputDirective malformed(std::string problem)
{
    OutputDirective d;
    d.kind = DirectiveKind::Malformed;
    d.text = std::move(problem);
    return d;
}

} // namespace

OutputDirective parse_output_directive(const std::string& line)
{
    OutputDirective d;
    std::string payload;

    if (strip_prefix(line, "jobtmpl_env:", payload))
    {
        const size_t eq = payload.find('=');
        if (eq == std::string::npos)
        {
            return malformed("expected NAME=VALUE in '" + line + "'");
        }
        d.name = trim(payload.substr(0, eq));
        if (!is_identifier(d.name))
        {
            return malformed("invalid variable name '" + d.name + "'");
        }
        d.kind = DirectiveKind::SetEnv;
        d.text = payload.substr(eq + 1);
        return d;
    }
    if (strip_prefix(line, "jobtmpl_unset_env:", payload))
    {
        if (!is_identifier(payload))
        {
            return malformed("invalid variable name '" + payload + "'");
        }
        d.kind = DirectiveKind::UnsetEnv;
        d.name = payload;
        return d;
    }
    if (strip_prefix(line, "jobtmpl_progress:", payload))
    {
        auto value = parse_float(payload);
        if (!value.has_value() || *value < 0.0 || *value > 100.0)
        {
            return malformed("progress must be a number between 0 and 100, got '" + payload + "'");
        }
        d.kind = DirectiveKind::Progress;
        d.progress = *value;
        return d;
    }
    if (strip_prefix(line, "jobtmpl_status:", payload))
    {
        d.kind = DirectiveKind::Status;
        d.text = payload;
        return d;
    }
    if (strip_prefix(line, "jobtmpl_fail:", payload))
    {
        d.kind = DirectiveKind::Fail;
        d.text = payload;
        return d;
    }
    return d;
}

std::vector<std::string> LineSplitter::feed(const char* data, size_t size)
{
    std::vector<std::string> lines;
    m_pending.append(data, size);
    size_t start = 0;
    for (size_t nl = m_pending.find('\n'); nl != std::string::npos; nl = m_pending.find('\n', start))
    {
        size_t end = nl;
        if (end > start && m_pending[end - 1] == '\r')
        {
            --end;
        }
        lines.push_back(m_pending.substr(start, end - start));
        start = nl + 1;
    }
    m_pending.erase(0, start);
    return lines;
}

std::optional<std::string> LineSplitter::flush()
{
    if (m_pending.empty())
    {
        return std::nullopt;
    }
    std::string rest;
    rest.swap(m_pending);
    if (!rest.empty() && rest.back() == '\r')
    {
        rest.pop_back();
    }
    return rest;
}

} // namespace jobtmpl
