/**
 * @file session_context.cpp
 */
#include "jobtmpl/session/session_context.hpp"

extern char** environ;

namespace jobtmpl
{

namespace
{

std::map<std::string, std::string> capture_process_environment()
{
    std::map<std::string, std::string> result;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry)
    {
        const std::string text(*entry);
        const size_t eq = text.find('=');
        if (eq == std::string::npos || eq == 0)
        {
            continue;
        }
        result.emplace(text.substr(0, eq), text.substr(eq + 1));
    }
    return result;
}

} // namespace

SessionContext::SessionContext(std::filesystem::path working_directory,
                               std::shared_ptr<const PathMapper> path_mapper,
                               bool inherit_process_environment)
    : m_working_directory(std::move(working_directory))
    , m_path_mapper(path_mapper ? std::move(path_mapper) : std::make_shared<const PathMapper>())
    , m_inherited(std::make_shared<const std::map<std::string, std::string>>(
          inherit_process_environment ? capture_process_environment()
                                      : std::map<std::string, std::string>{}))
{
}

SessionContext SessionContext::push_frame(EnvironmentFrame frame) const
{
    SessionContext next(*this);
    next.m_top = std::make_shared<const Node>(Node{std::move(frame), m_top});
    return next;
}

size_t SessionContext::depth() const noexcept
{
    size_t count = 0;
    for (const Node* node = m_top.get(); node != nullptr; node = node->below.get())
    {
        ++count;
    }
    return count;
}

std::optional<std::string> SessionContext::variable(const std::string& name) const
{
    for (const Node* node = m_top.get(); node != nullptr; node = node->below.get())
    {
        auto it = node->frame.variables.find(name);
        if (it != node->frame.variables.end())
        {
            return it->second;
        }
    }
    auto it = m_inherited->find(name);
    if (it != m_inherited->end())
    {
        return it->second;
    }
    return std::nullopt;
}

std::map<std::string, std::string> SessionContext::environment() const
{
    std::map<std::string, std::string> result = *m_inherited;

    // Apply frames bottom-up so later Environments override earlier ones
    std::vector<const Node*> nodes;
    for (const Node* node = m_top.get(); node != nullptr; node = node->below.get())
    {
        nodes.push_back(node);
    }
    for (auto it = nodes.rbegin(); it != nodes.rend(); ++it)
    {
        for (const auto& entry : (*it)->frame.variables)
        {
            if (entry.second.has_value())
            {
                result[entry.first] = *entry.second;
            }
            else
            {
                result.erase(entry.first);
            }
        }
    }
    return result;
}

std::vector<std::string> SessionContext::environment_block() const
{
    std::vector<std::string> block;
    for (const auto& entry : environment())
    {
        block.push_back(entry.first + "=" + entry.second);
    }
    return block;
}

} // namespace jobtmpl
