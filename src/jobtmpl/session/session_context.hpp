/**
 * @file session_context.hpp
 * @brief Immutable per-Session context with stacked environment variable frames.
 */
#pragma once
#include "jobtmpl/common/common.hpp"
#include "jobtmpl/pathmap/path_mapping.hpp"

namespace jobtmpl
{

/**
 * @brief Variable changes made by one entered Environment.
 *
 * @details
 * A value of nullopt unsets the variable for everything above this frame.
 */
struct EnvironmentFrame
{
    std::string environment_name;
    std::map<std::string, std::optional<std::string>> variables;
};

/**
 * @brief Working directory, path mapping and environment overlay of a Session.
 *
 * @details
 * A SessionContext is never mutated. `push_frame()` returns a new context
 * whose overlay stack has one more frame; the frames themselves are shared
 * between contexts, so pushing is cheap and contexts of concurrent Sessions
 * never alias mutable state.
 *
 * Lookup walks the frames from the most recently pushed one, then falls back
 * to the inherited process environment when `inherit_process_environment`
 * was requested at construction.
 */
class SessionContext
{
public:
    SessionContext(std::filesystem::path working_directory, std::shared_ptr<const PathMapper> path_mapper,
                   bool inherit_process_environment = true);

    const std::filesystem::path& working_directory() const noexcept
    {
        return m_working_directory;
    }

    const PathMapper& path_mapper() const noexcept
    {
        return *m_path_mapper;
    }

    const std::shared_ptr<const PathMapper>& path_mapper_ptr() const noexcept
    {
        return m_path_mapper;
    }

    /**
     * @brief A new context with `frame` on top of this one's stack.
     */
    SessionContext push_frame(EnvironmentFrame frame) const;

    /**
     * @brief Number of frames on the stack.
     */
    size_t depth() const noexcept;

    /**
     * @brief Effective value of `name`, or nullopt if unset.
     */
    std::optional<std::string> variable(const std::string& name) const;

    /**
     * @brief The effective environment as a sorted `name -> value` map.
     */
    std::map<std::string, std::string> environment() const;

    /**
     * @brief The effective environment as `NAME=VALUE` entries for exec.
     */
    std::vector<std::string> environment_block() const;

private:
    struct Node
    {
        EnvironmentFrame frame;
        std::shared_ptr<const Node> below;
    };

    std::filesystem::path m_working_directory;
    std::shared_ptr<const PathMapper> m_path_mapper;
    std::shared_ptr<const std::map<std::string, std::string>> m_inherited;
    std::shared_ptr<const Node> m_top;
};

} // namespace jobtmpl
