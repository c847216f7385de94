/**
 * @file step_graph.cpp
 */
#include "jobtmpl/common/step_graph.hpp"

#include <queue>

namespace jobtmpl
{

// ============================================================================
// Constructor
// ============================================================================

StepGraph::StepGraph(bool eager_validation)
    : m_eager_validation(eager_validation)
{
}

// ============================================================================
// Query methods
// ============================================================================

size_t StepGraph::step_count() const noexcept
{
    return m_step_count;
}

const std::vector<StepIdx>& StepGraph::predecessors(StepIdx step_idx) const
{
    check_step_index(step_idx, "Step");
    return m_step_predecessors[step_idx];
}

const std::vector<StepIdx>& StepGraph::successors(StepIdx step_idx) const
{
    check_step_index(step_idx, "Step");
    return m_step_successors[step_idx];
}

void StepGraph::check_step_index(StepIdx step_idx, const char* role) const
{
    if (step_idx >= m_step_count)
    {
        throw ValidationError(std::string(role) + " index " + std::to_string(step_idx) +
                              " does not exist");
    }
}

// ============================================================================
// Step management
// ============================================================================

void StepGraph::add_step(StepIdx step_idx)
{
    if (step_idx != m_step_count)
    {
        if (step_idx < m_step_count)
        {
            throw ValidationError("Step index " + std::to_string(step_idx) + " already exists");
        }
        throw ValidationError("Step index " + std::to_string(step_idx) +
                              " is out of sequence; expected " + std::to_string(m_step_count));
    }

    m_step_successors.emplace_back();
    m_step_predecessors.emplace_back();
    ++m_step_count;
}

void StepGraph::link_steps(StepIdx step_before_idx, StepIdx step_after_idx)
{
    check_step_index(step_before_idx, "Before step");
    check_step_index(step_after_idx, "After step");

    if (step_before_idx == step_after_idx)
    {
        throw CyclicDependencyError("Cannot link step " + std::to_string(step_before_idx) +
                                    " to itself");
    }

    auto& succ = m_step_successors[step_before_idx];
    if (std::find(succ.begin(), succ.end(), step_after_idx) != succ.end())
    {
        return;
    }

    // A cycle would exist if step_before_idx is already reachable from step_after_idx
    if (m_eager_validation && is_reachable_from(step_after_idx, step_before_idx))
    {
        throw CyclicDependencyError(
            "Adding edge " + std::to_string(step_before_idx) + " -> " +
            std::to_string(step_after_idx) + " would create a cycle (step " +
            std::to_string(step_before_idx) + " is reachable from step " +
            std::to_string(step_after_idx) + ")");
    }

    succ.push_back(step_after_idx);
    m_step_predecessors[step_after_idx].push_back(step_before_idx);
}

// ============================================================================
// Traversal
// ============================================================================

bool StepGraph::is_reachable_from(StepIdx from, StepIdx target) const
{
    if (from == target)
    {
        return true;
    }

    // Iterative DFS
    std::vector<bool> visited(m_step_count, false);
    std::vector<StepIdx> stack;
    stack.push_back(from);

    while (!stack.empty())
    {
        StepIdx current = stack.back();
        stack.pop_back();

        if (visited[current])
        {
            continue;
        }
        visited[current] = true;

        for (StepIdx successor : m_step_successors[current])
        {
            if (successor == target)
            {
                return true;
            }
            if (!visited[successor])
            {
                stack.push_back(successor);
            }
        }
    }

    return false;
}

std::optional<std::vector<StepIdx>> StepGraph::find_cycle() const
{
    enum class Mark
    {
        Unvisited,
        OnPath,
        Done
    };

    std::vector<Mark> marks(m_step_count, Mark::Unvisited);

    // Each frame is (step, index of the next successor to explore)
    std::vector<std::pair<StepIdx, size_t>> path;

    for (StepIdx root = 0; root < m_step_count; ++root)
    {
        if (marks[root] != Mark::Unvisited)
        {
            continue;
        }

        path.emplace_back(root, 0);
        marks[root] = Mark::OnPath;

        while (!path.empty())
        {
            auto& [current, next] = path.back();
            const auto& succ = m_step_successors[current];

            if (next >= succ.size())
            {
                marks[current] = Mark::Done;
                path.pop_back();
                continue;
            }

            StepIdx candidate = succ[next++];
            if (marks[candidate] == Mark::OnPath)
            {
                // Back edge: the cycle is the path suffix starting at candidate
                std::vector<StepIdx> cycle;
                bool in_cycle = false;
                for (const auto& frame : path)
                {
                    if (frame.first == candidate)
                    {
                        in_cycle = true;
                    }
                    if (in_cycle)
                    {
                        cycle.push_back(frame.first);
                    }
                }
                cycle.push_back(candidate);
                return cycle;
            }
            if (marks[candidate] == Mark::Unvisited)
            {
                marks[candidate] = Mark::OnPath;
                path.emplace_back(candidate, 0);
            }
        }
    }

    return std::nullopt;
}

std::vector<StepIdx> StepGraph::topological_order() const
{
    // Kahn's algorithm; a min-heap keeps ties in index order
    std::vector<size_t> in_degree(m_step_count, 0);
    for (StepIdx s = 0; s < m_step_count; ++s)
    {
        in_degree[s] = m_step_predecessors[s].size();
    }

    std::priority_queue<StepIdx, std::vector<StepIdx>, std::greater<StepIdx>> ready;
    for (StepIdx s = 0; s < m_step_count; ++s)
    {
        if (in_degree[s] == 0)
        {
            ready.push(s);
        }
    }

    std::vector<StepIdx> order;
    order.reserve(m_step_count);
    while (!ready.empty())
    {
        StepIdx s = ready.top();
        ready.pop();
        order.push_back(s);

        for (StepIdx succ : m_step_successors[s])
        {
            if (--in_degree[succ] == 0)
            {
                ready.push(succ);
            }
        }
    }

    if (order.size() < m_step_count)
    {
        std::string message = "Cycle detected in step dependencies among steps:";
        for (StepIdx s = 0; s < m_step_count; ++s)
        {
            if (in_degree[s] > 0)
            {
                message += " " + std::to_string(s);
            }
        }
        throw CyclicDependencyError(message);
    }

    return order;
}

std::vector<StepIdx> StepGraph::transitive_successors(StepIdx step_idx) const
{
    check_step_index(step_idx, "Step");

    std::vector<bool> visited(m_step_count, false);
    std::vector<StepIdx> stack(m_step_successors[step_idx].begin(),
                               m_step_successors[step_idx].end());
    while (!stack.empty())
    {
        StepIdx current = stack.back();
        stack.pop_back();
        if (visited[current])
        {
            continue;
        }
        visited[current] = true;
        for (StepIdx successor : m_step_successors[current])
        {
            if (!visited[successor])
            {
                stack.push_back(successor);
            }
        }
    }

    std::vector<StepIdx> result;
    for (StepIdx s = 0; s < m_step_count; ++s)
    {
        if (visited[s])
        {
            result.push_back(s);
        }
    }
    return result;
}

} // namespace jobtmpl
