/**
 * @file step_graph.hpp
 */
#pragma once
#include "jobtmpl/common/common.hpp"
#include "jobtmpl/common/enums.hpp"
#include "jobtmpl/common/errors.hpp"

namespace jobtmpl
{

/**
 * @brief A directed graph of Step handles ordered by their dependencies.
 *
 * @details
 * `StepGraph` records which Steps must finish before which others. An edge
 * `before -> after` means every Task of `before` must succeed before any Task
 * of `after` may be assigned to a Session.
 *
 * @par Construction workflow
 * 1. Create a `StepGraph` instance.
 * 2. Add steps via `add_step()`, sequentially starting from 0.
 * 3. Link steps via `link_steps()`.
 * 4. Call `find_cycle()` or `topological_order()`.
 *
 * @par Validation
 * With eager validation, `link_steps()` rejects an edge that would close a
 * cycle. With lazy validation (the validator's mode, so that every problem is
 * reported at once) cycles are found later by `find_cycle()`.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Concurrent reads (const methods) are safe if no concurrent writes occur.
 */
class StepGraph
{
public:
    /**
     * @brief Constructor for StepGraph.
     * @param eager_validation If true, `link_steps()` throws on an edge that
     *        would create a cycle.
     */
    explicit StepGraph(bool eager_validation = true);

    /**
     * @brief Get the current number of steps in the graph.
     */
    size_t step_count() const noexcept;

    /**
     * @brief Add a step to the graph.
     * @param step_idx Index of the step to add. Must equal the current `step_count()`.
     * @throw ValidationError if step_idx is out of sequence or already exists.
     */
    void add_step(StepIdx step_idx);

    /**
     * @brief Declare that `step_after_idx` depends on `step_before_idx`.
     * @throw ValidationError if either index is invalid.
     * @throw CyclicDependencyError for a self-link, or when eager validation
     *        is enabled and the edge would close a cycle.
     * @note Linking the same pair twice is a no-op.
     */
    void link_steps(StepIdx step_before_idx, StepIdx step_after_idx);

    /**
     * @brief Steps that must complete before `step_idx`, in link order.
     */
    const std::vector<StepIdx>& predecessors(StepIdx step_idx) const;

    /**
     * @brief Steps that depend on `step_idx`, in link order.
     */
    const std::vector<StepIdx>& successors(StepIdx step_idx) const;

    /**
     * @brief Check whether `target` can be reached from `from` along edges.
     */
    bool is_reachable_from(StepIdx from, StepIdx target) const;

    /**
     * @brief Find one dependency cycle, if any.
     * @return The steps on the cycle in edge order, with the first step
     *         repeated at the end (e.g. `{0, 2, 0}`), or nullopt if the graph
     *         is acyclic. The search starts from the lowest step index, so the
     *         result is deterministic.
     */
    std::optional<std::vector<StepIdx>> find_cycle() const;

    /**
     * @brief Order the steps so that every step follows its predecessors.
     * @details Among steps that are ready at the same time, the lower index
     *          comes first.
     * @throw CyclicDependencyError if the graph has a cycle.
     */
    std::vector<StepIdx> topological_order() const;

    /**
     * @brief All steps that transitively depend on `step_idx`, ascending.
     */
    std::vector<StepIdx> transitive_successors(StepIdx step_idx) const;

private:
    bool m_eager_validation;

    /// Number of steps added via add_step().
    size_t m_step_count = 0;

    /// Adjacency lists indexed by step index.
    std::vector<std::vector<StepIdx>> m_step_successors;
    std::vector<std::vector<StepIdx>> m_step_predecessors;

    void check_step_index(StepIdx step_idx, const char* role) const;
};

} // namespace jobtmpl
