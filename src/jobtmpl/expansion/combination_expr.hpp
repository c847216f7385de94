/**
 * @file combination_expr.hpp
 * @brief Combination expressions over task parameter names.
 */
#pragma once
#include "jobtmpl/common/common.hpp"
#include "jobtmpl/common/enums.hpp"
#include "jobtmpl/common/errors.hpp"

namespace jobtmpl
{

/**
 * @brief A node of a parsed combination expression.
 *
 * @details
 * - `Parameter`: leaf naming one task parameter.
 * - `Product`: Cartesian product of the children, left child varying slowest.
 * - `Association`: children zipped positionally; all children must produce
 *   the same number of tuples.
 */
struct CombinationNode
{
    enum class Kind
    {
        Parameter,
        Product,
        Association
    };

    Kind kind{Kind::Parameter};

    /// Parameter name (Parameter nodes only).
    std::string name;

    /// Bound task parameter handle (Parameter nodes only).
    TaskParamIdx handle{k_unbound_handle};

    std::vector<CombinationNode> children;
};

/**
 * @brief Parse a combination expression.
 *
 * @details
 * Grammar (whitespace is ignored):
 * @code
 *   expr := term ('*' term)*
 *   term := NAME | '(' expr (',' expr)* ')'
 * @endcode
 * A parenthesized group with a single member is plain grouping.
 *
 * @throw ValidationError naming the offending offset on a syntax error.
 */
CombinationNode parse_combination_expression(const std::string& text);

/**
 * @brief The expression used when a Step omits `combination`: the product of
 *        all task parameters in declaration order.
 */
CombinationNode default_combination(const std::vector<std::string>& names);

/**
 * @brief Bind leaf names to handles (`names[i]` gets handle `i`).
 * @return Problems found: unknown names, names used more than once, and
 *         declared parameters the expression does not use.
 */
std::vector<std::string> bind_combination(CombinationNode& root, const std::vector<std::string>& names);

/**
 * @brief Render the expression in canonical form, e.g. `A * (B, C)`.
 */
std::string to_string(const CombinationNode& node);

/**
 * @brief Number of tuples the node produces given per-parameter value counts.
 * @throw AssociationCardinalityError if an association's members disagree.
 */
size_t combination_size(const CombinationNode& node, const std::vector<size_t>& value_counts);

/**
 * @brief One tuple of the expansion: a value index per task parameter handle.
 */
using CombinationRow = std::vector<size_t>;

/**
 * @brief Evaluate the expression into value-index tuples.
 *
 * @details
 * Each row has one slot per handle in `value_counts`; slot `h` holds the
 * index into that parameter's value sequence. The order is the nested-loop
 * order of the expression, left operand varying slowest, so re-evaluation
 * always yields the identical sequence.
 *
 * @throw AssociationCardinalityError if an association's members disagree,
 *        naming the members and their sizes.
 */
std::vector<CombinationRow> evaluate_combination(const CombinationNode& node,
                                                 const std::vector<size_t>& value_counts);

} // namespace jobtmpl
