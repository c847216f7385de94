/**
 * @file combination_expr.cpp
 */
#include "jobtmpl/expansion/combination_expr.hpp"

#include <cctype>
#include <set>

namespace jobtmpl
{

namespace
{

// ============================================================================
// Parser
// ============================================================================

class CombinationParser
{
public:
    explicit CombinationParser(const std::string& text)
        : m_text(text)
    {
    }

    CombinationNode parse()
    {
        skip_space();
        if (m_pos >= m_text.size())
        {
            fail("expression is empty");
        }
        CombinationNode root = parse_expr();
        skip_space();
        if (m_pos < m_text.size())
        {
            fail("unexpected '" + std::string(1, m_text[m_pos]) + "'");
        }
        return root;
    }

private:
    const std::string& m_text;
    size_t m_pos = 0;

    void skip_space()
    {
        while (m_pos < m_text.size() && std::isspace(static_cast<unsigned char>(m_text[m_pos])))
        {
            ++m_pos;
        }
    }

    bool accept(char c)
    {
        skip_space();
        if (m_pos < m_text.size() && m_text[m_pos] == c)
        {
            ++m_pos;
            return true;
        }
        return false;
    }

    [[noreturn]] void fail(const std::string& detail) const
    {
        throw ValidationError("Invalid combination expression '" + m_text + "' at offset " +
                              std::to_string(m_pos) + ": " + detail);
    }

    CombinationNode parse_expr()
    {
        CombinationNode first = parse_term();
        if (!accept('*'))
        {
            return first;
        }

        CombinationNode product;
        product.kind = CombinationNode::Kind::Product;
        product.children.push_back(std::move(first));
        do
        {
            product.children.push_back(parse_term());
        } while (accept('*'));
        return product;
    }

    CombinationNode parse_term()
    {
        skip_space();
        if (accept('('))
        {
            std::vector<CombinationNode> members;
            members.push_back(parse_expr());
            while (accept(','))
            {
                members.push_back(parse_expr());
            }
            if (!accept(')'))
            {
                fail("expected ',' or ')'");
            }
            if (members.size() == 1)
            {
                return std::move(members.front());
            }
            CombinationNode association;
            association.kind = CombinationNode::Kind::Association;
            association.children = std::move(members);
            return association;
        }

        const size_t begin = m_pos;
        while (m_pos < m_text.size() &&
               (std::isalnum(static_cast<unsigned char>(m_text[m_pos])) || m_text[m_pos] == '_'))
        {
            ++m_pos;
        }
        if (m_pos == begin)
        {
            if (m_pos >= m_text.size())
            {
                fail("unexpected end of expression");
            }
            fail("expected a parameter name or '('");
        }
        if (std::isdigit(static_cast<unsigned char>(m_text[begin])))
        {
            m_pos = begin;
            fail("parameter names cannot start with a digit");
        }

        CombinationNode leaf;
        leaf.kind = CombinationNode::Kind::Parameter;
        leaf.name = m_text.substr(begin, m_pos - begin);
        return leaf;
    }
};

void collect_leaves(CombinationNode& node, std::vector<CombinationNode*>& leaves)
{
    if (node.kind == CombinationNode::Kind::Parameter)
    {
        leaves.push_back(&node);
        return;
    }
    for (auto& child : node.children)
    {
        collect_leaves(child, leaves);
    }
}

std::string describe_member(const CombinationNode& node)
{
    return node.kind == CombinationNode::Kind::Parameter ? node.name : "(" + to_string(node) + ")";
}

} // namespace

// ============================================================================
// Public API
// ============================================================================

CombinationNode parse_combination_expression(const std::string& text)
{
    return CombinationParser(text).parse();
}

CombinationNode default_combination(const std::vector<std::string>& names)
{
    if (names.size() == 1)
    {
        CombinationNode leaf;
        leaf.name = names.front();
        return leaf;
    }

    CombinationNode product;
    product.kind = CombinationNode::Kind::Product;
    for (const auto& name : names)
    {
        CombinationNode leaf;
        leaf.name = name;
        product.children.push_back(std::move(leaf));
    }
    return product;
}

std::vector<std::string> bind_combination(CombinationNode& root, const std::vector<std::string>& names)
{
    std::vector<std::string> problems;

    std::unordered_map<std::string, TaskParamIdx> handles;
    for (size_t i = 0; i < names.size(); ++i)
    {
        handles.emplace(names[i], i);
    }

    std::vector<CombinationNode*> leaves;
    collect_leaves(root, leaves);

    std::set<std::string> seen;
    for (CombinationNode* leaf : leaves)
    {
        auto it = handles.find(leaf->name);
        if (it == handles.end())
        {
            problems.push_back("Combination expression references undefined task parameter '" +
                               leaf->name + "'");
            continue;
        }
        if (!seen.insert(leaf->name).second)
        {
            problems.push_back("Combination expression uses task parameter '" + leaf->name +
                               "' more than once");
            continue;
        }
        leaf->handle = it->second;
    }

    for (const auto& name : names)
    {
        if (seen.count(name) == 0)
        {
            problems.push_back("Combination expression does not use task parameter '" + name + "'");
        }
    }

    return problems;
}

std::string to_string(const CombinationNode& node)
{
    switch (node.kind)
    {
    case CombinationNode::Kind::Parameter:
        return node.name;
    case CombinationNode::Kind::Product:
    {
        std::string result;
        for (size_t i = 0; i < node.children.size(); ++i)
        {
            if (i > 0)
            {
                result += " * ";
            }
            const auto& child = node.children[i];
            result += child.kind == CombinationNode::Kind::Product ? "(" + to_string(child) + ")"
                                                                   : to_string(child);
        }
        return result;
    }
    case CombinationNode::Kind::Association:
    {
        std::string result = "(";
        for (size_t i = 0; i < node.children.size(); ++i)
        {
            if (i > 0)
            {
                result += ", ";
            }
            result += to_string(node.children[i]);
        }
        return result + ")";
    }
    }
    return std::string();
}

size_t combination_size(const CombinationNode& node, const std::vector<size_t>& value_counts)
{
    switch (node.kind)
    {
    case CombinationNode::Kind::Parameter:
        if (node.handle >= value_counts.size())
        {
            throw ValidationError("Task parameter '" + node.name + "' is not bound");
        }
        return value_counts[node.handle];
    case CombinationNode::Kind::Product:
    {
        size_t total = 1;
        for (const auto& child : node.children)
        {
            total *= combination_size(child, value_counts);
        }
        return total;
    }
    case CombinationNode::Kind::Association:
    {
        const size_t first = combination_size(node.children.front(), value_counts);
        for (size_t i = 1; i < node.children.size(); ++i)
        {
            const size_t other = combination_size(node.children[i], value_counts);
            if (other != first)
            {
                throw AssociationCardinalityError(
                    "Association " + to_string(node) + " requires equal sizes, but " +
                    describe_member(node.children.front()) + " has " + std::to_string(first) +
                    " value(s) and " + describe_member(node.children[i]) + " has " +
                    std::to_string(other));
            }
        }
        return first;
    }
    }
    return 0;
}

std::vector<CombinationRow> evaluate_combination(const CombinationNode& node,
                                                 const std::vector<size_t>& value_counts)
{
    // Checks cardinalities before any rows are materialized
    const size_t total = combination_size(node, value_counts);

    switch (node.kind)
    {
    case CombinationNode::Kind::Parameter:
    {
        std::vector<CombinationRow> rows;
        rows.reserve(total);
        for (size_t v = 0; v < total; ++v)
        {
            CombinationRow row(value_counts.size(), 0);
            row[node.handle] = v;
            rows.push_back(std::move(row));
        }
        return rows;
    }
    case CombinationNode::Kind::Product:
    {
        std::vector<CombinationRow> rows{CombinationRow(value_counts.size(), 0)};
        for (const auto& child : node.children)
        {
            const auto child_rows = evaluate_combination(child, value_counts);
            std::vector<CombinationRow> next;
            next.reserve(rows.size() * child_rows.size());
            for (const auto& outer : rows)
            {
                for (const auto& inner : child_rows)
                {
                    // Each handle occurs in exactly one child, so slots merge by addition
                    CombinationRow merged = outer;
                    for (size_t h = 0; h < merged.size(); ++h)
                    {
                        merged[h] += inner[h];
                    }
                    next.push_back(std::move(merged));
                }
            }
            rows = std::move(next);
        }
        return rows;
    }
    case CombinationNode::Kind::Association:
    {
        std::vector<CombinationRow> rows(total, CombinationRow(value_counts.size(), 0));
        for (const auto& child : node.children)
        {
            const auto child_rows = evaluate_combination(child, value_counts);
            for (size_t r = 0; r < total; ++r)
            {
                for (size_t h = 0; h < value_counts.size(); ++h)
                {
                    rows[r][h] += child_rows[r][h];
                }
            }
        }
        return rows;
    }
    }
    return {};
}

} // namespace jobtmpl
