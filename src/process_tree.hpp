#pragma once

#include "common.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace tracecheck
{
    enum class TreeOperator : std::uint8_t
    {
        Leaf = 0,
        Sequence = 1,
        Xor = 2,
        Parallel = 3,
        // Children: [do, redo...]. The do-part runs at least once; each redo is
        // followed by another do.
        Loop = 4,
    };

    inline const char *tree_operator_name(TreeOperator op) noexcept
    {
        switch (op)
        {
        case TreeOperator::Leaf:
            return "leaf";
        case TreeOperator::Sequence:
            return "->";
        case TreeOperator::Xor:
            return "X";
        case TreeOperator::Parallel:
            return "+";
        case TreeOperator::Loop:
            return "*";
        }
        return "?";
    }

    // Block-structured model. Leaves carry a label (std::nullopt = silent);
    // inner nodes carry an operator and an ordered list of children.
    class ProcessTree
    {
    public:
        static ProcessTree leaf(Activity label)
        {
            ProcessTree t;
            t.m_label = std::move(label);
            return t;
        }

        static ProcessTree silent() { return ProcessTree{}; }

        static ProcessTree node(TreeOperator op, std::vector<ProcessTree> children)
        {
            if (op == TreeOperator::Leaf)
            {
                throw std::invalid_argument("ProcessTree::node: use leaf() or silent() for leaves");
            }
            if (children.empty())
            {
                throw std::invalid_argument(std::string("ProcessTree::node: operator ") + tree_operator_name(op) + " requires children");
            }
            if (op == TreeOperator::Loop && children.size() < 2)
            {
                throw std::invalid_argument("ProcessTree::node: loop requires a do-part and at least one redo-part");
            }
            ProcessTree t;
            t.m_op = op;
            t.m_children = std::move(children);
            return t;
        }

        TreeOperator op() const noexcept { return m_op; }
        bool is_leaf() const noexcept { return m_op == TreeOperator::Leaf; }
        bool is_silent() const noexcept { return is_leaf() && !m_label; }
        const std::optional<Activity> &label() const noexcept { return m_label; }
        const std::vector<ProcessTree> &children() const noexcept { return m_children; }

        ActivitySet activities() const
        {
            ActivitySet out;
            collect_activities_(out);
            return out;
        }

        std::string to_string() const
        {
            if (is_leaf())
            {
                return m_label ? "'" + *m_label + "'" : "tau";
            }
            std::string out = std::string(tree_operator_name(m_op)) + "( ";
            for (std::size_t i = 0; i < m_children.size(); ++i)
            {
                if (i != 0)
                {
                    out += ", ";
                }
                out += m_children[i].to_string();
            }
            return out + " )";
        }

    private:
        void collect_activities_(ActivitySet &out) const
        {
            if (m_label)
            {
                out.insert(*m_label);
            }
            for (const auto &c : m_children)
            {
                c.collect_activities_(out);
            }
        }

        TreeOperator m_op = TreeOperator::Leaf;
        std::optional<Activity> m_label;
        std::vector<ProcessTree> m_children;
    };
}
