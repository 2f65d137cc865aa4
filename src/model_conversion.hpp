#pragma once

#include "engines.hpp"
#include "errors.hpp"
#include "model.hpp"

#include <optional>
#include <string>

namespace tracecheck
{
    class IModelConverter
    {
    public:
        virtual ~IModelConverter() = default;

        virtual AcceptingPetriNet to_petri_net(const ProcessTree &tree) const = 0;
        virtual AcceptingPetriNet to_petri_net(const FrequencyGraph &graph) const = 0;

        // Lifts a block-structured net back to a process tree, or nullopt when the
        // converter cannot. The fitness cascade uses the tree when one is given.
        virtual std::optional<ProcessTree> to_process_tree(const AcceptingPetriNet &) const { return std::nullopt; }
    };

    namespace detail
    {
        class TreeNetBuilder
        {
        public:
            explicit TreeNetBuilder(PetriNet &net) : m_net(net) {}

            void translate(const ProcessTree &node, PlaceId in, PlaceId out)
            {
                switch (node.op())
                {
                case TreeOperator::Leaf:
                {
                    const auto t = node.label() ? m_net.add_transition(fresh_("t_" + *node.label()), node.label())
                                                : m_net.add_transition(fresh_("tau"), std::nullopt);
                    m_net.add_input_arc(in, t);
                    m_net.add_output_arc(t, out);
                    return;
                }
                case TreeOperator::Sequence:
                {
                    PlaceId cur = in;
                    const auto &children = node.children();
                    for (std::size_t i = 0; i < children.size(); ++i)
                    {
                        const PlaceId next = (i + 1 == children.size()) ? out : m_net.add_place(fresh_("p_seq"));
                        translate(children[i], cur, next);
                        cur = next;
                    }
                    return;
                }
                case TreeOperator::Xor:
                    for (const auto &c : node.children())
                    {
                        translate(c, in, out);
                    }
                    return;
                case TreeOperator::Parallel:
                {
                    const auto split = m_net.add_transition(fresh_("tau_split"), std::nullopt);
                    const auto join = m_net.add_transition(fresh_("tau_join"), std::nullopt);
                    m_net.add_input_arc(in, split);
                    m_net.add_output_arc(join, out);
                    for (const auto &c : node.children())
                    {
                        const PlaceId cin = m_net.add_place(fresh_("p_par_in"));
                        const PlaceId cout = m_net.add_place(fresh_("p_par_out"));
                        m_net.add_output_arc(split, cin);
                        m_net.add_input_arc(cout, join);
                        translate(c, cin, cout);
                    }
                    return;
                }
                case TreeOperator::Loop:
                {
                    // Private entry/exit places keep redo tokens from re-enabling
                    // sibling branches that share `in`.
                    const PlaceId doIn = m_net.add_place(fresh_("p_loop_do"));
                    const PlaceId doOut = m_net.add_place(fresh_("p_loop_redo"));
                    const auto enter = m_net.add_transition(fresh_("tau_loop_enter"), std::nullopt);
                    const auto exit = m_net.add_transition(fresh_("tau_loop_exit"), std::nullopt);
                    m_net.add_input_arc(in, enter);
                    m_net.add_output_arc(enter, doIn);
                    m_net.add_input_arc(doOut, exit);
                    m_net.add_output_arc(exit, out);

                    const auto &children = node.children();
                    translate(children[0], doIn, doOut);
                    for (std::size_t i = 1; i < children.size(); ++i)
                    {
                        translate(children[i], doOut, doIn);
                    }
                    return;
                }
                }
                throw UnsupportedModelError("process tree: unknown operator");
            }

        private:
            std::string fresh_(const std::string &prefix)
            {
                return prefix + "_" + std::to_string(m_counter++);
            }

            PetriNet &m_net;
            std::uint64_t m_counter = 0;
        };
    }

    // Block-wise translation of trees and frequency graphs into accepting nets.
    class BuiltinModelConverter final : public IModelConverter
    {
    public:
        AcceptingPetriNet to_petri_net(const ProcessTree &tree) const override
        {
            AcceptingPetriNet out;
            out.net = PetriNet("process_tree");
            const PlaceId source = out.net.add_place("source");
            const PlaceId sink = out.net.add_place("sink");

            detail::TreeNetBuilder builder(out.net);
            builder.translate(tree, source, sink);

            out.initialMarking[source] = 1;
            out.finalMarking[sink] = 1;
            return out;
        }

        // One visible transition per activity between its own pre/post places;
        // graph edges, start and end activities become silent transitions.
        AcceptingPetriNet to_petri_net(const FrequencyGraph &graph) const override
        {
            AcceptingPetriNet out;
            out.net = PetriNet("frequency_graph");
            const PlaceId source = out.net.add_place("source");
            const PlaceId sink = out.net.add_place("sink");

            std::map<Activity, std::pair<PlaceId, PlaceId>> prePost;
            for (const auto &act : graph.activities())
            {
                const PlaceId pre = out.net.add_place("pre_" + act);
                const PlaceId post = out.net.add_place("post_" + act);
                const auto t = out.net.add_transition("t_" + act, act);
                out.net.add_input_arc(pre, t);
                out.net.add_output_arc(t, post);
                prePost.emplace(act, std::make_pair(pre, post));
            }

            for (const auto &[act, n] : graph.startActivities)
            {
                (void)n;
                const auto t = out.net.add_transition("tau_start_" + act, std::nullopt);
                out.net.add_input_arc(source, t);
                out.net.add_output_arc(t, prePost.at(act).first);
            }
            for (const auto &[edge, n] : graph.directlyFollows)
            {
                (void)n;
                const auto t = out.net.add_transition("tau_" + edge.first + "_" + edge.second, std::nullopt);
                out.net.add_input_arc(prePost.at(edge.first).second, t);
                out.net.add_output_arc(t, prePost.at(edge.second).first);
            }
            for (const auto &[act, n] : graph.endActivities)
            {
                (void)n;
                const auto t = out.net.add_transition("tau_end_" + act, std::nullopt);
                out.net.add_input_arc(prePost.at(act).second, t);
                out.net.add_output_arc(t, sink);
            }

            out.initialMarking[source] = 1;
            out.finalMarking[sink] = 1;
            return out;
        }
    };
}
