#pragma once

// Small reference engines used by the demos: token-based replay over visible
// transitions and unit-cost alignments found by Dijkstra over (position, marking).
// Both assume small, bounded nets.

#include "engines.hpp"
#include "model_conversion.hpp"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <map>
#include <queue>
#include <stdexcept>
#include <utility>
#include <vector>

namespace demo
{
    using namespace tracecheck;

    inline bool enabled(const PetriNet &net, const Marking &m, TransitionId t)
    {
        for (const auto &a : net.arcs())
        {
            if (a.transition == t && a.direction == Arc::Direction::PlaceToTransition)
            {
                auto it = m.find(a.place);
                if (it == m.end() || it->second < a.weight)
                {
                    return false;
                }
            }
        }
        return true;
    }

    inline Marking fire(const PetriNet &net, Marking m, TransitionId t)
    {
        for (const auto &a : net.arcs())
        {
            if (a.transition != t)
            {
                continue;
            }
            if (a.direction == Arc::Direction::PlaceToTransition)
            {
                auto it = m.find(a.place);
                it->second -= a.weight;
                if (it->second == 0)
                {
                    m.erase(it);
                }
            }
            else
            {
                m[a.place] += a.weight;
            }
        }
        return m;
    }

    class TokenGameReplay final : public ITokenReplayEngine
    {
    public:
        std::vector<ReplayRecord> replay(const EventLog &log, const AcceptingPetriNet &model, const Properties &props) const override
        {
            std::vector<ReplayRecord> out;
            out.reserve(log.traces.size());
            for (const auto &trace : log.traces)
            {
                out.push_back(replay_trace_(trace, model, props));
            }
            return out;
        }

    private:
        static std::uint64_t tokens(const Marking &m)
        {
            std::uint64_t n = 0;
            for (const auto &[p, k] : m)
            {
                (void)p;
                n += k;
            }
            return n;
        }

        ReplayRecord replay_trace_(const Trace &trace, const AcceptingPetriNet &model, const Properties &props) const
        {
            const PetriNet &net = model.net;
            ReplayRecord r;
            Marking m = model.initialMarking;
            r.producedTokens = tokens(m);

            for (const auto &ev : trace.events)
            {
                const Activity &act = activity_of(ev, props.activity_key());
                const Transition *chosen = nullptr;
                for (const auto &t : net.transitions())
                {
                    if (t.label && *t.label == act)
                    {
                        if (!chosen || (enabled(net, m, t.id) && !enabled(net, m, chosen->id)))
                        {
                            chosen = &t;
                        }
                    }
                }
                if (!chosen)
                {
                    continue;
                }

                // Insert missing tokens, then fire.
                for (const auto &a : net.arcs())
                {
                    if (a.transition == chosen->id && a.direction == Arc::Direction::PlaceToTransition)
                    {
                        const std::uint32_t have = m.count(a.place) ? m[a.place] : 0;
                        if (have < a.weight)
                        {
                            r.missingTokens += a.weight - have;
                            m[a.place] = a.weight;
                        }
                        r.consumedTokens += a.weight;
                    }
                    else if (a.transition == chosen->id)
                    {
                        r.producedTokens += a.weight;
                    }
                }
                m = fire(net, std::move(m), chosen->id);
                r.activatedTransitions.push_back(chosen->name);
            }

            for (const auto &[p, w] : model.finalMarking)
            {
                const std::uint32_t have = m.count(p) ? m[p] : 0;
                if (have < w)
                {
                    r.missingTokens += w - have;
                    m.erase(p);
                }
                else
                {
                    m[p] -= w;
                    if (m[p] == 0)
                    {
                        m.erase(p);
                    }
                }
                r.consumedTokens += w;
            }
            r.remainingTokens = tokens(m);

            const double c = r.consumedTokens ? 1.0 - static_cast<double>(r.missingTokens) / static_cast<double>(r.consumedTokens) : 1.0;
            const double p = r.producedTokens ? 1.0 - static_cast<double>(r.remainingTokens) / static_cast<double>(r.producedTokens) : 1.0;
            r.traceFitness = 0.5 * c + 0.5 * p;
            r.traceIsFit = r.missingTokens == 0 && r.remainingTokens == 0;
            return r;
        }
    };

    // Unit costs for log moves and visible model moves; silent moves are free.
    class DijkstraAligner final : public IAlignmentEngine
    {
    public:
        explicit DijkstraAligner(std::uint64_t maxStates = 200000) : m_maxStates(maxStates) {}

        AlignmentRecord align(const Trace &trace, const AcceptingPetriNet &model, const Properties &props) const override
        {
            const std::vector<Activity> acts = activities_of(trace, props.activity_key());
            AlignmentRecord rec = search_(acts, model);
            const AlignmentRecord empty = search_({}, model);
            rec.bestWorstCost = empty.cost + static_cast<double>(acts.size());
            rec.fitness = rec.bestWorstCost > 0.0 ? 1.0 - rec.cost / rec.bestWorstCost : 1.0;
            return rec;
        }

        AlignmentRecord align(const Trace &trace, const ProcessTree &model, const Properties &props) const override
        {
            return align(trace, m_converter.to_petri_net(model), props);
        }

    private:
        struct Node
        {
            std::uint64_t cost;
            std::size_t pos;
            Marking marking;

            bool operator>(const Node &o) const { return cost > o.cost; }
        };

        using State = std::pair<std::size_t, Marking>;

        AlignmentRecord search_(const std::vector<Activity> &acts, const AcceptingPetriNet &model) const
        {
            const PetriNet &net = model.net;
            std::priority_queue<Node, std::vector<Node>, std::greater<Node>> open;
            std::map<State, std::uint64_t> best;
            std::map<State, std::pair<State, AlignmentMove>> parent;

            AlignmentRecord rec;
            open.push(Node{0, 0, model.initialMarking});
            best[State{0, model.initialMarking}] = 0;

            const auto relax = [&](const State &from, std::uint64_t cost, State to, AlignmentMove move)
            {
                ++rec.traversedArcs;
                auto it = best.find(to);
                if (it != best.end() && it->second <= cost)
                {
                    return;
                }
                best[to] = cost;
                parent[to] = {from, std::move(move)};
                ++rec.queuedStates;
                open.push(Node{cost, to.first, to.second});
            };

            while (!open.empty())
            {
                Node n = open.top();
                open.pop();
                const State cur{n.pos, n.marking};
                if (best[cur] < n.cost)
                {
                    continue;
                }
                if (++rec.visitedStates > m_maxStates)
                {
                    throw std::runtime_error("DijkstraAligner: state limit exceeded (unbounded net?)");
                }
                if (n.pos == acts.size() && n.marking == model.finalMarking)
                {
                    rec.cost = static_cast<double>(n.cost);
                    State s = cur;
                    while (parent.count(s))
                    {
                        auto &[prev, move] = parent.at(s);
                        rec.alignment.push_back(move);
                        s = prev;
                    }
                    std::reverse(rec.alignment.begin(), rec.alignment.end());
                    return rec;
                }

                if (n.pos < acts.size())
                {
                    relax(cur, n.cost + 1, State{n.pos + 1, n.marking}, AlignmentMove{AlignmentMove::Kind::LogOnly, acts[n.pos], false});
                }
                for (const auto &t : net.transitions())
                {
                    if (!enabled(net, n.marking, t.id))
                    {
                        continue;
                    }
                    Marking next = fire(net, n.marking, t.id);
                    if (!t.label)
                    {
                        relax(cur, n.cost, State{n.pos, next}, AlignmentMove{AlignmentMove::Kind::ModelOnly, {}, true});
                        continue;
                    }
                    if (n.pos < acts.size() && *t.label == acts[n.pos])
                    {
                        relax(cur, n.cost, State{n.pos + 1, next}, AlignmentMove{AlignmentMove::Kind::Synchronous, *t.label, false});
                    }
                    relax(cur, n.cost + 1, State{n.pos, std::move(next)}, AlignmentMove{AlignmentMove::Kind::ModelOnly, *t.label, false});
                }
            }
            throw std::runtime_error("DijkstraAligner: final marking is unreachable");
        }

        std::uint64_t m_maxStates;
        BuiltinModelConverter m_converter;
    };
}
