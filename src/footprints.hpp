#pragma once

#include "common.hpp"
#include "errors.hpp"
#include "event_log.hpp"
#include "log.hpp"
#include "model.hpp"
#include "properties.hpp"

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <map>
#include <optional>
#include <vector>

namespace tracecheck
{
    // Behavioural footprint of a log, a trace or a model.
    //
    // `sequence` holds pairs observed (or possible) only in one direction,
    // `parallel` pairs observed in both directions or unordered by the model.
    // Every other pair is "never follows".
    struct Footprint
    {
        PairSet sequence;
        PairSet parallel;
        ActivitySet activities;
        ActivitySet startActivities;
        ActivitySet endActivities;
        // Activities that occur in every execution (models) or every trace (logs).
        ActivitySet alwaysExecuted;
        std::size_t minTraceLength = 0;

        // Directly-follows frequencies; filled for logs and traces only.
        std::map<ActivityPair, std::uint64_t> directlyFollows;
        // Trace-level footprints only.
        std::optional<std::size_t> traceLength;

        PairSet configurations() const
        {
            PairSet out = sequence;
            out.insert(parallel.begin(), parallel.end());
            return out;
        }
    };

    struct TraceFootprintDiagnostics
    {
        PairSet footprints;
        ActivitySet startActivities;
        ActivitySet endActivities;
        ActivitySet activitiesNotExecuted;
        std::size_t traceLength = 0;
        bool minLengthFit = true;
        bool isFootprintsFit = true;
    };

    struct LogFootprintDiagnostics
    {
        PairSet footprints;
        ActivitySet startActivities;
        ActivitySet endActivities;
        ActivitySet activitiesNotExecuted;
        bool minLengthFit = true;
        bool isFootprintsFit = true;
    };

    class IFootprintEngine
    {
    public:
        virtual ~IFootprintEngine() = default;

        virtual Footprint discover(const EventLog &log, const Properties &props) const = 0;
        virtual std::vector<Footprint> discover_per_trace(const EventLog &log, const Properties &props) const = 0;
        virtual Footprint discover(const ProcessTree &tree) const = 0;
        virtual Footprint discover(const AcceptingPetriNet &model) const = 0;
    };

    namespace detail
    {
        inline void split_relations(Footprint &fp)
        {
            for (const auto &[pair, n] : fp.directlyFollows)
            {
                (void)n;
                const ActivityPair rev{pair.second, pair.first};
                if (fp.directlyFollows.count(rev) != 0)
                {
                    fp.parallel.insert(pair);
                }
                else
                {
                    fp.sequence.insert(pair);
                }
            }
        }

        inline Footprint trace_footprint(const std::vector<Activity> &acts)
        {
            Footprint fp;
            fp.activities.insert(acts.begin(), acts.end());
            fp.alwaysExecuted = fp.activities;
            fp.minTraceLength = acts.size();
            fp.traceLength = acts.size();
            if (!acts.empty())
            {
                fp.startActivities.insert(acts.front());
                fp.endActivities.insert(acts.back());
            }
            for (std::size_t i = 1; i < acts.size(); ++i)
            {
                ++fp.directlyFollows[ActivityPair{acts[i - 1], acts[i]}];
            }
            split_relations(fp);
            return fp;
        }

        // Bottom-up footprint of a process tree node. `df` over-approximates the
        // directly-follows relation the subtree can produce.
        struct TreeFootprint
        {
            ActivitySet activities;
            ActivitySet start;
            ActivitySet end;
            ActivitySet always;
            PairSet df;
            PairSet parallel;
            bool skippable = false;
            std::size_t minLength = 0;
        };

        inline void add_product(PairSet &out, const ActivitySet &a, const ActivitySet &b)
        {
            for (const auto &x : a)
            {
                for (const auto &y : b)
                {
                    out.insert(ActivityPair{x, y});
                }
            }
        }

        inline void merge_relations(TreeFootprint &into, const TreeFootprint &c)
        {
            into.activities.insert(c.activities.begin(), c.activities.end());
            into.df.insert(c.df.begin(), c.df.end());
            into.parallel.insert(c.parallel.begin(), c.parallel.end());
        }

        inline TreeFootprint tree_footprint(const ProcessTree &node)
        {
            TreeFootprint out;
            if (node.is_leaf())
            {
                if (node.label())
                {
                    out.activities = {*node.label()};
                    out.start = out.end = out.always = out.activities;
                    out.minLength = 1;
                }
                else
                {
                    out.skippable = true;
                }
                return out;
            }

            std::vector<TreeFootprint> cs;
            cs.reserve(node.children().size());
            for (const auto &c : node.children())
            {
                cs.push_back(tree_footprint(c));
            }

            switch (node.op())
            {
            case TreeOperator::Xor:
            {
                out.always = cs.front().always;
                out.minLength = cs.front().minLength;
                for (const auto &c : cs)
                {
                    merge_relations(out, c);
                    out.start.insert(c.start.begin(), c.start.end());
                    out.end.insert(c.end.begin(), c.end.end());
                    out.skippable = out.skippable || c.skippable;
                    out.minLength = std::min(out.minLength, c.minLength);
                    ActivitySet keep;
                    std::set_intersection(out.always.begin(), out.always.end(), c.always.begin(), c.always.end(),
                                          std::inserter(keep, keep.end()));
                    out.always = std::move(keep);
                }
                break;
            }
            case TreeOperator::Sequence:
            {
                out.skippable = true;
                for (std::size_t i = 0; i < cs.size(); ++i)
                {
                    merge_relations(out, cs[i]);
                    out.always.insert(cs[i].always.begin(), cs[i].always.end());
                    out.minLength += cs[i].minLength;
                    out.skippable = out.skippable && cs[i].skippable;

                    // end(i) -> start(j) when every child strictly between them can be skipped.
                    for (std::size_t j = i + 1; j < cs.size(); ++j)
                    {
                        add_product(out.df, cs[i].end, cs[j].start);
                        if (!cs[j].skippable)
                        {
                            break;
                        }
                    }
                }
                for (const auto &c : cs)
                {
                    out.start.insert(c.start.begin(), c.start.end());
                    if (!c.skippable)
                    {
                        break;
                    }
                }
                for (auto it = cs.rbegin(); it != cs.rend(); ++it)
                {
                    out.end.insert(it->end.begin(), it->end.end());
                    if (!it->skippable)
                    {
                        break;
                    }
                }
                break;
            }
            case TreeOperator::Parallel:
            {
                out.skippable = true;
                for (std::size_t i = 0; i < cs.size(); ++i)
                {
                    merge_relations(out, cs[i]);
                    out.start.insert(cs[i].start.begin(), cs[i].start.end());
                    out.end.insert(cs[i].end.begin(), cs[i].end.end());
                    out.always.insert(cs[i].always.begin(), cs[i].always.end());
                    out.minLength += cs[i].minLength;
                    out.skippable = out.skippable && cs[i].skippable;
                    for (std::size_t j = 0; j < cs.size(); ++j)
                    {
                        if (i != j)
                        {
                            add_product(out.parallel, cs[i].activities, cs[j].activities);
                        }
                    }
                }
                break;
            }
            case TreeOperator::Loop:
            {
                const TreeFootprint &body = cs.front();
                for (const auto &c : cs)
                {
                    merge_relations(out, c);
                }
                out.start = body.start;
                out.end = body.end;
                out.always = body.always;
                out.minLength = body.minLength;
                out.skippable = body.skippable;

                // Entry and exit of a redo can see through skippable parts.
                for (std::size_t i = 1; i < cs.size(); ++i)
                {
                    const TreeFootprint &redo = cs[i];
                    add_product(out.df, body.end, redo.start);
                    add_product(out.df, redo.end, body.start);
                    if (redo.skippable)
                    {
                        add_product(out.df, body.end, body.start);
                    }
                    if (body.skippable)
                    {
                        add_product(out.df, redo.end, redo.start);
                        out.start.insert(redo.start.begin(), redo.start.end());
                        out.end.insert(redo.end.begin(), redo.end.end());
                        for (std::size_t k = 1; k < cs.size(); ++k)
                        {
                            add_product(out.df, redo.end, cs[k].start);
                        }
                    }
                }
                break;
            }
            case TreeOperator::Leaf:
                break;
            }
            return out;
        }
    }

    // Footprint discovery for logs, traces and process trees. Petri nets need a
    // reachability-based engine and are rejected.
    class BuiltinFootprintEngine final : public IFootprintEngine
    {
    public:
        Footprint discover(const EventLog &log, const Properties &props) const override
        {
            Footprint fp;
            bool first = true;
            for (const auto &trace : log.traces)
            {
                const auto acts = activities_of(trace, props.activity_key());
                Footprint t = detail::trace_footprint(acts);
                fp.activities.insert(t.activities.begin(), t.activities.end());
                fp.startActivities.insert(t.startActivities.begin(), t.startActivities.end());
                fp.endActivities.insert(t.endActivities.begin(), t.endActivities.end());
                for (const auto &[pair, n] : t.directlyFollows)
                {
                    fp.directlyFollows[pair] += n;
                }
                if (first)
                {
                    fp.alwaysExecuted = t.alwaysExecuted;
                    fp.minTraceLength = acts.size();
                    first = false;
                }
                else
                {
                    ActivitySet keep;
                    std::set_intersection(fp.alwaysExecuted.begin(), fp.alwaysExecuted.end(),
                                          t.alwaysExecuted.begin(), t.alwaysExecuted.end(),
                                          std::inserter(keep, keep.end()));
                    fp.alwaysExecuted = std::move(keep);
                    fp.minTraceLength = std::min(fp.minTraceLength, acts.size());
                }
            }
            detail::split_relations(fp);
            return fp;
        }

        std::vector<Footprint> discover_per_trace(const EventLog &log, const Properties &props) const override
        {
            std::vector<Footprint> out;
            out.reserve(log.traces.size());
            for (const auto &trace : log.traces)
            {
                out.push_back(detail::trace_footprint(activities_of(trace, props.activity_key())));
            }
            return out;
        }

        Footprint discover(const ProcessTree &tree) const override
        {
            const detail::TreeFootprint t = detail::tree_footprint(tree);
            Footprint fp;
            fp.activities = t.activities;
            fp.startActivities = t.start;
            fp.endActivities = t.end;
            fp.alwaysExecuted = t.always;
            fp.minTraceLength = t.minLength;
            for (const auto &pair : t.df)
            {
                const ActivityPair rev{pair.second, pair.first};
                if (t.df.count(rev) != 0 || t.parallel.count(pair) != 0)
                {
                    fp.parallel.insert(pair);
                }
                else
                {
                    fp.sequence.insert(pair);
                }
            }
            fp.parallel.insert(t.parallel.begin(), t.parallel.end());
            return fp;
        }

        Footprint discover(const AcceptingPetriNet &) const override
        {
            throw UnsupportedModelError("footprint discovery on Petri nets requires a reachability-based footprint engine");
        }
    };

    // Compares each trace footprint against the model footprint.
    inline std::vector<TraceFootprintDiagnostics> compare_footprints_per_trace(const std::vector<Footprint> &traces, const Footprint &model)
    {
        const PairSet modelConf = model.configurations();
        std::vector<TraceFootprintDiagnostics> out;
        out.reserve(traces.size());
        for (const auto &tr : traces)
        {
            TraceFootprintDiagnostics d;
            for (const auto &pair : tr.configurations())
            {
                if (modelConf.count(pair) == 0)
                {
                    d.footprints.insert(pair);
                }
            }
            if (!model.startActivities.empty())
            {
                std::set_difference(tr.startActivities.begin(), tr.startActivities.end(),
                                    model.startActivities.begin(), model.startActivities.end(),
                                    std::inserter(d.startActivities, d.startActivities.end()));
            }
            if (!model.endActivities.empty())
            {
                std::set_difference(tr.endActivities.begin(), tr.endActivities.end(),
                                    model.endActivities.begin(), model.endActivities.end(),
                                    std::inserter(d.endActivities, d.endActivities.end()));
            }
            std::set_difference(model.alwaysExecuted.begin(), model.alwaysExecuted.end(),
                                tr.activities.begin(), tr.activities.end(),
                                std::inserter(d.activitiesNotExecuted, d.activitiesNotExecuted.end()));
            d.traceLength = tr.traceLength.value_or(tr.minTraceLength);
            d.minLengthFit = d.traceLength >= model.minTraceLength;
            d.isFootprintsFit = d.footprints.empty() && d.startActivities.empty() && d.endActivities.empty() &&
                                d.activitiesNotExecuted.empty() && d.minLengthFit;
            out.push_back(std::move(d));
        }
        return out;
    }

    inline LogFootprintDiagnostics compare_footprints(const Footprint &log, const Footprint &model)
    {
        const PairSet modelConf = model.configurations();
        LogFootprintDiagnostics d;
        for (const auto &pair : log.configurations())
        {
            if (modelConf.count(pair) == 0)
            {
                d.footprints.insert(pair);
            }
        }
        if (!model.startActivities.empty())
        {
            std::set_difference(log.startActivities.begin(), log.startActivities.end(),
                                model.startActivities.begin(), model.startActivities.end(),
                                std::inserter(d.startActivities, d.startActivities.end()));
        }
        if (!model.endActivities.empty())
        {
            std::set_difference(log.endActivities.begin(), log.endActivities.end(),
                                model.endActivities.begin(), model.endActivities.end(),
                                std::inserter(d.endActivities, d.endActivities.end()));
        }
        std::set_difference(model.alwaysExecuted.begin(), model.alwaysExecuted.end(),
                            log.alwaysExecuted.begin(), log.alwaysExecuted.end(),
                            std::inserter(d.activitiesNotExecuted, d.activitiesNotExecuted.end()));
        d.minLengthFit = log.minTraceLength >= model.minTraceLength;
        d.isFootprintsFit = d.footprints.empty() && d.startActivities.empty() && d.endActivities.empty() &&
                            d.activitiesNotExecuted.empty() && d.minLengthFit;
        return d;
    }

    struct FootprintFitness
    {
        double logFitness = 1.0;
        // Only defined for trace-extensive diagnostics (0..100).
        std::optional<double> percentageOfFittingTraces;
    };

    namespace detail
    {
        inline Footprint flatten(const std::vector<Footprint> &traces)
        {
            Footprint fp;
            for (const auto &t : traces)
            {
                for (const auto &[pair, n] : t.directlyFollows)
                {
                    fp.directlyFollows[pair] += n;
                }
                fp.sequence.insert(t.sequence.begin(), t.sequence.end());
                fp.parallel.insert(t.parallel.begin(), t.parallel.end());
                fp.activities.insert(t.activities.begin(), t.activities.end());
                fp.startActivities.insert(t.startActivities.begin(), t.startActivities.end());
                fp.endActivities.insert(t.endActivities.begin(), t.endActivities.end());
            }
            return fp;
        }

        // Share of directly-follows occurrences (or, without frequencies, of
        // distinct relations) not flagged as deviating.
        inline double relation_fitness(const Footprint &log, const PairSet &deviations)
        {
            if (!log.directlyFollows.empty())
            {
                std::uint64_t total = 0;
                std::uint64_t deviating = 0;
                for (const auto &[pair, n] : log.directlyFollows)
                {
                    total += n;
                    if (deviations.count(pair) != 0)
                    {
                        deviating += n;
                    }
                }
                return total == 0 ? 1.0 : 1.0 - static_cast<double>(deviating) / static_cast<double>(total);
            }
            const std::size_t relations = log.sequence.size() + log.parallel.size();
            return relations == 0 ? 1.0 : 1.0 - static_cast<double>(deviations.size()) / static_cast<double>(relations);
        }
    }

    inline FootprintFitness footprint_fitness(const std::vector<Footprint> &traces, const std::vector<TraceFootprintDiagnostics> &diagnostics)
    {
        FootprintFitness out;
        PairSet deviations;
        std::size_t fit = 0;
        for (const auto &d : diagnostics)
        {
            deviations.insert(d.footprints.begin(), d.footprints.end());
            if (d.isFootprintsFit)
            {
                ++fit;
            }
        }
        out.percentageOfFittingTraces = diagnostics.empty() ? 0.0 : 100.0 * static_cast<double>(fit) / static_cast<double>(diagnostics.size());
        out.logFitness = detail::relation_fitness(detail::flatten(traces), deviations);
        return out;
    }

    inline FootprintFitness footprint_fitness(const Footprint &log, const LogFootprintDiagnostics &diagnostics)
    {
        FootprintFitness out;
        out.logFitness = detail::relation_fitness(log, diagnostics.footprints);
        return out;
    }

    // Fraction of the model's relations that the log exhibits.
    inline double footprint_precision(const Footprint &log, const Footprint &model)
    {
        const PairSet logConf = log.configurations();
        const PairSet modelConf = model.configurations();
        if (modelConf.empty())
        {
            return 1.0;
        }
        std::size_t shared = 0;
        for (const auto &pair : modelConf)
        {
            if (logConf.count(pair) != 0)
            {
                ++shared;
            }
        }
        return static_cast<double>(shared) / static_cast<double>(modelConf.size());
    }
}
