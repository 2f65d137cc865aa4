#pragma once

#include "common.hpp"
#include "event_log.hpp"
#include "properties.hpp"

#include <cstdint>
#include <limits>
#include <map>
#include <set>
#include <stdexcept>
#include <vector>

namespace tracecheck
{
    enum class SkeletonConstraint : std::uint8_t
    {
        DirectlyFollows = 0,
        AlwaysBefore = 1,
        AlwaysAfter = 2,
        Equivalence = 3,
        NeverTogether = 4,
        ActivOccurrences = 5,
    };

    inline const char *skeleton_constraint_name(SkeletonConstraint c) noexcept
    {
        switch (c)
        {
        case SkeletonConstraint::DirectlyFollows:
            return "directly_follows";
        case SkeletonConstraint::AlwaysBefore:
            return "always_before";
        case SkeletonConstraint::AlwaysAfter:
            return "always_after";
        case SkeletonConstraint::Equivalence:
            return "equivalence";
        case SkeletonConstraint::NeverTogether:
            return "never_together";
        case SkeletonConstraint::ActivOccurrences:
            return "activ_occurrences";
        }
        return "unknown";
    }

    inline const std::set<SkeletonConstraint> &all_skeleton_constraints()
    {
        static const std::set<SkeletonConstraint> all{
            SkeletonConstraint::DirectlyFollows, SkeletonConstraint::AlwaysBefore, SkeletonConstraint::AlwaysAfter,
            SkeletonConstraint::Equivalence, SkeletonConstraint::NeverTogether, SkeletonConstraint::ActivOccurrences};
        return all;
    }

    // Inclusive bounds on how often a pair occurs adjacently in a case.
    struct DirectlyFollowsBounds
    {
        std::uint64_t min = 1;
        std::uint64_t max = std::numeric_limits<std::uint64_t>::max();
    };

    // Declarative model made of six independent constraint families.
    //
    // always_before (a, b): every case containing a has b somewhere before an a.
    // always_after  (a, b): every case containing a has b somewhere after an a.
    // directly_follows (a, b): in cases containing a, the number of adjacent
    //     (a, b) occurrences lies within the bounds.
    struct LogSkeleton
    {
        std::map<ActivityPair, DirectlyFollowsBounds> directlyFollows;
        PairSet alwaysBefore;
        PairSet alwaysAfter;
        PairSet equivalence;
        PairSet neverTogether;
        std::map<Activity, std::set<std::uint64_t>> activOccurrences;
    };

    // One violated constraint instance. `second` is empty for activ_occurrences.
    struct SkeletonViolation
    {
        SkeletonConstraint constraint = SkeletonConstraint::DirectlyFollows;
        Activity first;
        Activity second;

        bool operator<(const SkeletonViolation &o) const noexcept
        {
            if (constraint != o.constraint)
            {
                return constraint < o.constraint;
            }
            if (first != o.first)
            {
                return first < o.first;
            }
            return second < o.second;
        }

        bool operator==(const SkeletonViolation &o) const noexcept
        {
            return constraint == o.constraint && first == o.first && second == o.second;
        }
    };

    using CaseSkeletonViolations = std::set<SkeletonViolation>;

    namespace detail
    {
        struct TraceSkeletonInfo
        {
            std::map<Activity, std::uint64_t> counts;
            std::map<ActivityPair, std::uint64_t> adjacent;
            // (a, b): some b occurs before some a.
            PairSet before;
            // (a, b): some b occurs after some a.
            PairSet after;
        };

        inline TraceSkeletonInfo trace_skeleton_info(const std::vector<Activity> &acts)
        {
            TraceSkeletonInfo info;
            for (std::size_t i = 0; i < acts.size(); ++i)
            {
                ++info.counts[acts[i]];
                if (i + 1 < acts.size())
                {
                    ++info.adjacent[ActivityPair{acts[i], acts[i + 1]}];
                }
                for (std::size_t j = i + 1; j < acts.size(); ++j)
                {
                    info.after.insert(ActivityPair{acts[i], acts[j]});
                    info.before.insert(ActivityPair{acts[j], acts[i]});
                }
            }
            return info;
        }

        inline std::uint64_t count_of(const std::map<Activity, std::uint64_t> &m, const Activity &a)
        {
            auto it = m.find(a);
            return it == m.end() ? 0 : it->second;
        }
    }

    inline CaseSkeletonViolations check_trace_log_skeleton(const Trace &trace, const LogSkeleton &skeleton, const std::set<SkeletonConstraint> &considered, const Properties &props)
    {
        const auto info = detail::trace_skeleton_info(activities_of(trace, props.activity_key()));
        const auto has = [&](const Activity &a)
        { return info.counts.count(a) != 0; };
        const auto consider = [&](SkeletonConstraint c)
        { return considered.count(c) != 0; };

        CaseSkeletonViolations out;

        if (consider(SkeletonConstraint::DirectlyFollows))
        {
            for (const auto &[pair, bounds] : skeleton.directlyFollows)
            {
                if (!has(pair.first))
                {
                    continue;
                }
                auto it = info.adjacent.find(pair);
                const std::uint64_t n = it == info.adjacent.end() ? 0 : it->second;
                if (n < bounds.min || n > bounds.max)
                {
                    out.insert(SkeletonViolation{SkeletonConstraint::DirectlyFollows, pair.first, pair.second});
                }
            }
        }

        if (consider(SkeletonConstraint::AlwaysBefore))
        {
            for (const auto &pair : skeleton.alwaysBefore)
            {
                if (has(pair.first) && info.before.count(pair) == 0)
                {
                    out.insert(SkeletonViolation{SkeletonConstraint::AlwaysBefore, pair.first, pair.second});
                }
            }
        }

        if (consider(SkeletonConstraint::AlwaysAfter))
        {
            for (const auto &pair : skeleton.alwaysAfter)
            {
                if (has(pair.first) && info.after.count(pair) == 0)
                {
                    out.insert(SkeletonViolation{SkeletonConstraint::AlwaysAfter, pair.first, pair.second});
                }
            }
        }

        if (consider(SkeletonConstraint::Equivalence))
        {
            for (const auto &pair : skeleton.equivalence)
            {
                if (detail::count_of(info.counts, pair.first) != detail::count_of(info.counts, pair.second))
                {
                    out.insert(SkeletonViolation{SkeletonConstraint::Equivalence, pair.first, pair.second});
                }
            }
        }

        if (consider(SkeletonConstraint::NeverTogether))
        {
            for (const auto &pair : skeleton.neverTogether)
            {
                if (has(pair.first) && has(pair.second))
                {
                    out.insert(SkeletonViolation{SkeletonConstraint::NeverTogether, pair.first, pair.second});
                }
            }
        }

        if (consider(SkeletonConstraint::ActivOccurrences))
        {
            for (const auto &[act, allowed] : skeleton.activOccurrences)
            {
                if (allowed.count(detail::count_of(info.counts, act)) == 0)
                {
                    out.insert(SkeletonViolation{SkeletonConstraint::ActivOccurrences, act, {}});
                }
            }
        }

        return out;
    }

    // One violation set per case, in log order. An empty set means the case complies.
    inline std::vector<CaseSkeletonViolations> check_log_skeleton(const EventLog &log, const LogSkeleton &skeleton, const Properties &props,
                                                                  const std::set<SkeletonConstraint> &considered = all_skeleton_constraints())
    {
        for (const auto &[pair, bounds] : skeleton.directlyFollows)
        {
            if (bounds.min > bounds.max)
            {
                throw std::invalid_argument("log skeleton: directly-follows bounds for " + pair_to_string(pair) + " are empty");
            }
        }

        std::vector<CaseSkeletonViolations> out;
        out.reserve(log.traces.size());
        for (const auto &trace : log.traces)
        {
            out.push_back(check_trace_log_skeleton(trace, skeleton, considered, props));
        }
        return out;
    }
}
