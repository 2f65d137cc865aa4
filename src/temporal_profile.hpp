#pragma once

#include "common.hpp"
#include "event_log.hpp"
#include "log.hpp"
#include "properties.hpp"

#include <cmath>
#include <limits>
#include <map>
#include <stdexcept>
#include <vector>

namespace tracecheck
{
    struct TemporalStats
    {
        double mean = 0.0;
        double stdev = 0.0;
    };

    // Expected elapsed time between ordered activity pairs, in timestamp units.
    using TemporalProfile = std::map<ActivityPair, TemporalStats>;

    struct TemporalDeviation
    {
        ActivityPair pair;
        double observedGap = 0.0;
        double expectedMean = 0.0;
        double expectedStdev = 0.0;
        // zeta * stdev
        double allowedBound = 0.0;
        // |gap - mean| / stdev; infinite when stdev is 0.
        double stdevsFromMean = 0.0;
    };

    using CaseTemporalDeviations = std::vector<TemporalDeviation>;

    namespace detail
    {
        inline bool is_temporal_deviation(double gap, const TemporalStats &s, double zeta) noexcept
        {
            return std::fabs(gap - s.mean) > zeta * s.stdev;
        }
    }

    // Checks every ordered pair of events (a at i, b at j, i < j) whose pair has
    // a profile entry. Deviations are listed by the position of b, then of a.
    // Pairs where b is timestamped before a are not compared.
    inline CaseTemporalDeviations check_trace_temporal_profile(const Trace &trace, const TemporalProfile &profile, double zeta, const Properties &props)
    {
        CaseTemporalDeviations out;
        const auto &events = trace.events;
        if (events.size() < 2 || profile.empty())
        {
            return out;
        }

        std::vector<Activity> acts;
        std::vector<double> starts;
        std::vector<double> ends;
        acts.reserve(events.size());
        starts.reserve(events.size());
        ends.reserve(events.size());
        for (const auto &ev : events)
        {
            acts.push_back(activity_of(ev, props.activity_key()));
            ends.push_back(timestamp_of(ev, props.timestamp_key()));
            starts.push_back(props.start_timestamp_key() == props.timestamp_key() ? ends.back()
                                                                                   : timestamp_of(ev, props.start_timestamp_key()));
        }

        for (std::size_t j = 1; j < events.size(); ++j)
        {
            for (std::size_t i = 0; i < j; ++i)
            {
                auto it = profile.find(ActivityPair{acts[i], acts[j]});
                if (it == profile.end())
                {
                    continue;
                }
                // Gap from the end of a to the start of b.
                const double gap = starts[j] - ends[i];
                if (gap < 0.0)
                {
                    Logger::instance().logf(LogLevel::Trace, "temporal", "skip (%s,%s): negative gap %f",
                                            acts[i].c_str(), acts[j].c_str(), gap);
                    continue;
                }
                const TemporalStats &s = it->second;
                if (!detail::is_temporal_deviation(gap, s, zeta))
                {
                    continue;
                }

                TemporalDeviation d;
                d.pair = it->first;
                d.observedGap = gap;
                d.expectedMean = s.mean;
                d.expectedStdev = s.stdev;
                d.allowedBound = zeta * s.stdev;
                d.stdevsFromMean = s.stdev > 0.0 ? std::fabs(gap - s.mean) / s.stdev : std::numeric_limits<double>::infinity();
                out.push_back(std::move(d));
            }
        }
        return out;
    }

    // One deviation list per case, in log order.
    inline std::vector<CaseTemporalDeviations> check_temporal_profile(const EventLog &log, const TemporalProfile &profile, double zeta, const Properties &props)
    {
        if (std::isnan(zeta) || zeta < 0.0)
        {
            throw std::invalid_argument("temporal profile conformance: zeta must be a non-negative number");
        }
        for (const auto &[pair, s] : profile)
        {
            if (std::isnan(s.mean) || std::isnan(s.stdev) || s.stdev < 0.0)
            {
                throw std::invalid_argument("temporal profile entry " + pair_to_string(pair) + " has an invalid mean/stdev");
            }
        }

        std::vector<CaseTemporalDeviations> out;
        out.reserve(log.traces.size());
        for (const auto &trace : log.traces)
        {
            out.push_back(check_trace_temporal_profile(trace, profile, zeta, props));
        }
        return out;
    }
}
