#pragma once

#include "event_log.hpp"
#include "footprints.hpp"
#include "model.hpp"
#include "properties.hpp"
#include "router.hpp"

#include <memory>
#include <utility>
#include <variant>
#include <vector>

namespace tracecheck
{
    // Anything the footprint comparison accepts on either side: precomputed
    // footprints (per trace or log-level), an event log, a single trace, or a
    // model. Non-owning for logs and traces; models are held by value.
    class FootprintSource
    {
    public:
        FootprintSource(std::vector<Footprint> perTrace) : m_src(std::move(perTrace)) {}
        FootprintSource(Footprint logLevel) : m_src(std::move(logLevel)) {}
        FootprintSource(const EventLog &log) : m_src(&log) {}
        FootprintSource(const Trace &trace) : m_src(&trace) {}
        FootprintSource(ModelArgument model) : m_src(std::move(model)) {}
        FootprintSource(ProcessTree tree) : m_src(ModelArgument(std::move(tree))) {}
        FootprintSource(AcceptingPetriNet net) : m_src(ModelArgument(std::move(net))) {}
        FootprintSource(FrequencyGraph graph) : m_src(ModelArgument(std::move(graph))) {}
        FootprintSource(std::shared_ptr<const IForeignModel> foreign) : m_src(ModelArgument(std::move(foreign))) {}

        const auto &get() const noexcept { return m_src; }

    private:
        std::variant<std::vector<Footprint>, Footprint, const EventLog *, const Trace *, ModelArgument> m_src;
    };

    // Per-trace footprints, or one log-level footprint.
    using NormalizedFootprints = std::variant<std::vector<Footprint>, Footprint>;

    using FootprintDiagnostics = std::variant<std::vector<TraceFootprintDiagnostics>, LogFootprintDiagnostics>;

    inline Footprint footprint_of_frequency_graph(const FrequencyGraph &graph)
    {
        Footprint fp;
        fp.directlyFollows = graph.directlyFollows;
        fp.activities = graph.activities();
        for (const auto &[a, n] : graph.startActivities)
        {
            (void)n;
            fp.startActivities.insert(a);
        }
        for (const auto &[a, n] : graph.endActivities)
        {
            (void)n;
            fp.endActivities.insert(a);
        }
        fp.minTraceLength = graph.startActivities.empty() ? 0 : 1;
        detail::split_relations(fp);
        // Model footprints carry no frequencies.
        fp.directlyFollows.clear();
        return fp;
    }

    // Brings both sides of a footprint comparison to footprint form so the
    // comparison runs the same way whatever was supplied.
    class FootprintBridge
    {
    public:
        explicit FootprintBridge(const ModelRouter &router) : m_router(router) {}

        NormalizedFootprints normalize(const FootprintSource &src, const Properties &props) const
        {
            const IFootprintEngine &engine = m_router.footprints();
            const auto &v = src.get();
            if (auto perTrace = std::get_if<std::vector<Footprint>>(&v))
            {
                return *perTrace;
            }
            if (auto logLevel = std::get_if<Footprint>(&v))
            {
                return *logLevel;
            }
            if (auto log = std::get_if<const EventLog *>(&v))
            {
                return engine.discover(**log, props);
            }
            if (auto trace = std::get_if<const Trace *>(&v))
            {
                return engine.discover_per_trace(single_trace_log(**trace), props);
            }
            return model_footprint(std::get<ModelArgument>(v));
        }

        Footprint model_footprint(const ModelArgument &model) const
        {
            const IFootprintEngine &engine = m_router.footprints();
            if (auto tree = std::get_if<ProcessTree>(&model))
            {
                return engine.discover(*tree);
            }
            if (auto net = std::get_if<AcceptingPetriNet>(&model))
            {
                return engine.discover(*net);
            }
            if (auto dfg = std::get_if<FrequencyGraph>(&model))
            {
                return footprint_of_frequency_graph(*dfg);
            }
            const auto &foreign = std::get<std::shared_ptr<const IForeignModel>>(model);
            if (!foreign)
            {
                throw InputShapeError("model argument is a null foreign model");
            }
            if (auto tree = foreign->as_process_tree())
            {
                return engine.discover(*tree);
            }
            return engine.discover(m_router.convert_foreign(*foreign));
        }

        // The model side must reduce to a single log-level footprint.
        Footprint model_side(const FootprintSource &src, const Properties &props) const
        {
            NormalizedFootprints n = normalize(src, props);
            if (auto fp = std::get_if<Footprint>(&n))
            {
                return std::move(*fp);
            }
            throw InputShapeError("footprint comparison: the model side must be a single footprint, not per-trace footprints");
        }

        FootprintDiagnostics compare(const NormalizedFootprints &logSide, const Footprint &model) const
        {
            if (auto perTrace = std::get_if<std::vector<Footprint>>(&logSide))
            {
                return compare_footprints_per_trace(*perTrace, model);
            }
            return compare_footprints(std::get<Footprint>(logSide), model);
        }

    private:
        const ModelRouter &m_router;
    };
}
