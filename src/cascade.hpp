#pragma once

#include "config.hpp"
#include "event_log.hpp"
#include "footprints.hpp"
#include "log.hpp"
#include "model.hpp"
#include "properties.hpp"
#include "router.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tracecheck
{
    // Tiers of the fitness cascade, cheapest first.
    enum class CascadeStage : std::uint8_t
    {
        // Footprint comparison; conclusive only for "not fit".
        Footprints = 0,
        // Trace activities missing from the net's labels; conclusive only for "not fit".
        Labels = 1,
        // Token-based replay; conclusive only for "fit".
        Replay = 2,
        // Alignments; always conclusive.
        Alignment = 3,
    };

    inline const char *cascade_stage_name(CascadeStage s) noexcept
    {
        switch (s)
        {
        case CascadeStage::Footprints:
            return "footprints";
        case CascadeStage::Labels:
            return "labels";
        case CascadeStage::Replay:
            return "replay";
        case CascadeStage::Alignment:
            return "alignment";
        }
        return "?";
    }

    struct CascadeVerdict
    {
        bool fit = false;
        CascadeStage decidedAt = CascadeStage::Alignment;
    };

    // Either a full trace or a variant (plain activity sequence).
    using FitnessCandidate = std::variant<Trace, std::vector<Activity>, std::string>;

    // Decides whether one trace perfectly fits one model, escalating from cheap
    // approximate checks to alignments. Every non-final tier is only trusted in
    // the direction where it cannot be wrong. Stateless between calls.
    class CascadeFitnessVerifier
    {
    public:
        CascadeFitnessVerifier(const ModelRouter &router, CascadeConfig cfg) : m_router(router), m_cfg(cfg) {}

        CascadeVerdict verify(const FitnessCandidate &candidate, const ModelArgument &model, const Properties &props) const
        {
            Subject s;
            normalize_(candidate, model, props, s);

            std::vector<CascadeStage> plan;
            if (s.tree() || m_cfg.footprintTierForPetriNets)
            {
                plan.push_back(CascadeStage::Footprints);
            }
            if (!s.tree())
            {
                plan.push_back(CascadeStage::Labels);
            }
            plan.push_back(CascadeStage::Replay);
            plan.push_back(CascadeStage::Alignment);

            for (const CascadeStage stage : plan)
            {
                const std::optional<bool> verdict = run_stage_(stage, s, props);
                Logger::instance().logf(LogLevel::Debug, "cascade", "%s: %s", cascade_stage_name(stage),
                                        !verdict ? "inconclusive" : (*verdict ? "fit" : "not fit"));
                if (verdict)
                {
                    return CascadeVerdict{*verdict, stage};
                }
            }
            // The alignment tier always decides.
            throw std::logic_error("cascade finished without a verdict");
        }

    private:
        // Trace and model after promotion/coercion. The model is either a tree
        // or a net; a tree gains a net lazily when replay needs one.
        struct Subject
        {
            EventLog singleLog;
            const ProcessTree *treeRef = nullptr;
            const AcceptingPetriNet *netRef = nullptr;
            std::optional<ProcessTree> ownedTree;
            std::optional<AcceptingPetriNet> ownedNet;

            const Trace &trace() const { return singleLog.traces.front(); }
            const ProcessTree *tree() const { return ownedTree ? &*ownedTree : treeRef; }
            const AcceptingPetriNet *net() const { return ownedNet ? &*ownedNet : netRef; }
        };

        void normalize_(const FitnessCandidate &candidate, const ModelArgument &model, const Properties &props, Subject &s) const
        {
            if (auto t = std::get_if<Trace>(&candidate))
            {
                s.singleLog = single_trace_log(*t);
            }
            else if (auto v = std::get_if<std::vector<Activity>>(&candidate))
            {
                s.singleLog = single_trace_log(trace_from_variant(*v, props.activity_key()));
            }
            else
            {
                s.singleLog = single_trace_log(trace_from_variant(std::get<std::string>(candidate), props.activity_key()));
            }

            // Prefer the hierarchical form, fall back to a Petri net. A net the
            // converter can lift keeps its original form for replay.
            if (auto tree = std::get_if<ProcessTree>(&model))
            {
                s.treeRef = tree;
            }
            else if (auto net = std::get_if<AcceptingPetriNet>(&model))
            {
                s.netRef = net;
                s.ownedTree = m_router.converter().to_process_tree(*net);
            }
            else if (auto dfg = std::get_if<FrequencyGraph>(&model))
            {
                s.ownedNet = m_router.converter().to_petri_net(*dfg);
                s.ownedTree = m_router.converter().to_process_tree(*s.ownedNet);
            }
            else
            {
                const auto &foreign = std::get<std::shared_ptr<const IForeignModel>>(model);
                if (!foreign)
                {
                    throw InputShapeError("model argument is a null foreign model");
                }
                s.ownedTree = foreign->as_process_tree();
                if (!s.ownedTree)
                {
                    s.ownedNet = m_router.convert_foreign(*foreign);
                    s.ownedTree = m_router.converter().to_process_tree(*s.ownedNet);
                }
            }
            if (s.ownedTree && s.net())
            {
                Logger::instance().logf(LogLevel::Debug, "cascade", "net lifted to a process tree");
            }
        }

        std::optional<bool> run_stage_(CascadeStage stage, Subject &s, const Properties &props) const
        {
            switch (stage)
            {
            case CascadeStage::Footprints:
                return footprint_tier_(s, props);
            case CascadeStage::Labels:
                return label_tier_(s, props);
            case CascadeStage::Replay:
                return replay_tier_(s, props);
            case CascadeStage::Alignment:
                return alignment_tier_(s, props);
            }
            throw std::logic_error("unknown cascade stage");
        }

        std::optional<bool> footprint_tier_(const Subject &s, const Properties &props) const
        {
            const IFootprintEngine &fp = m_router.footprints();
            const auto traceFp = fp.discover_per_trace(s.singleLog, props);
            if (traceFp.size() != 1)
            {
                throw std::runtime_error("footprint engine returned " + std::to_string(traceFp.size()) + " footprints for one trace");
            }
            const Footprint modelFp = s.tree() ? fp.discover(*s.tree()) : fp.discover(*s.net());
            const auto diag = compare_footprints_per_trace(traceFp, modelFp);
            if (!diag.front().isFootprintsFit)
            {
                return false;
            }
            return std::nullopt;
        }

        std::optional<bool> label_tier_(const Subject &s, const Properties &props) const
        {
            const ActivitySet labels = s.net()->net.visible_labels();
            for (const auto &ev : s.trace().events)
            {
                const Activity &act = activity_of(ev, props.activity_key());
                if (labels.count(act) == 0)
                {
                    Logger::instance().logf(LogLevel::Trace, "cascade", "activity '%s' is not a label of the net", act.c_str());
                    return false;
                }
            }
            return std::nullopt;
        }

        std::optional<bool> replay_tier_(Subject &s, const Properties &props) const
        {
            if (!s.net())
            {
                s.ownedNet = m_router.converter().to_petri_net(*s.tree());
            }
            const auto records = m_router.replay(s.singleLog, *s.net(), props);
            if (records.front().traceIsFit)
            {
                return true;
            }
            return std::nullopt;
        }

        bool alignment_tier_(const Subject &s, const Properties &props) const
        {
            const AlignmentRecord rec = s.tree() ? m_router.align_trace(s.trace(), *s.tree(), props)
                                                 : m_router.align_trace(s.trace(), *s.net(), props);
            return rec.fitness == 1.0;
        }

        const ModelRouter &m_router;
        CascadeConfig m_cfg;
    };
}
