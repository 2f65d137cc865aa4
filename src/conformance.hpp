#pragma once

#include "cascade.hpp"
#include "config.hpp"
#include "engines.hpp"
#include "event_log.hpp"
#include "fitness_evaluation.hpp"
#include "log.hpp"
#include "log_skeleton.hpp"
#include "model.hpp"
#include "properties.hpp"
#include "router.hpp"
#include "temporal_profile.hpp"

#include <set>
#include <vector>

namespace tracecheck
{
    // Entry point for every conformance operation. Holds the configuration and
    // the collaborator engines; every operation validates its log before doing
    // any work and either returns a complete result or throws.
    //
    // All operations are const and keep no state between calls, so one checker
    // may be shared by concurrent callers working on different logs.
    class ConformanceChecker final
    {
    public:
        explicit ConformanceChecker(ConformanceConfig cfg, Engines engines = {})
            : m_cfg(std::move(cfg)),
              m_engines(std::move(engines)),
              m_router(m_engines, m_cfg.workerThreads),
              m_cascade(m_router, m_cfg.cascade)
        {
            // Process-wide; see ConformanceConfig::logLevel.
            Logger::instance().set_level(m_cfg.logLevel);
        }

        ConformanceChecker(const ConformanceChecker &) = delete;
        ConformanceChecker &operator=(const ConformanceChecker &) = delete;

        const ConformanceConfig &config() const noexcept { return m_cfg; }
        const ModelRouter &router() const noexcept { return m_router; }

        std::vector<ReplayRecord> diagnostics_token_based_replay(const LogView &log, const AcceptingPetriNet &model) const
        {
            const Properties props = normalize_properties(log, m_cfg.keys);
            const ResolvedLog resolved(log, props);
            return m_router.replay(resolved.get(), model, props);
        }

        // One record per trace, in log order, for any supported model shape.
        std::vector<AlignmentRecord> diagnostics_alignments(const LogView &log, const ModelArgument &model, bool parallel = false) const
        {
            PropertyExtras extras;
            extras.parallel = parallel;
            const Properties props = normalize_properties(log, m_cfg.keys, extras);
            const ResolvedLog resolved(log, props);
            const ResolvedModel resolvedModel = m_router.resolve(model);
            return m_router.align(resolved.get(), resolvedModel, props);
        }

        FitnessSummary fitness_token_based_replay(const LogView &log, const AcceptingPetriNet &model) const
        {
            return evaluate_replay_fitness(diagnostics_token_based_replay(log, model));
        }

        FitnessSummary fitness_alignments(const LogView &log, const ModelArgument &model, bool parallel = false) const
        {
            return evaluate_alignment_fitness(diagnostics_alignments(log, model, parallel));
        }

        double precision_token_based_replay(const LogView &log, const AcceptingPetriNet &model) const
        {
            const Properties props = normalize_properties(log, m_cfg.keys);
            const ResolvedLog resolved(log, props);
            return checked_precision(m_router.precision().precision_token_based(resolved.get(), model, props), "token-based");
        }

        double precision_alignments(const LogView &log, const AcceptingPetriNet &model, bool parallel = false) const
        {
            PropertyExtras extras;
            extras.parallel = parallel;
            const Properties props = normalize_properties(log, m_cfg.keys, extras);
            const ResolvedLog resolved(log, props);
            return checked_precision(m_router.precision().precision_alignments(resolved.get(), model, props), "alignments");
        }

        // Per case, the activity pairs whose elapsed time is more than
        // zeta standard deviations away from the profile mean.
        std::vector<CaseTemporalDeviations> conformance_temporal_profile(const LogView &log, const TemporalProfile &profile, double zeta = 1.0,
                                                                         const std::string &startTimestampKey = {}) const
        {
            PropertyExtras extras;
            extras.zeta = zeta;
            extras.startTimestampKey = startTimestampKey;
            const Properties props = normalize_properties(log, m_cfg.keys, extras);
            const ResolvedLog resolved(log, props);
            return check_temporal_profile(resolved.get(), profile, zeta, props);
        }

        std::vector<CaseSkeletonViolations> conformance_log_skeleton(const LogView &log, const LogSkeleton &skeleton,
                                                                     const std::set<SkeletonConstraint> &considered = all_skeleton_constraints()) const
        {
            const Properties props = normalize_properties(log, m_cfg.keys);
            const ResolvedLog resolved(log, props);
            return check_log_skeleton(resolved.get(), skeleton, props, considered);
        }

        CascadeVerdict verify_fitting(const FitnessCandidate &candidate, const ModelArgument &model) const
        {
            return m_cascade.verify(candidate, model, Properties(m_cfg.keys, {}));
        }

        bool check_is_fitting(const FitnessCandidate &candidate, const ModelArgument &model) const
        {
            return verify_fitting(candidate, model).fit;
        }

    private:
        ConformanceConfig m_cfg;
        Engines m_engines;
        ModelRouter m_router;
        CascadeFitnessVerifier m_cascade;
    };
}
