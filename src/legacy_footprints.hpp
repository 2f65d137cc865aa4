#pragma once

#include "conformance.hpp"
#include "footprint_bridge.hpp"
#include "footprints.hpp"

#include <variant>
#include <vector>

// Footprint-based conformance, kept for callers of the older API. New code
// should use ConformanceChecker's replay/alignment operations or the cascade.
namespace tracecheck::legacy
{
    [[deprecated("footprint-based conformance will be removed; use alignments or token-based replay")]]
    inline FootprintDiagnostics conformance_diagnostics_footprints(const ConformanceChecker &checker, const FootprintSource &logSide, const FootprintSource &modelSide)
    {
        const Properties props(checker.config().keys, {});
        const FootprintBridge bridge(checker.router());
        const NormalizedFootprints log = bridge.normalize(logSide, props);
        return bridge.compare(log, bridge.model_side(modelSide, props));
    }

    [[deprecated("footprint-based conformance will be removed; use alignments or token-based replay")]]
    inline FootprintFitness fitness_footprints(const ConformanceChecker &checker, const FootprintSource &logSide, const FootprintSource &modelSide)
    {
        const Properties props(checker.config().keys, {});
        const FootprintBridge bridge(checker.router());
        const NormalizedFootprints log = bridge.normalize(logSide, props);
        const FootprintDiagnostics diag = bridge.compare(log, bridge.model_side(modelSide, props));

        if (auto perTrace = std::get_if<std::vector<Footprint>>(&log))
        {
            return footprint_fitness(*perTrace, std::get<std::vector<TraceFootprintDiagnostics>>(diag));
        }
        return footprint_fitness(std::get<Footprint>(log), std::get<LogFootprintDiagnostics>(diag));
    }

    [[deprecated("footprint-based conformance will be removed; use alignments or token-based replay")]]
    inline double precision_footprints(const ConformanceChecker &checker, const FootprintSource &logSide, const FootprintSource &modelSide)
    {
        const Properties props(checker.config().keys, {});
        const FootprintBridge bridge(checker.router());
        const NormalizedFootprints log = bridge.normalize(logSide, props);
        const Footprint model = bridge.model_side(modelSide, props);
        if (auto perTrace = std::get_if<std::vector<Footprint>>(&log))
        {
            return footprint_precision(detail::flatten(*perTrace), model);
        }
        return footprint_precision(std::get<Footprint>(log), model);
    }
}
