#pragma once

#include "engines.hpp"
#include "footprints.hpp"
#include "log.hpp"
#include "model_conversion.hpp"
#include "threaded_executor.hpp"

#include <memory>
#include <vector>

namespace tracecheck
{
    struct CascadeConfig
    {
        // Run the footprint tier for Petri nets as well. Footprint discovery on
        // nets is expensive relative to what it rules out, so it is off by default.
        bool footprintTierForPetriNets = false;
    };

    // Collaborator engines. Replay, alignment and precision have no built-in
    // implementation and must be supplied by the caller before the operations
    // that need them are used.
    struct Engines
    {
        std::shared_ptr<const ITokenReplayEngine> replay;
        std::shared_ptr<const IAlignmentEngine> alignment;
        std::shared_ptr<const IFrequencyGraphAlignmentEngine> frequencyGraphAlignment;
        std::shared_ptr<const IPrecisionEngine> precision;
        std::shared_ptr<const IFootprintEngine> footprints = std::make_shared<BuiltinFootprintEngine>();
        std::shared_ptr<const IModelConverter> converter = std::make_shared<BuiltinModelConverter>();

        // Parallel variant of the alignment engine. If unset, a threaded executor
        // sized by ConformanceConfig::workerThreads is used.
        std::shared_ptr<const IAlignmentExecutor> parallelExecutor;

        // Tried in order for unrecognized models, after the model's own conversions.
        std::vector<ForeignModelConversion> foreignConversions;
    };

    struct ConformanceConfig
    {
        PropertyKeys keys;

        // Logging (disabled by default). The Logger is process-wide: constructing a
        // ConformanceChecker applies this level for every checker in the process,
        // so the most recently constructed one wins.
        LogLevel logLevel = LogLevel::Off;

        CascadeConfig cascade;

        // Threads for the default parallel executor; 0 = hardware concurrency.
        std::size_t workerThreads = 0;
    };
}
