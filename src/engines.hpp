#pragma once

#include "common.hpp"
#include "event_log.hpp"
#include "model.hpp"
#include "properties.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tracecheck
{
    // Per-trace token-based replay outcome.
    struct ReplayRecord
    {
        bool traceIsFit = false;
        double traceFitness = 0.0;
        std::uint64_t missingTokens = 0;
        std::uint64_t consumedTokens = 0;
        std::uint64_t remainingTokens = 0;
        std::uint64_t producedTokens = 0;
        std::vector<std::string> activatedTransitions;
    };

    struct AlignmentMove
    {
        enum class Kind : std::uint8_t
        {
            Synchronous = 0,
            LogOnly = 1,
            ModelOnly = 2,
        };

        Kind kind = Kind::Synchronous;
        // Empty for silent model moves.
        Activity activity;
        bool silent = false;

        bool operator==(const AlignmentMove &o) const noexcept
        {
            return kind == o.kind && activity == o.activity && silent == o.silent;
        }
    };

    // Per-trace alignment outcome.
    struct AlignmentRecord
    {
        std::vector<AlignmentMove> alignment;
        double cost = 0.0;
        double fitness = 0.0;
        // Cost of aligning the empty trace plus all log moves; denominator of log fitness.
        double bestWorstCost = 0.0;
        std::uint64_t visitedStates = 0;
        std::uint64_t queuedStates = 0;
        std::uint64_t traversedArcs = 0;
    };

    class ITokenReplayEngine
    {
    public:
        virtual ~ITokenReplayEngine() = default;

        // One record per trace of `log`, in log order.
        virtual std::vector<ReplayRecord> replay(const EventLog &log, const AcceptingPetriNet &model, const Properties &props) const = 0;
    };

    class IAlignmentEngine
    {
    public:
        virtual ~IAlignmentEngine() = default;

        // Must be safe to call concurrently from several threads.
        virtual AlignmentRecord align(const Trace &trace, const AcceptingPetriNet &model, const Properties &props) const = 0;
        virtual AlignmentRecord align(const Trace &trace, const ProcessTree &model, const Properties &props) const = 0;
    };

    class IFrequencyGraphAlignmentEngine
    {
    public:
        virtual ~IFrequencyGraphAlignmentEngine() = default;

        // One record per trace of `log`, in log order.
        virtual std::vector<AlignmentRecord> align(const EventLog &log, const FrequencyGraph &model, const Properties &props) const = 0;
    };

    class IPrecisionEngine
    {
    public:
        virtual ~IPrecisionEngine() = default;

        virtual double precision_token_based(const EventLog &log, const AcceptingPetriNet &model, const Properties &props) const = 0;
        virtual double precision_alignments(const EventLog &log, const AcceptingPetriNet &model, const Properties &props) const = 0;
    };

    // Distributes per-trace alignments. Implementations must return `count`
    // records where record i is alignOne(i).
    class IAlignmentExecutor
    {
    public:
        using AlignOne = std::function<AlignmentRecord(std::size_t)>;

        virtual ~IAlignmentExecutor() = default;
        virtual std::vector<AlignmentRecord> run(std::size_t count, const AlignOne &alignOne) const = 0;
    };

    // One entry of the ordered fallback list tried for unrecognized models.
    using ForeignModelConversion = std::function<std::optional<AcceptingPetriNet>(const IForeignModel &)>;
}
