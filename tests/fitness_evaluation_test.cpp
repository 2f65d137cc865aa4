/*
Purpose: Fitness aggregation and precision validation.

What this tests: Replay and alignment diagnostics aggregate into average trace fitness,
percentage of fitting traces and log fitness; empty logs give zeros; precision values
outside [0,1] from an engine are reported as errors instead of being passed on.
*/

#include "conformance.hpp"
#include "test_engines.hpp"

#include <cassert>
#include <cmath>
#include <limits>
#include <memory>

using namespace tracecheck;

namespace
{
    bool near(double a, double b)
    {
        return std::fabs(a - b) < 1e-9;
    }
}

int main()
{
    // Replay aggregation.
    {
        std::vector<ReplayRecord> recs(2);
        recs[0].traceIsFit = true;
        recs[0].traceFitness = 1.0;
        recs[0].consumedTokens = 4;
        recs[0].producedTokens = 4;
        recs[1].traceFitness = 0.5;
        recs[1].consumedTokens = 4;
        recs[1].producedTokens = 4;
        recs[1].missingTokens = 2;
        recs[1].remainingTokens = 1;

        const FitnessSummary s = evaluate_replay_fitness(recs);
        assert(near(s.averageTraceFitness, 0.75));
        assert(near(s.percentageOfFittingTraces, 50.0));
        // 0.5 * (1 - 2/8) + 0.5 * (1 - 1/8)
        assert(near(s.logFitness, 0.8125));
    }

    // Alignment aggregation.
    {
        std::vector<AlignmentRecord> recs(2);
        recs[0].fitness = 1.0;
        recs[0].bestWorstCost = 3.0;
        recs[1].fitness = 0.0;
        recs[1].cost = 3.0;
        recs[1].bestWorstCost = 3.0;
        const FitnessSummary s = evaluate_alignment_fitness(recs);
        assert(near(s.averageTraceFitness, 0.5));
        assert(near(s.percentageOfFittingTraces, 50.0));
        assert(near(s.logFitness, 0.5));
    }

    // Empty diagnostics.
    {
        const FitnessSummary a = evaluate_replay_fitness({});
        const FitnessSummary b = evaluate_alignment_fitness({});
        assert(a.averageTraceFitness == 0.0 && a.percentageOfFittingTraces == 0.0);
        assert(b.averageTraceFitness == 0.0 && b.percentageOfFittingTraces == 0.0);
    }

    // Through the checker.
    {
        auto replay = std::make_shared<test::ScriptedReplayEngine>(std::set<test::Variant>{{"A", "B"}});
        auto alignment = std::make_shared<test::ScriptedAlignmentEngine>(std::set<test::Variant>{{"A", "B"}});
        Engines engines;
        engines.replay = replay;
        engines.alignment = alignment;
        engines.precision = std::make_shared<test::FixedPrecisionEngine>(0.8);
        ConformanceChecker checker(ConformanceConfig{}, engines);

        const EventLog log = test::make_log({{"A", "B"}, {"A", "B"}, {"B"}, {"A"}});
        const AcceptingPetriNet net = test::sequence_net({"A", "B"});

        const FitnessSummary tbr = checker.fitness_token_based_replay(log, net);
        assert(near(tbr.percentageOfFittingTraces, 50.0));
        assert(near(tbr.averageTraceFitness, 0.75));

        const FitnessSummary ali = checker.fitness_alignments(log, net);
        assert(near(ali.percentageOfFittingTraces, 50.0));
        // Costs 0, 0, 1, 1 over best-worst costs 3, 3, 2, 2.
        assert(near(ali.logFitness, 1.0 - 2.0 / 10.0));

        const FitnessSummary par = checker.fitness_alignments(log, net, /*parallel=*/true);
        assert(near(par.logFitness, ali.logFitness));

        assert(checker.precision_token_based_replay(log, net) == 0.8);
        assert(checker.precision_alignments(log, net) == 0.8);
    }

    // Precision out of range.
    for (double bad : {1.5, -0.1, std::numeric_limits<double>::quiet_NaN()})
    {
        Engines engines;
        engines.precision = std::make_shared<test::FixedPrecisionEngine>(bad);
        ConformanceChecker checker(ConformanceConfig{}, engines);
        const EventLog log = test::make_log({{"A"}});
        test::expect_throw_as<std::runtime_error>([&]
                                                  { (void)checker.precision_alignments(log, test::sequence_net({"A"})); });
    }

    // Precision without an engine.
    {
        ConformanceChecker checker(ConformanceConfig{});
        const EventLog log = test::make_log({{"A"}});
        test::expect_throw([&]
                           { (void)checker.precision_token_based_replay(log, test::sequence_net({"A"})); });
    }

    return 0;
}
