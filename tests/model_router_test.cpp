/*
Purpose: Model shape routing for alignments and replay.

What this tests: Each model shape reaches its engine family, unrecognized models go
through the ordered conversion chain (or fail with UnsupportedModelError), the
parallel flag only affects the per-trace alignment path, results keep log order,
and engines returning the wrong number of records are rejected.
*/

#include "conformance.hpp"
#include "test_engines.hpp"

#include <algorithm>
#include <cassert>
#include <memory>
#include <vector>

using namespace tracecheck;

namespace
{
    // Counts how often the parallel path is taken.
    class CountingExecutor final : public IAlignmentExecutor
    {
    public:
        std::vector<AlignmentRecord> run(std::size_t count, const AlignOne &alignOne) const override
        {
            ++runs;
            std::vector<AlignmentRecord> out;
            for (std::size_t i = count; i-- > 0;)
            {
                out.push_back(alignOne(i));
            }
            std::reverse(out.begin(), out.end());
            return out;
        }

        mutable int runs = 0;
    };

    ProcessTree seq_ab()
    {
        return ProcessTree::node(TreeOperator::Sequence, {ProcessTree::leaf("A"), ProcessTree::leaf("B")});
    }
}

int main()
{
    const EventLog log = test::make_log({{"A", "B"}, {"B"}, {"A", "B"}});

    auto alignment = std::make_shared<test::ScriptedAlignmentEngine>(std::set<test::Variant>{{"A", "B"}});
    auto dfgAligner = std::make_shared<test::ScriptedFrequencyGraphAligner>();
    auto executor = std::make_shared<CountingExecutor>();

    Engines engines;
    engines.alignment = alignment;
    engines.frequencyGraphAlignment = dfgAligner;
    engines.parallelExecutor = executor;
    ConformanceChecker checker(ConformanceConfig{}, engines);

    // Petri net, sequential.
    {
        const auto out = checker.diagnostics_alignments(log, test::sequence_net({"A", "B"}));
        assert(out.size() == 3);
        assert(out[0].fitness == 1.0);
        assert(out[1].fitness < 1.0);
        assert(out[2].fitness == 1.0);
        assert(alignment->netCalls == 3);
        assert(executor->runs == 0);
    }

    // Process tree, parallel: same results, executor used.
    {
        const auto out = checker.diagnostics_alignments(log, seq_ab(), /*parallel=*/true);
        assert(out.size() == 3);
        assert(out[1].cost == 1.0);
        assert(alignment->treeCalls == 3);
        assert(executor->runs == 1);
    }

    // Frequency graph: dedicated engine, parallel flag ignored.
    {
        FrequencyGraph dfg;
        dfg.directlyFollows[{"A", "B"}] = 2;
        dfg.startActivities["A"] = 2;
        dfg.endActivities["B"] = 2;
        const auto out = checker.diagnostics_alignments(log, dfg, /*parallel=*/true);
        assert(out.size() == 3);
        assert(dfgAligner->calls == 1);
        assert(executor->runs == 1);
    }

    // Foreign model: as_petri_net wins over as_process_tree.
    {
        auto foreign = std::make_shared<test::StubForeignModel>(seq_ab(), test::sequence_net({"A", "B"}));
        const int treeBefore = alignment->treeCalls;
        const int netBefore = alignment->netCalls;
        const auto out = checker.diagnostics_alignments(log, std::shared_ptr<const IForeignModel>(foreign));
        assert(out.size() == 3);
        assert(alignment->treeCalls == treeBefore);
        assert(alignment->netCalls == netBefore + 3);
    }

    // Foreign model exposing only a tree is converted through the builtin converter.
    {
        auto foreign = std::make_shared<test::StubForeignModel>(seq_ab(), std::nullopt);
        const ResolvedModel resolved = checker.router().resolve(std::shared_ptr<const IForeignModel>(foreign));
        assert(resolved.original_shape() == ModelShape::Unrecognized);
        assert(resolved.petri_net() != nullptr);
        assert((resolved.petri_net()->net.visible_labels() == ActivitySet{"A", "B"}));
    }

    // Registered conversions are tried after the model's own.
    {
        Engines withFallback;
        withFallback.alignment = alignment;
        int fallbackCalls = 0;
        withFallback.foreignConversions.push_back([&](const IForeignModel &) -> std::optional<AcceptingPetriNet>
                                                  { ++fallbackCalls; return std::nullopt; });
        withFallback.foreignConversions.push_back([&](const IForeignModel &) -> std::optional<AcceptingPetriNet>
                                                  { ++fallbackCalls; return test::sequence_net({"A"}); });
        ConformanceChecker c2(ConformanceConfig{}, withFallback);

        auto opaque = std::make_shared<test::StubForeignModel>(std::nullopt, std::nullopt);
        const ResolvedModel resolved = c2.router().resolve(std::shared_ptr<const IForeignModel>(opaque));
        assert(fallbackCalls == 2);
        assert((resolved.petri_net()->net.visible_labels() == ActivitySet{"A"}));
    }

    // Nothing converts: UnsupportedModelError.
    {
        auto opaque = std::make_shared<test::StubForeignModel>(std::nullopt, std::nullopt);
        test::expect_throw_as<UnsupportedModelError>([&]
                                                     { (void)checker.diagnostics_alignments(log, std::shared_ptr<const IForeignModel>(opaque)); });
        test::expect_throw_as<InputShapeError>([&]
                                               { (void)checker.diagnostics_alignments(log, std::shared_ptr<const IForeignModel>()); });
    }

    // Replay: batch size mismatch is an error; a missing engine is an error.
    {
        auto replay = std::make_shared<test::ScriptedReplayEngine>(std::set<test::Variant>{{"A", "B"}});
        replay->dropLast = true;
        Engines e;
        e.replay = replay;
        ConformanceChecker c3(ConformanceConfig{}, e);
        test::expect_throw([&]
                           { (void)c3.diagnostics_token_based_replay(log, test::sequence_net({"A", "B"})); });

        test::expect_throw([&]
                           { (void)checker.diagnostics_token_based_replay(log, test::sequence_net({"A", "B"})); });
    }

    // Empty log: empty result, engine not asked for anything.
    {
        const EventLog empty;
        const int before = alignment->netCalls;
        assert(checker.diagnostics_alignments(empty, test::sequence_net({"A"})).empty());
        assert(alignment->netCalls == before);
    }

    return 0;
}
