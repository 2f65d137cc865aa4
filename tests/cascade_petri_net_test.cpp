/*
Purpose: Fitness cascade over Petri nets and frequency graphs.

What this tests: An activity that no transition carries decides "not fit" at the label
tier, the footprint tier is skipped for nets unless enabled, frequency graphs are
converted to nets first, and unconvertible models are rejected. A net the converter
lifts to a process tree takes the tree path and replays on the original net.
*/

#include "conformance.hpp"
#include "test_engines.hpp"

#include <cassert>
#include <memory>
#include <optional>
#include <string>

using namespace tracecheck;

namespace
{
    // Footprint engine that counts net discoveries and reports a fixed footprint.
    class NetFootprintEngine final : public IFootprintEngine
    {
    public:
        Footprint discover(const EventLog &log, const Properties &props) const override { return m_builtin.discover(log, props); }
        std::vector<Footprint> discover_per_trace(const EventLog &log, const Properties &props) const override
        {
            return m_builtin.discover_per_trace(log, props);
        }
        Footprint discover(const ProcessTree &tree) const override { return m_builtin.discover(tree); }
        Footprint discover(const AcceptingPetriNet &) const override
        {
            ++netCalls;
            Footprint fp;
            fp.activities = {"A", "B"};
            fp.sequence = {{"A", "B"}};
            fp.startActivities = {"A"};
            fp.endActivities = {"B"};
            fp.alwaysExecuted = {"A", "B"};
            fp.minTraceLength = 2;
            return fp;
        }

        mutable int netCalls = 0;

    private:
        BuiltinFootprintEngine m_builtin;
    };

    // Converter that lifts nets labelled exactly {A, B} to ->( A, B ).
    class LiftingConverter final : public IModelConverter
    {
    public:

        AcceptingPetriNet to_petri_net(const ProcessTree &tree) const override { return m_builtin.to_petri_net(tree); }
        AcceptingPetriNet to_petri_net(const FrequencyGraph &graph) const override { return m_builtin.to_petri_net(graph); }

        std::optional<ProcessTree> to_process_tree(const AcceptingPetriNet &net) const override
        {
            ++lifts;
            if (net.net.visible_labels() != ActivitySet{"A", "B"})
            {
                return std::nullopt;
            }
            return ProcessTree::node(TreeOperator::Sequence, {ProcessTree::leaf("A"), ProcessTree::leaf("B")});
        }

        mutable int lifts = 0;

    private:
        BuiltinModelConverter m_builtin;
    };
}

int main()
{
    const AcceptingPetriNet net = test::sequence_net({"A", "B"});

    auto replay = std::make_shared<test::ScriptedReplayEngine>(std::set<test::Variant>{{"A", "B"}});
    auto alignment = std::make_shared<test::ScriptedAlignmentEngine>(std::set<test::Variant>{{"A", "B"}});
    Engines engines;
    engines.replay = replay;
    engines.alignment = alignment;
    ConformanceChecker checker(ConformanceConfig{}, engines);

    // Unknown activity: label tier decides, nothing else runs.
    {
        const CascadeVerdict v = checker.verify_fitting(test::Variant{"A", "Z"}, net);
        assert(!v.fit);
        assert(v.decidedAt == CascadeStage::Labels);
        assert(replay->calls == 0);
        assert(alignment->netCalls == 0);
    }

    // Known labels, fitting: replay decides.
    {
        const CascadeVerdict v = checker.verify_fitting(std::string("A,B"), net);
        assert(v.fit);
        assert(v.decidedAt == CascadeStage::Replay);
        assert(replay->calls == 1);
    }

    // Known labels, wrong order: alignments decide.
    {
        const CascadeVerdict v = checker.verify_fitting(std::string("B,A"), net);
        assert(!v.fit);
        assert(v.decidedAt == CascadeStage::Alignment);
        assert(alignment->netCalls == 1);
    }

    // The empty variant has no unknown label and goes on to replay.
    {
        const int before = replay->calls;
        (void)checker.verify_fitting(std::string(""), net);
        assert(replay->calls == before + 1);
    }

    // Frequency graph: converted to a net, then the label tier applies.
    {
        FrequencyGraph dfg;
        dfg.directlyFollows[{"A", "B"}] = 1;
        dfg.startActivities["A"] = 1;
        dfg.endActivities["B"] = 1;
        const CascadeVerdict v = checker.verify_fitting(test::Variant{"C"}, dfg);
        assert(!v.fit);
        assert(v.decidedAt == CascadeStage::Labels);
    }

    // Footprint tier for nets, when enabled.
    {
        auto fp = std::make_shared<NetFootprintEngine>();
        Engines e = engines;
        e.footprints = fp;
        ConformanceConfig cfg;
        cfg.cascade.footprintTierForPetriNets = true;
        ConformanceChecker withTier(cfg, e);

        const CascadeVerdict v = withTier.verify_fitting(test::Variant{"B", "A"}, net);
        assert(!v.fit);
        assert(v.decidedAt == CascadeStage::Footprints);
        assert(fp->netCalls == 1);

        const CascadeVerdict ok = withTier.verify_fitting(test::Variant{"A", "B"}, net);
        assert(ok.fit);
        assert(ok.decidedAt == CascadeStage::Replay);
    }

    // Enabled with the builtin engine, which has no net footprints.
    {
        ConformanceConfig cfg;
        cfg.cascade.footprintTierForPetriNets = true;
        ConformanceChecker builtin(cfg, engines);
        test::expect_throw_as<UnsupportedModelError>([&]
                                                     { (void)builtin.verify_fitting(test::Variant{"A", "B"}, net); });
    }

    // The builtin converter lifts nothing, so nets stay on the net path.
    assert(!BuiltinModelConverter{}.to_process_tree(net).has_value());

    // A lifted net is checked with tree footprints before replay.
    {
        auto lifting = std::make_shared<LiftingConverter>();
        auto liftReplay = std::make_shared<test::ScriptedReplayEngine>(std::set<test::Variant>{{"A", "B"}});
        Engines e = engines;
        e.replay = liftReplay;
        e.converter = lifting;
        ConformanceChecker lifted(ConformanceConfig{}, e);

        const CascadeVerdict wrongOrder = lifted.verify_fitting(test::Variant{"B", "A"}, net);
        assert(!wrongOrder.fit);
        assert(wrongOrder.decidedAt == CascadeStage::Footprints);
        assert(lifting->lifts == 1);
        assert(liftReplay->calls == 0);

        // Unknown activities are caught by footprints; there is no label tier.
        const CascadeVerdict unknown = lifted.verify_fitting(test::Variant{"A", "Z"}, net);
        assert(!unknown.fit);
        assert(unknown.decidedAt == CascadeStage::Footprints);

        const CascadeVerdict ok = lifted.verify_fitting(test::Variant{"A", "B"}, net);
        assert(ok.fit);
        assert(ok.decidedAt == CascadeStage::Replay);
        assert(liftReplay->calls == 1);
    }

    // Foreign model with no conversion.
    {
        auto opaque = std::make_shared<test::StubForeignModel>(std::nullopt, std::nullopt);
        test::expect_throw_as<UnsupportedModelError>([&]
                                                     { (void)checker.verify_fitting(test::Variant{"A"}, std::shared_ptr<const IForeignModel>(opaque)); });
    }

    return 0;
}
