#include "conformance.hpp"
#include "token_game.hpp"

#include <cstdio>
#include <memory>
#include <string>

namespace
{
    // Order handling: register, then check and pay in any order, then ship.
    tracecheck::ProcessTree order_process()
    {
        using tracecheck::ProcessTree;
        using tracecheck::TreeOperator;
        return ProcessTree::node(TreeOperator::Sequence,
                                 {ProcessTree::leaf("register"),
                                  ProcessTree::node(TreeOperator::Parallel, {ProcessTree::leaf("check"), ProcessTree::leaf("pay")}),
                                  ProcessTree::leaf("ship")});
    }

    tracecheck::EventTable order_events()
    {
        struct Row
        {
            const char *caseId;
            const char *act;
            double ts;
        };
        const Row rows[] = {
            {"o1", "register", 0}, {"o1", "check", 2}, {"o1", "pay", 3}, {"o1", "ship", 5},
            {"o2", "register", 0}, {"o2", "pay", 1}, {"o2", "check", 30}, {"o2", "ship", 31},
            {"o3", "register", 0}, {"o3", "ship", 1},
            {"o4", "register", 0}, {"o4", "check", 1}, {"o4", "pay", 2}, {"o4", "pay", 3}, {"o4", "ship", 4},
        };

        tracecheck::EventTable table;
        auto &caseCol = table.columns[std::string(tracecheck::DefaultCaseIdKey)];
        auto &actCol = table.columns[std::string(tracecheck::DefaultActivityKey)];
        auto &tsCol = table.columns[std::string(tracecheck::DefaultTimestampKey)];
        for (const Row &r : rows)
        {
            caseCol.emplace_back(std::string(r.caseId));
            actCol.emplace_back(std::string(r.act));
            tsCol.emplace_back(r.ts);
        }
        return table;
    }
}

int main()
{
    tracecheck::ConformanceConfig cfg;
    cfg.logLevel = tracecheck::LogLevel::Info;
    cfg.workerThreads = 2;

    tracecheck::Engines engines;
    engines.replay = std::make_shared<demo::TokenGameReplay>();
    engines.alignment = std::make_shared<demo::DijkstraAligner>();

    const tracecheck::ConformanceChecker checker(cfg, engines);
    const tracecheck::ProcessTree tree = order_process();
    const tracecheck::AcceptingPetriNet net = checker.router().converter().to_petri_net(tree);
    const tracecheck::EventTable table = order_events();

    const auto replay = checker.diagnostics_token_based_replay(table, net);
    const auto tbr = checker.fitness_token_based_replay(table, net);
    std::printf("token replay: %zu cases, %.1f%% fitting, log fitness %.3f\n", replay.size(), tbr.percentageOfFittingTraces, tbr.logFitness);

    const auto aligned = checker.diagnostics_alignments(table, tree, /*parallel=*/true);
    for (std::size_t i = 0; i < aligned.size(); ++i)
    {
        std::printf("case %zu: alignment cost %.0f, fitness %.3f, %zu moves\n", i + 1, aligned[i].cost, aligned[i].fitness, aligned[i].alignment.size());
    }

    for (const char *variant : {"register,check,pay,ship", "register,ship", "register,audit,ship"})
    {
        const tracecheck::CascadeVerdict v = checker.verify_fitting(std::string(variant), tree);
        std::printf("%-26s %s (decided by %s)\n", variant, v.fit ? "fits" : "does not fit", tracecheck::cascade_stage_name(v.decidedAt));
    }

    tracecheck::TemporalProfile profile;
    profile[{"pay", "ship"}] = tracecheck::TemporalStats{2.0, 1.0};
    profile[{"register", "ship"}] = tracecheck::TemporalStats{5.0, 2.0};
    const auto temporal = checker.conformance_temporal_profile(table, profile, 2.0);
    for (std::size_t i = 0; i < temporal.size(); ++i)
    {
        for (const auto &d : temporal[i])
        {
            std::printf("case %zu: %s took %.1f (expected %.1f +- %.1f)\n", i + 1, tracecheck::pair_to_string(d.pair).c_str(), d.observedGap,
                        d.expectedMean, d.allowedBound);
        }
    }

    tracecheck::LogSkeleton skeleton;
    skeleton.activOccurrences["pay"] = {1};
    skeleton.alwaysBefore.insert({"ship", "pay"});
    const auto violations = checker.conformance_log_skeleton(table, skeleton);
    for (std::size_t i = 0; i < violations.size(); ++i)
    {
        for (const auto &v : violations[i])
        {
            std::printf("case %zu violates %s(%s%s%s)\n", i + 1, tracecheck::skeleton_constraint_name(v.constraint), v.first.c_str(),
                        v.second.empty() ? "" : ",", v.second.c_str());
        }
    }

    return 0;
}
