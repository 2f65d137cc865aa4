/*
Purpose: Alignments distributed over MPI ranks.

What this tests: With the MPI executor plugged in as the parallel alignment variant,
every rank receives the full per-trace result list in log order, identical to the
sequential run, each trace is aligned on exactly one rank, and a failure on one rank
is raised on all ranks.
*/

#include "conformance.hpp"
#include "mpi_alignment_executor.hpp"
#include "test_engines.hpp"

#include <mpi.h>

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>

using namespace tracecheck;

namespace
{
    [[noreturn]] void fail(const char *msg)
    {
        std::fprintf(stderr, "%s\n", msg);
        MPI_Abort(MPI_COMM_WORLD, 1);
        std::abort();
    }

    void check(bool ok, const char *msg)
    {
        if (!ok)
        {
            fail(msg);
        }
    }

    EventLog sample_log()
    {
        std::vector<test::Variant> variants;
        for (int i = 0; i < 17; ++i)
        {
            switch (i % 3)
            {
            case 0:
                variants.push_back({"A", "B", "C"});
                break;
            case 1:
                variants.push_back({"A", "C"});
                break;
            default:
                variants.push_back(test::Variant(static_cast<std::size_t>(i), "B"));
                break;
            }
        }
        return test::make_log(variants);
    }
}

int main(int argc, char **argv)
{
    int rc = MPI_Init(&argc, &argv);
    if (rc != MPI_SUCCESS)
    {
        return 2;
    }

    int rank = -1;
    int size = 0;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);
    check(size >= 2, "MPI parallel alignment test requires at least 2 ranks");

    const EventLog log = sample_log();
    const AcceptingPetriNet net = test::sequence_net({"A", "B", "C"});

    auto alignment = std::make_shared<test::ScriptedAlignmentEngine>(std::set<test::Variant>{{"A", "B", "C"}});
    Engines engines;
    engines.alignment = alignment;
    engines.parallelExecutor = std::make_shared<MpiAlignmentExecutor>(MPI_COMM_WORLD);
    ConformanceChecker checker(ConformanceConfig{}, engines);

    // Parallel result equals the sequential one on every rank.
    {
        const auto seq = checker.diagnostics_alignments(log, net, /*parallel=*/false);
        const int seqCalls = alignment->netCalls;
        check(seqCalls == static_cast<int>(log.traces.size()), "sequential run must align every trace locally");

        const auto par = checker.diagnostics_alignments(log, net, /*parallel=*/true);
        check(par.size() == seq.size(), "parallel result has the wrong size");
        for (std::size_t i = 0; i < seq.size(); ++i)
        {
            check(par[i].cost == seq[i].cost, "cost mismatch");
            check(par[i].fitness == seq[i].fitness, "fitness mismatch");
            check(par[i].alignment == seq[i].alignment, "alignment mismatch");
        }

        // Each trace aligned on exactly one rank.
        int local = alignment->netCalls - seqCalls;
        int total = 0;
        MPI_Allreduce(&local, &total, 1, MPI_INT, MPI_SUM, MPI_COMM_WORLD);
        check(total == static_cast<int>(log.traces.size()), "traces were not partitioned across ranks");

        const FitnessSummary a = checker.fitness_alignments(log, net, false);
        const FitnessSummary b = checker.fitness_alignments(log, net, true);
        check(a.logFitness == b.logFitness, "log fitness differs between sequential and parallel runs");
    }

    // A failure on the rank that owns trace 1 reaches every rank.
    {
        alignment->failOn = test::Variant{"A", "C"};
        bool caught = false;
        try
        {
            (void)checker.diagnostics_alignments(log, net, /*parallel=*/true);
        }
        catch (const std::runtime_error &e)
        {
            caught = std::string(e.what()).find("scripted alignment failure") != std::string::npos;
        }
        check(caught, "alignment failure was not raised on this rank");
        alignment->failOn.reset();
    }

    // The executor stays usable after a failure.
    {
        const auto par = checker.diagnostics_alignments(log, net, /*parallel=*/true);
        check(par.size() == log.traces.size(), "executor unusable after a failure");
    }

    MPI_Finalize();
    return 0;
}
