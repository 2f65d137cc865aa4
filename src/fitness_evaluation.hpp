#pragma once

#include "engines.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

namespace tracecheck
{
    struct FitnessSummary
    {
        double averageTraceFitness = 0.0;
        // 0..100
        double percentageOfFittingTraces = 0.0;
        double logFitness = 0.0;
    };

    inline FitnessSummary evaluate_replay_fitness(const std::vector<ReplayRecord> &records)
    {
        FitnessSummary out;
        if (records.empty())
        {
            return out;
        }

        std::size_t fit = 0;
        double sumFitness = 0.0;
        std::uint64_t missing = 0;
        std::uint64_t consumed = 0;
        std::uint64_t remaining = 0;
        std::uint64_t produced = 0;
        for (const auto &r : records)
        {
            if (r.traceIsFit)
            {
                ++fit;
            }
            sumFitness += r.traceFitness;
            missing += r.missingTokens;
            consumed += r.consumedTokens;
            remaining += r.remainingTokens;
            produced += r.producedTokens;
        }

        const double n = static_cast<double>(records.size());
        out.averageTraceFitness = sumFitness / n;
        out.percentageOfFittingTraces = 100.0 * static_cast<double>(fit) / n;

        const double consumedTerm = consumed > 0 ? 1.0 - static_cast<double>(missing) / static_cast<double>(consumed) : 1.0;
        const double producedTerm = produced > 0 ? 1.0 - static_cast<double>(remaining) / static_cast<double>(produced) : 1.0;
        out.logFitness = 0.5 * consumedTerm + 0.5 * producedTerm;
        return out;
    }

    inline FitnessSummary evaluate_alignment_fitness(const std::vector<AlignmentRecord> &records)
    {
        FitnessSummary out;
        if (records.empty())
        {
            return out;
        }

        std::size_t fit = 0;
        double sumFitness = 0.0;
        double sumCost = 0.0;
        double sumBestWorst = 0.0;
        for (const auto &r : records)
        {
            if (r.fitness == 1.0)
            {
                ++fit;
            }
            sumFitness += r.fitness;
            sumCost += r.cost;
            sumBestWorst += r.bestWorstCost;
        }

        const double n = static_cast<double>(records.size());
        out.averageTraceFitness = sumFitness / n;
        out.percentageOfFittingTraces = 100.0 * static_cast<double>(fit) / n;
        out.logFitness = sumBestWorst > 0.0 ? 1.0 - sumCost / sumBestWorst : 1.0;
        return out;
    }

    inline double checked_precision(double value, const char *variant)
    {
        if (std::isnan(value) || value < 0.0 || value > 1.0)
        {
            throw std::runtime_error(std::string("precision engine (") + variant + ") returned " + std::to_string(value) +
                                     ", expected a value in [0,1]");
        }
        return value;
    }
}
