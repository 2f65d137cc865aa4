#pragma once

#include "common.hpp"
#include "petri_net.hpp"
#include "process_tree.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string_view>
#include <variant>

namespace tracecheck
{
    // Directly-follows graph with frequencies plus its start/end activities.
    struct FrequencyGraph
    {
        std::map<ActivityPair, std::uint64_t> directlyFollows;
        std::map<Activity, std::uint64_t> startActivities;
        std::map<Activity, std::uint64_t> endActivities;

        ActivitySet activities() const
        {
            ActivitySet out;
            for (const auto &[pair, n] : directlyFollows)
            {
                (void)n;
                out.insert(pair.first);
                out.insert(pair.second);
            }
            for (const auto &[a, n] : startActivities)
            {
                (void)n;
                out.insert(a);
            }
            for (const auto &[a, n] : endActivities)
            {
                (void)n;
                out.insert(a);
            }
            return out;
        }
    };

    // A model whose shape is none of the natively supported ones (e.g. a BPMN
    // graph). It may expose structural conversions; both default to "cannot".
    class IForeignModel
    {
    public:
        virtual ~IForeignModel() = default;

        virtual std::string_view kind() const noexcept = 0;

        virtual std::optional<ProcessTree> as_process_tree() const { return std::nullopt; }
        virtual std::optional<AcceptingPetriNet> as_petri_net() const { return std::nullopt; }
    };

    using ModelArgument = std::variant<AcceptingPetriNet, FrequencyGraph, ProcessTree, std::shared_ptr<const IForeignModel>>;

    enum class ModelShape : std::uint8_t
    {
        Procedural = 0,
        FrequencyGraph = 1,
        Hierarchical = 2,
        Unrecognized = 3,
    };

    inline const char *model_shape_name(ModelShape s) noexcept
    {
        switch (s)
        {
        case ModelShape::Procedural:
            return "petri-net";
        case ModelShape::FrequencyGraph:
            return "frequency-graph";
        case ModelShape::Hierarchical:
            return "process-tree";
        case ModelShape::Unrecognized:
            return "unrecognized";
        }
        return "?";
    }

    inline ModelShape classify_model(const ModelArgument &model) noexcept
    {
        switch (model.index())
        {
        case 0:
            return ModelShape::Procedural;
        case 1:
            return ModelShape::FrequencyGraph;
        case 2:
            return ModelShape::Hierarchical;
        default:
            return ModelShape::Unrecognized;
        }
    }
}
