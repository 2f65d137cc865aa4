#pragma once

#include "common.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace tracecheck
{
    using PlaceId = std::uint32_t;
    using TransitionId = std::uint32_t;

    struct Place
    {
        PlaceId id = 0;
        std::string name;
    };

    struct Transition
    {
        TransitionId id = 0;
        std::string name;
        // std::nullopt marks a silent transition.
        std::optional<Activity> label;
    };

    struct Arc
    {
        enum class Direction : std::uint8_t
        {
            PlaceToTransition = 0,
            TransitionToPlace = 1,
        };

        Direction direction = Direction::PlaceToTransition;
        PlaceId place = 0;
        TransitionId transition = 0;
        std::uint32_t weight = 1;
    };

    // Token count per place. Places with zero tokens are not stored.
    using Marking = std::map<PlaceId, std::uint32_t>;

    class PetriNet
    {
    public:
        PetriNet() = default;
        explicit PetriNet(std::string name) : m_name(std::move(name)) {}

        const std::string &name() const noexcept { return m_name; }

        PlaceId add_place(std::string name)
        {
            const auto id = static_cast<PlaceId>(m_places.size());
            m_places.push_back(Place{id, std::move(name)});
            return id;
        }

        TransitionId add_transition(std::string name, std::optional<Activity> label)
        {
            const auto id = static_cast<TransitionId>(m_transitions.size());
            m_transitions.push_back(Transition{id, std::move(name), std::move(label)});
            return id;
        }

        // PlaceId and TransitionId share a representation, so the arc direction
        // is spelled out in the name.
        void add_input_arc(PlaceId from, TransitionId to, std::uint32_t weight = 1)
        {
            check_ids_(from, to);
            m_arcs.push_back(Arc{Arc::Direction::PlaceToTransition, from, to, weight});
        }

        void add_output_arc(TransitionId from, PlaceId to, std::uint32_t weight = 1)
        {
            check_ids_(to, from);
            m_arcs.push_back(Arc{Arc::Direction::TransitionToPlace, to, from, weight});
        }

        const std::vector<Place> &places() const noexcept { return m_places; }
        const std::vector<Transition> &transitions() const noexcept { return m_transitions; }
        const std::vector<Arc> &arcs() const noexcept { return m_arcs; }

        // Labels of all visible transitions.
        ActivitySet visible_labels() const
        {
            ActivitySet out;
            for (const auto &t : m_transitions)
            {
                if (t.label)
                {
                    out.insert(*t.label);
                }
            }
            return out;
        }

    private:
        void check_ids_(PlaceId p, TransitionId t) const
        {
            if (p >= m_places.size())
            {
                throw std::runtime_error("PetriNet: unknown PlaceId=" + std::to_string(p));
            }
            if (t >= m_transitions.size())
            {
                throw std::runtime_error("PetriNet: unknown TransitionId=" + std::to_string(t));
            }
        }

        std::string m_name;
        std::vector<Place> m_places;
        std::vector<Transition> m_transitions;
        std::vector<Arc> m_arcs;
    };

    // Procedural model: a net with its initial and final markings.
    struct AcceptingPetriNet
    {
        PetriNet net;
        Marking initialMarking;
        Marking finalMarking;
    };
}
