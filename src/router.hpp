#pragma once

#include "config.hpp"
#include "engines.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "model.hpp"
#include "properties.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tracecheck
{
    // A model argument resolved to one of the shapes the engines accept.
    // Native shapes are referenced; converted models are owned.
    class ResolvedModel
    {
    public:
        using View = std::variant<const AcceptingPetriNet *, const FrequencyGraph *, const ProcessTree *>;

        explicit ResolvedModel(const AcceptingPetriNet &m) : m_view(&m), m_shape(ModelShape::Procedural) {}
        explicit ResolvedModel(const FrequencyGraph &m) : m_view(&m), m_shape(ModelShape::FrequencyGraph) {}
        explicit ResolvedModel(const ProcessTree &m) : m_view(&m), m_shape(ModelShape::Hierarchical) {}

        // Takes ownership of a net produced by conversion.
        static ResolvedModel converted(AcceptingPetriNet net)
        {
            ResolvedModel out;
            out.m_owned = std::make_shared<const AcceptingPetriNet>(std::move(net));
            out.m_view = out.m_owned.get();
            out.m_shape = ModelShape::Unrecognized;
            return out;
        }

        // Shape of the argument as supplied (Unrecognized for converted models).
        ModelShape original_shape() const noexcept { return m_shape; }
        const View &view() const noexcept { return m_view; }

        const AcceptingPetriNet *petri_net() const noexcept
        {
            auto p = std::get_if<const AcceptingPetriNet *>(&m_view);
            return p ? *p : nullptr;
        }

        const ProcessTree *process_tree() const noexcept
        {
            auto p = std::get_if<const ProcessTree *>(&m_view);
            return p ? *p : nullptr;
        }

        const FrequencyGraph *frequency_graph() const noexcept
        {
            auto p = std::get_if<const FrequencyGraph *>(&m_view);
            return p ? *p : nullptr;
        }

    private:
        ResolvedModel() = default;

        View m_view{};
        ModelShape m_shape = ModelShape::Unrecognized;
        std::shared_ptr<const AcceptingPetriNet> m_owned;
    };

    // Resolves the model shape once and forwards to the matching engine family.
    // The router itself computes nothing.
    class ModelRouter
    {
    public:
        ModelRouter(const Engines &engines, std::size_t workerThreads)
            : m_engines(engines), m_executor(engines.parallelExecutor)
        {
            if (!m_executor)
            {
                m_executor = std::make_shared<ThreadedAlignmentExecutor>(workerThreads);
            }
        }

        ResolvedModel resolve(const ModelArgument &model) const
        {
            const ModelShape shape = classify_model(model);
            Logger::instance().logf(LogLevel::Debug, "router", "model shape: %s", model_shape_name(shape));

            switch (shape)
            {
            case ModelShape::Procedural:
                return ResolvedModel(std::get<AcceptingPetriNet>(model));
            case ModelShape::FrequencyGraph:
                return ResolvedModel(std::get<FrequencyGraph>(model));
            case ModelShape::Hierarchical:
                return ResolvedModel(std::get<ProcessTree>(model));
            case ModelShape::Unrecognized:
                break;
            }

            const auto &foreign = std::get<std::shared_ptr<const IForeignModel>>(model);
            if (!foreign)
            {
                throw InputShapeError("model argument is a null foreign model");
            }
            return ResolvedModel::converted(convert_foreign(*foreign));
        }

        // Ordered best-effort conversion of an unrecognized model to a Petri net.
        AcceptingPetriNet convert_foreign(const IForeignModel &model) const
        {
            using Attempt = std::pair<const char *, std::function<std::optional<AcceptingPetriNet>()>>;
            std::vector<Attempt> attempts;
            attempts.emplace_back("as_petri_net", [&]()
                                  { return model.as_petri_net(); });
            attempts.emplace_back("as_process_tree", [&]() -> std::optional<AcceptingPetriNet>
                                  {
                auto tree = model.as_process_tree();
                if (!tree)
                {
                    return std::nullopt;
                }
                return converter_().to_petri_net(*tree); });
            for (const auto &conv : m_engines.foreignConversions)
            {
                if (conv)
                {
                    attempts.emplace_back("registered conversion", [&conv, &model]()
                                          { return conv(model); });
                }
            }

            for (const auto &[name, attempt] : attempts)
            {
                auto net = attempt();
                Logger::instance().logf(LogLevel::Trace, "router", "convert '%.*s' via %s: %s",
                                        static_cast<int>(model.kind().size()), model.kind().data(), name,
                                        net ? "ok" : "no");
                if (net)
                {
                    return std::move(*net);
                }
            }
            throw UnsupportedModelError("model of kind '" + std::string(model.kind()) + "' cannot be converted to a Petri net");
        }

        std::vector<ReplayRecord> replay(const EventLog &log, const AcceptingPetriNet &model, const Properties &props) const
        {
            if (!m_engines.replay)
            {
                throw std::runtime_error("token-based replay requires a token replay engine");
            }
            if (props.parallel())
            {
                Logger::instance().logf(LogLevel::Debug, "router", "token-based replay has no parallel variant; flag ignored");
            }
            auto out = m_engines.replay->replay(log, model, props);
            check_batch_size_(out.size(), log.traces.size(), "token replay engine");
            return out;
        }

        std::vector<AlignmentRecord> align(const EventLog &log, const ResolvedModel &model, const Properties &props) const
        {
            if (const FrequencyGraph *dfg = model.frequency_graph())
            {
                if (!m_engines.frequencyGraphAlignment)
                {
                    throw std::runtime_error("frequency-graph alignments require a frequency-graph alignment engine");
                }
                if (props.parallel())
                {
                    Logger::instance().logf(LogLevel::Debug, "router", "frequency-graph alignments have no parallel variant; flag ignored");
                }
                auto out = m_engines.frequencyGraphAlignment->align(log, *dfg, props);
                check_batch_size_(out.size(), log.traces.size(), "frequency-graph alignment engine");
                return out;
            }

            const IAlignmentEngine &engine = alignment_();
            IAlignmentExecutor::AlignOne alignOne;
            if (const ProcessTree *tree = model.process_tree())
            {
                alignOne = [&engine, &log, tree, &props](std::size_t i)
                { return engine.align(log.traces[i], *tree, props); };
            }
            else
            {
                const AcceptingPetriNet *net = model.petri_net();
                alignOne = [&engine, &log, net, &props](std::size_t i)
                { return engine.align(log.traces[i], *net, props); };
            }

            std::vector<AlignmentRecord> out;
            if (props.parallel())
            {
                out = m_executor->run(log.traces.size(), alignOne);
            }
            else
            {
                out.reserve(log.traces.size());
                for (std::size_t i = 0; i < log.traces.size(); ++i)
                {
                    out.push_back(alignOne(i));
                }
            }
            check_batch_size_(out.size(), log.traces.size(), "alignment executor");
            return out;
        }

        AlignmentRecord align_trace(const Trace &trace, const ProcessTree &model, const Properties &props) const
        {
            return alignment_().align(trace, model, props);
        }

        AlignmentRecord align_trace(const Trace &trace, const AcceptingPetriNet &model, const Properties &props) const
        {
            return alignment_().align(trace, model, props);
        }

        const IModelConverter &converter() const { return converter_(); }

        const IFootprintEngine &footprints() const
        {
            if (!m_engines.footprints)
            {
                throw std::runtime_error("footprint comparison requires a footprint engine");
            }
            return *m_engines.footprints;
        }

        const IPrecisionEngine &precision() const
        {
            if (!m_engines.precision)
            {
                throw std::runtime_error("precision requires a precision engine");
            }
            return *m_engines.precision;
        }

    private:
        static void check_batch_size_(std::size_t got, std::size_t expected, const char *who)
        {
            if (got != expected)
            {
                throw std::runtime_error(std::string(who) + " returned " + std::to_string(got) +
                                         " records for " + std::to_string(expected) + " traces");
            }
        }

        const IAlignmentEngine &alignment_() const
        {
            if (!m_engines.alignment)
            {
                throw std::runtime_error("alignments require an alignment engine");
            }
            return *m_engines.alignment;
        }

        const IModelConverter &converter_() const
        {
            if (!m_engines.converter)
            {
                throw std::runtime_error("model conversion requires a model converter");
            }
            return *m_engines.converter;
        }

        const Engines &m_engines;
        std::shared_ptr<const IAlignmentExecutor> m_executor;
    };
}
