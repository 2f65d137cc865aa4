#pragma once

#include "common.hpp"
#include "errors.hpp"

#include <functional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace tracecheck
{
    struct Event
    {
        AttributeMap attributes;
    };

    // One case: case-level attributes plus its ordered events. Event order is
    // authoritative for control-flow checks.
    struct Trace
    {
        AttributeMap attributes;
        std::vector<Event> events;
    };

    struct EventLog
    {
        std::vector<Trace> traces;
    };

    // Flat, column-oriented event table. Every column has one value per row.
    struct EventTable
    {
        std::map<std::string, std::vector<AttributeValue>, std::less<>> columns;

        bool has_column(std::string_view name) const { return columns.find(name) != columns.end(); }

        std::size_t row_count() const
        {
            return columns.empty() ? 0 : columns.begin()->second.size();
        }
    };

    // Non-owning view over one of the accepted log shapes.
    class LogView
    {
    public:
        LogView() = default;
        LogView(const EventLog &log) : m_log(std::cref(log)) {}
        LogView(const EventTable &table) : m_log(std::cref(table)) {}

        bool empty() const noexcept { return std::holds_alternative<std::monostate>(m_log); }

        const EventLog *event_log() const noexcept
        {
            auto p = std::get_if<std::reference_wrapper<const EventLog>>(&m_log);
            return p ? &p->get() : nullptr;
        }

        const EventTable *table() const noexcept
        {
            auto p = std::get_if<std::reference_wrapper<const EventTable>>(&m_log);
            return p ? &p->get() : nullptr;
        }

    private:
        std::variant<std::monostate, std::reference_wrapper<const EventLog>, std::reference_wrapper<const EventTable>> m_log;
    };

    inline std::string attribute_to_string(const AttributeValue &v)
    {
        if (auto s = std::get_if<std::string>(&v))
        {
            return *s;
        }
        if (auto d = std::get_if<double>(&v))
        {
            return std::to_string(*d);
        }
        if (auto i = std::get_if<std::int64_t>(&v))
        {
            return std::to_string(*i);
        }
        return std::get<bool>(v) ? "true" : "false";
    }

    inline const AttributeValue &require_attribute(const Event &ev, std::string_view key)
    {
        auto it = ev.attributes.find(key);
        if (it == ev.attributes.end())
        {
            throw SchemaError("event is missing attribute '" + std::string(key) + "'", std::string(key));
        }
        return it->second;
    }

    inline const Activity &activity_of(const Event &ev, std::string_view activityKey)
    {
        const auto &v = require_attribute(ev, activityKey);
        auto s = std::get_if<std::string>(&v);
        if (!s)
        {
            throw SchemaError("activity attribute '" + std::string(activityKey) + "' is not a string", std::string(activityKey));
        }
        return *s;
    }

    inline double timestamp_of(const Event &ev, std::string_view timestampKey)
    {
        const auto &v = require_attribute(ev, timestampKey);
        if (auto d = std::get_if<double>(&v))
        {
            return *d;
        }
        if (auto i = std::get_if<std::int64_t>(&v))
        {
            return static_cast<double>(*i);
        }
        throw SchemaError("timestamp attribute '" + std::string(timestampKey) + "' is not numeric", std::string(timestampKey));
    }

    inline std::vector<Activity> activities_of(const Trace &trace, std::string_view activityKey)
    {
        std::vector<Activity> out;
        out.reserve(trace.events.size());
        for (const auto &ev : trace.events)
        {
            out.push_back(activity_of(ev, activityKey));
        }
        return out;
    }

    // Groups table rows into cases. Cases appear in order of their first row and
    // keep their row order.
    inline EventLog table_to_event_log(const EventTable &table, std::string_view caseIdKey)
    {
        auto caseCol = table.columns.find(caseIdKey);
        if (caseCol == table.columns.end())
        {
            throw SchemaError("event table is missing column '" + std::string(caseIdKey) + "'", std::string(caseIdKey));
        }

        const std::size_t rows = table.row_count();
        for (const auto &[name, col] : table.columns)
        {
            if (col.size() != rows)
            {
                throw InputShapeError("event table column '" + name + "' has " + std::to_string(col.size()) +
                                      " rows, expected " + std::to_string(rows));
            }
        }

        EventLog log;
        std::unordered_map<std::string, std::size_t> caseIndex;
        for (std::size_t r = 0; r < rows; ++r)
        {
            const std::string caseId = attribute_to_string(caseCol->second[r]);
            auto [it, inserted] = caseIndex.emplace(caseId, log.traces.size());
            if (inserted)
            {
                Trace t;
                t.attributes.emplace(std::string(caseIdKey), caseCol->second[r]);
                log.traces.push_back(std::move(t));
            }

            Event ev;
            for (const auto &[name, col] : table.columns)
            {
                ev.attributes.emplace(name, col[r]);
            }
            log.traces[it->second].events.push_back(std::move(ev));
        }
        return log;
    }

    // Promotes a plain activity sequence into a trace with one event per activity.
    inline Trace trace_from_variant(const std::vector<Activity> &variant, std::string_view activityKey)
    {
        Trace t;
        t.events.reserve(variant.size());
        for (const auto &act : variant)
        {
            Event ev;
            ev.attributes.emplace(std::string(activityKey), act);
            t.events.push_back(std::move(ev));
        }
        return t;
    }

    // Variant strings use ',' as separator ("A,B,C"). The empty string is the empty trace.
    inline Trace trace_from_variant(std::string_view variant, std::string_view activityKey)
    {
        std::vector<Activity> acts;
        if (!variant.empty())
        {
            std::size_t start = 0;
            while (true)
            {
                const std::size_t comma = variant.find(',', start);
                acts.emplace_back(variant.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start));
                if (comma == std::string_view::npos)
                {
                    break;
                }
                start = comma + 1;
            }
        }
        return trace_from_variant(acts, activityKey);
    }

    inline EventLog single_trace_log(const Trace &trace)
    {
        EventLog log;
        log.traces.push_back(trace);
        return log;
    }
}
