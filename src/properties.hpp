#pragma once

#include "common.hpp"
#include "errors.hpp"
#include "event_log.hpp"

#include <optional>
#include <string>

namespace tracecheck
{
    struct PropertyKeys
    {
        std::string activityKey{DefaultActivityKey};
        std::string timestampKey{DefaultTimestampKey};
        std::string caseIdKey{DefaultCaseIdKey};
    };

    // Algorithm-specific extras forwarded alongside the keys.
    struct PropertyExtras
    {
        // Tolerance multiplier for temporal profile conformance.
        std::optional<double> zeta;

        // Request the parallel alignment variant where one exists.
        bool parallel = false;

        // Start-of-activity timestamp for interval logs; empty means the completion timestamp.
        std::string startTimestampKey;
    };

    // Normalized configuration record shared by every stage of a call.
    class Properties
    {
    public:
        Properties() : Properties(PropertyKeys{}, PropertyExtras{}) {}

        Properties(PropertyKeys keys, PropertyExtras extras) : m_keys(std::move(keys)), m_extras(std::move(extras))
        {
            if (m_extras.startTimestampKey.empty())
            {
                m_extras.startTimestampKey = m_keys.timestampKey;
            }
        }

        const std::string &activity_key() const noexcept { return m_keys.activityKey; }
        const std::string &timestamp_key() const noexcept { return m_keys.timestampKey; }
        const std::string &case_id_key() const noexcept { return m_keys.caseIdKey; }
        const std::string &start_timestamp_key() const noexcept { return m_extras.startTimestampKey; }
        std::optional<double> zeta() const noexcept { return m_extras.zeta; }
        bool parallel() const noexcept { return m_extras.parallel; }

        Properties with_parallel(bool parallel) const
        {
            Properties out = *this;
            out.m_extras.parallel = parallel;
            return out;
        }

        Properties with_zeta(double zeta) const
        {
            Properties out = *this;
            out.m_extras.zeta = zeta;
            return out;
        }

    private:
        PropertyKeys m_keys;
        PropertyExtras m_extras;
    };

    inline void check_table_columns(const EventTable &table, const PropertyKeys &keys)
    {
        for (const std::string *col : {&keys.caseIdKey, &keys.activityKey, &keys.timestampKey})
        {
            if (!table.has_column(*col))
            {
                throw SchemaError("event table is missing required column '" + *col + "'", *col);
            }
        }
    }

    // Validates the log shape (and, for tables, the configured columns) and
    // returns the normalized configuration record.
    inline Properties normalize_properties(const LogView &log, const PropertyKeys &keys, PropertyExtras extras = {})
    {
        if (log.empty())
        {
            throw InputShapeError("the method can be applied only to an event log or an event table");
        }
        if (const EventTable *table = log.table())
        {
            check_table_columns(*table, keys);
        }
        return Properties(keys, std::move(extras));
    }

    // Structured form of a LogView. Structured logs are referenced; tables are
    // grouped by case id into an owned log.
    class ResolvedLog
    {
    public:
        ResolvedLog(const LogView &log, const Properties &props)
        {
            if (const EventLog *l = log.event_log())
            {
                m_ref = l;
                return;
            }
            if (const EventTable *t = log.table())
            {
                m_owned = table_to_event_log(*t, props.case_id_key());
                return;
            }
            throw InputShapeError("the method can be applied only to an event log or an event table");
        }

        const EventLog &get() const noexcept { return m_ref ? *m_ref : m_owned; }

    private:
        EventLog m_owned;
        const EventLog *m_ref = nullptr;
    };
}
