#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace tracecheck
{
    inline constexpr std::string_view DefaultActivityKey = "concept:name";
    inline constexpr std::string_view DefaultTimestampKey = "time:timestamp";
    inline constexpr std::string_view DefaultCaseIdKey = "case:concept:name";

    using Activity = std::string;

    // Ordered (source, target) activity pair.
    using ActivityPair = std::pair<Activity, Activity>;

    using ActivitySet = std::set<Activity>;
    using PairSet = std::set<ActivityPair>;

    // Timestamps are numeric (seconds); both double and int64 are accepted.
    using AttributeValue = std::variant<std::string, double, std::int64_t, bool>;
    using AttributeMap = std::map<std::string, AttributeValue, std::less<>>;

    inline std::string pair_to_string(const ActivityPair &p)
    {
        return "(" + p.first + "," + p.second + ")";
    }
}
