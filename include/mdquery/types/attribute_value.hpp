#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace mdquery {

using Clock = std::chrono::system_clock;
using TimePoint = std::chrono::system_clock::time_point;

// Backend-assigned identity of a result item.
using ItemId = std::uint64_t;

// A single attribute value as the backend reports it. Sizes are bytes,
// durations are seconds, dates are UTC.
using AttributeValue = std::variant<std::monostate, std::string, std::int64_t, double, bool,
                                    TimePoint, std::vector<std::string>>;

// Fetched values keyed by backend key (e.g. "kMDItemFSName").
using AttributeValues = std::map<std::string, AttributeValue>;

bool is_null(const AttributeValue& value);

// Human readable rendering, used by the CLI and in log lines.
std::string to_display_string(const AttributeValue& value);

// "2024-03-15T10:00:00Z"
std::string format_iso8601(TimePoint tp);
TimePoint parse_iso8601(const std::string& text);

// JSON storage form. Dates are wrapped as {"$date": "<iso8601>"} so they
// survive a round trip through the index.
nlohmann::json attribute_value_to_json(const AttributeValue& value);
AttributeValue attribute_value_from_json(const nlohmann::json& json);

nlohmann::json attribute_values_to_json(const AttributeValues& values);
AttributeValues attribute_values_from_json(const nlohmann::json& json);

}  // namespace mdquery
