#include "mdquery/types/attribute_value.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace mdquery {

namespace {

constexpr const char* kDateTag = "$date";

std::string format_double(double value) {
  std::ostringstream ss;
  ss << std::setprecision(15) << value;
  return ss.str();
}

}  // namespace

bool is_null(const AttributeValue& value) {
  return std::holds_alternative<std::monostate>(value);
}

std::string to_display_string(const AttributeValue& value) {
  if (const auto* s = std::get_if<std::string>(&value)) {
    return *s;
  }
  if (const auto* i = std::get_if<std::int64_t>(&value)) {
    return std::to_string(*i);
  }
  if (const auto* d = std::get_if<double>(&value)) {
    return format_double(*d);
  }
  if (const auto* b = std::get_if<bool>(&value)) {
    return *b ? "true" : "false";
  }
  if (const auto* t = std::get_if<TimePoint>(&value)) {
    return format_iso8601(*t);
  }
  if (const auto* list = std::get_if<std::vector<std::string>>(&value)) {
    std::string out;
    for (const auto& element : *list) {
      if (!out.empty()) out += ", ";
      out += element;
    }
    return out;
  }
  return "";
}

std::string format_iso8601(TimePoint tp) {
  auto time_t = Clock::to_time_t(tp);
  std::tm tm_struct = {};
  gmtime_r(&time_t, &tm_struct);
  std::stringstream ss;
  ss << std::put_time(&tm_struct, "%Y-%m-%dT%H:%M:%SZ");
  return ss.str();
}

TimePoint parse_iso8601(const std::string& text) {
  std::tm tm_struct = {};
  std::stringstream ss(text);
  ss >> std::get_time(&tm_struct, "%Y-%m-%dT%H:%M:%S");
  if (ss.fail()) {
    throw std::invalid_argument("Failed to parse time string: " + text +
                                ". Expected format YYYY-MM-DDTHH:MM:SSZ.");
  }
  return Clock::from_time_t(timegm(&tm_struct));
}

nlohmann::json attribute_value_to_json(const AttributeValue& value) {
  if (const auto* s = std::get_if<std::string>(&value)) {
    return *s;
  }
  if (const auto* i = std::get_if<std::int64_t>(&value)) {
    return *i;
  }
  if (const auto* d = std::get_if<double>(&value)) {
    return *d;
  }
  if (const auto* b = std::get_if<bool>(&value)) {
    return *b;
  }
  if (const auto* t = std::get_if<TimePoint>(&value)) {
    return nlohmann::json{{kDateTag, format_iso8601(*t)}};
  }
  if (const auto* list = std::get_if<std::vector<std::string>>(&value)) {
    return *list;
  }
  return nullptr;
}

AttributeValue attribute_value_from_json(const nlohmann::json& json) {
  if (json.is_string()) {
    return json.get<std::string>();
  }
  if (json.is_boolean()) {
    return json.get<bool>();
  }
  if (json.is_number_integer()) {
    return json.get<std::int64_t>();
  }
  if (json.is_number_float()) {
    return json.get<double>();
  }
  if (json.is_object() && json.contains(kDateTag)) {
    return parse_iso8601(json.at(kDateTag).get<std::string>());
  }
  if (json.is_array()) {
    std::vector<std::string> list;
    for (const auto& element : json) {
      if (element.is_string()) list.push_back(element.get<std::string>());
    }
    return list;
  }
  return std::monostate{};
}

nlohmann::json attribute_values_to_json(const AttributeValues& values) {
  nlohmann::json out = nlohmann::json::object();
  for (const auto& [key, value] : values) {
    if (is_null(value)) continue;
    out[key] = attribute_value_to_json(value);
  }
  return out;
}

AttributeValues attribute_values_from_json(const nlohmann::json& json) {
  AttributeValues values;
  if (!json.is_object()) {
    return values;
  }
  for (auto it = json.begin(); it != json.end(); ++it) {
    AttributeValue value = attribute_value_from_json(it.value());
    if (!is_null(value)) {
      values.emplace(it.key(), std::move(value));
    }
  }
  return values;
}

}  // namespace mdquery
