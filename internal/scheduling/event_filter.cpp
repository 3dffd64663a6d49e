#include "event_filter.hpp"

#include <cmath>
#include <optional>
#include <regex>
#include <sstream>
#include <string>

#include <google/protobuf/util/message_differencer.h>

#include "internal/observability/logging.hpp"

namespace fleet::scheduling {

namespace {

using google::protobuf::Value;
using observability::StringField;

bool Equal(const Value& a, const Value& b) {
  return google::protobuf::util::MessageDifferencer::Equals(a, b);
}

// -1, 0, 1; nullopt when the kinds are not ordered against each other.
std::optional<int> Compare(const Value& a, const Value& b) {
  if (a.kind_case() == Value::kNumberValue && b.kind_case() == Value::kNumberValue) {
    if (a.number_value() < b.number_value()) return -1;
    if (a.number_value() > b.number_value()) return 1;
    return 0;
  }
  if (a.kind_case() == Value::kStringValue && b.kind_case() == Value::kStringValue) {
    const int c = a.string_value().compare(b.string_value());
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
  }
  return std::nullopt;
}

std::string AsText(const Value& v) {
  switch (v.kind_case()) {
    case Value::kStringValue:
      return v.string_value();
    case Value::kBoolValue:
      return v.bool_value() ? "true" : "false";
    case Value::kNumberValue: {
      const double n = v.number_value();
      if (std::floor(n) == n && std::fabs(n) < 1e15) return std::to_string(static_cast<long long>(n));
      std::ostringstream out;
      out << n;
      return out.str();
    }
    case Value::kNullValue:
      return "null";
    default:
      return {};
  }
}

bool IsOperatorSet(const Value& v) {
  if (v.kind_case() != Value::kStructValue || v.struct_value().fields().empty()) return false;
  for (const auto& [key, _] : v.struct_value().fields()) {
    if (key.empty() || key.front() != '$') return false;
  }
  return true;
}

bool MatchesOperators(const Value& actual, const google::protobuf::Struct& ops) {
  for (const auto& [op, expected] : ops.fields()) {
    if (op == "$eq") {
      if (!Equal(actual, expected)) return false;
    } else if (op == "$ne") {
      if (Equal(actual, expected)) return false;
    } else if (op == "$gt") {
      const auto c = Compare(actual, expected);
      if (!c || *c <= 0) return false;
    } else if (op == "$lt") {
      const auto c = Compare(actual, expected);
      if (!c || *c >= 0) return false;
    } else if (op == "$in") {
      if (expected.kind_case() != Value::kListValue) return false;
      bool found = false;
      for (const auto& item : expected.list_value().values()) {
        if (Equal(actual, item)) {
          found = true;
          break;
        }
      }
      if (!found) return false;
    } else if (op == "$regex") {
      try {
        const std::regex pattern(expected.string_value());
        const auto       text = AsText(actual);
        if (!std::regex_search(text, pattern, std::regex_constants::match_continuous)) return false;
      } catch (const std::regex_error& e) {
        FLEET_LOG_WARN("Invalid event filter regex", {StringField("pattern", expected.string_value()), StringField("error", e.what())});
        return false;
      }
    } else {
      FLEET_LOG_WARN("Unknown event filter operator", {StringField("operator", op)});
      return false;
    }
  }
  return true;
}

} // namespace

bool MatchesEventFilter(const google::protobuf::Struct& data, const google::protobuf::Struct& filter) {
  for (const auto& [key, expected] : filter.fields()) {
    auto it = data.fields().find(key);
    if (it == data.fields().end()) return false;

    const Value& actual = it->second;
    if (IsOperatorSet(expected)) {
      if (!MatchesOperators(actual, expected.struct_value())) return false;
    } else if (!Equal(actual, expected)) {
      return false;
    }
  }
  return true;
}

} // namespace fleet::scheduling
