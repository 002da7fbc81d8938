#include "json_value.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace resonance::util {

using google::protobuf::ListValue;
using google::protobuf::Struct;
using google::protobuf::Value;

const Value* FindField(const Struct& object, std::string_view key) {
  auto it = object.fields().find(std::string(key));
  if (it == object.fields().end()) {
    return nullptr;
  }
  return &it->second;
}

std::string GetString(const Struct& object, std::string_view key) {
  const auto* value = FindField(object, key);
  if (!value) {
    return {};
  }

  switch (value->kind_case()) {
    case Value::kStringValue:
      return value->string_value();
    case Value::kNumberValue: {
      const double number = value->number_value();
      if (std::isfinite(number) && number == std::floor(number) && std::fabs(number) < 1e15) {
        return std::to_string(static_cast<long long>(number));
      }
      std::ostringstream out;
      out << number;
      return out.str();
    }
    default:
      return {};
  }
}

std::optional<double> ParseNumber(std::string_view text) {
  const std::string copy(text);
  const char*       begin  = copy.c_str();
  char*             endptr = nullptr;
  const double      value  = std::strtod(begin, &endptr);
  if (endptr == begin) {
    return std::nullopt;
  }
  while (*endptr == ' ' || *endptr == '\t') {
    ++endptr;
  }
  if (*endptr != '\0' || !std::isfinite(value)) {
    return std::nullopt;
  }
  return value;
}

std::optional<uint64_t> ParseUnsigned(std::string_view text) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string_view::npos) {
    return std::nullopt;
  }
  uint64_t   value = 0;
  const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || end != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::optional<double> GetNumber(const Struct& object, std::string_view key) {
  const auto* value = FindField(object, key);
  if (!value) {
    return std::nullopt;
  }

  switch (value->kind_case()) {
    case Value::kNumberValue:
      return value->number_value();
    case Value::kStringValue:
      return ParseNumber(value->string_value());
    default:
      return std::nullopt;
  }
}

const ListValue* GetList(const Struct& object, std::string_view key) {
  const auto* value = FindField(object, key);
  if (!value || value->kind_case() != Value::kListValue) {
    return nullptr;
  }
  return &value->list_value();
}

const Struct* GetObject(const Struct& object, std::string_view key) {
  const auto* value = FindField(object, key);
  if (!value || value->kind_case() != Value::kStructValue) {
    return nullptr;
  }
  return &value->struct_value();
}

std::vector<std::string> GetStringList(const Struct& object, std::string_view key) {
  std::vector<std::string> out;
  const auto*              list = GetList(object, key);
  if (!list) {
    return out;
  }

  for (const auto& element : list->values()) {
    if (element.kind_case() == Value::kStringValue && !element.string_value().empty()) {
      out.push_back(element.string_value());
    }
  }
  return out;
}

} // namespace resonance::util
