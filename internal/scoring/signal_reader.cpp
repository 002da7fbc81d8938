#include "signal_reader.hpp"

#include <sstream>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json_file.hpp"
#include "internal/util/json_value.hpp"
#include "internal/util/time.hpp"

namespace resonance::scoring {

using namespace resonance::graph::v1;
using google::protobuf::Struct;
using google::protobuf::Value;
using resonance::util::GetNumber;
using resonance::util::GetString;

namespace {

constexpr const char* kGa4Source = "ga4-aggregate";

void SetTimestamp(const Struct& raw, Signal* signal) {
  const auto text = GetString(raw, "timestamp");
  if (auto parsed = util::ParseIso8601(text)) {
    *signal->mutable_timestamp() = util::ToProto(*parsed);
  }
}

std::optional<double> FirstNumber(const Struct& raw, std::initializer_list<const char*> keys) {
  for (const char* key : keys) {
    if (auto value = GetNumber(raw, key)) {
      return value;
    }
  }
  return std::nullopt;
}

} // namespace

Signal ResolveSignal(const Struct& raw, const std::string& default_source) {
  Signal signal;

  signal.set_node_id(GetString(raw, "nodeId"));
  if (signal.node_id().empty()) signal.set_node_id(GetString(raw, "node_id"));
  signal.set_path(GetString(raw, "path"));

  signal.set_impressions(GetNumber(raw, "impressions").value_or(0.0));
  signal.set_clicks(GetNumber(raw, "clicks").value_or(0.0));
  if (auto ctr = GetNumber(raw, "ctr")) signal.set_ctr(*ctr);
  signal.set_dwell_seconds(FirstNumber(raw, {"dwellSeconds", "dwell_seconds"}).value_or(0.0));
  signal.set_traversal_depth(FirstNumber(raw, {"traversalDepth", "navigationDepth"}).value_or(0.0));
  signal.set_return_visits(GetNumber(raw, "returnVisits").value_or(0.0));

  const auto source = GetString(raw, "source");
  signal.set_source(source.empty() ? default_source : source);

  SetTimestamp(raw, &signal);
  return signal;
}

std::optional<Signal> ResolveGa4Row(const Struct& raw) {
  const auto path = GetString(raw, "path");
  if (path.empty()) {
    return std::nullopt;
  }

  Signal signal;
  signal.set_source(kGa4Source);
  signal.set_path(path);
  signal.set_impressions(GetNumber(raw, "impressions").value_or(0.0));
  signal.set_clicks(GetNumber(raw, "clicks").value_or(0.0));
  if (auto ctr = GetNumber(raw, "ctr")) signal.set_ctr(*ctr);
  signal.set_dwell_seconds(FirstNumber(raw, {"avgEngagementTime", "dwellSeconds"}).value_or(0.0));
  SetTimestamp(raw, &signal);
  return signal;
}

std::vector<Signal> ParseSignalArray(const Value& document, const std::string& source) {
  std::vector<Signal> out;

  const google::protobuf::ListValue* list = nullptr;
  if (document.kind_case() == Value::kListValue) {
    list = &document.list_value();
  } else if (document.kind_case() == Value::kStructValue) {
    list = util::GetList(document.struct_value(), "signals");
  }
  if (!list) {
    return out;
  }

  for (const auto& element : list->values()) {
    if (element.kind_case() != Value::kStructValue) continue;
    out.push_back(ResolveSignal(element.struct_value(), source));
  }
  return out;
}

std::vector<Signal> ParseSignalLines(const std::string& text, const std::string& source, size_t* skipped) {
  std::vector<Signal> out;
  size_t              bad = 0;

  std::istringstream in(text);
  std::string        line;
  size_t             line_number = 0;
  while (std::getline(in, line)) {
    ++line_number;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.find_first_not_of(" \t") == std::string::npos) continue;

    try {
      const auto value = util::ParseJsonValue(line);
      if (value.kind_case() != Value::kStructValue) {
        throw util::IOError("not a JSON object");
      }
      out.push_back(ResolveSignal(value.struct_value(), source));
    } catch (const util::IOError& e) {
      ++bad;
      RESONANCE_LOG_WARN("Skipping invalid signal line", {observability::StringField("source", source),
                                                          observability::IntField("line", static_cast<int64_t>(line_number)),
                                                          observability::StringField("error", e.what())});
    }
  }

  if (skipped) *skipped = bad;
  return out;
}

std::vector<Signal> ParseGa4Aggregate(const Value& document) {
  std::vector<Signal> out;
  if (document.kind_case() != Value::kListValue) {
    return out;
  }

  for (const auto& row : document.list_value().values()) {
    if (row.kind_case() != Value::kStructValue) continue;
    if (auto signal = ResolveGa4Row(row.struct_value())) out.push_back(std::move(*signal));
  }
  return out;
}

// ------------------------------------------------------------
// SignalReader
// ------------------------------------------------------------

SignalReader::SignalReader(resonance::runtime::config::SourcesConfig config) : config_(std::move(config)) {
}

std::vector<Signal> SignalReader::Read() const {
  std::vector<Signal> signals;

  auto warn = [](const std::string& path, const std::exception& e) {
    RESONANCE_LOG_WARN("Signal source unavailable", {observability::StringField("path", path),
                                                     observability::StringField("error", e.what())});
  };

  if (!config_.signals().empty()) {
    try {
      auto parsed = ParseSignalArray(util::ReadJsonValue(config_.signals()), "signals");
      signals.insert(signals.end(), parsed.begin(), parsed.end());
    } catch (const util::IOError& e) {
      warn(config_.signals(), e);
    }
  }

  if (!config_.signals_jsonl().empty()) {
    try {
      auto parsed = ParseSignalLines(util::ReadFile(config_.signals_jsonl()), "signals-jsonl");
      signals.insert(signals.end(), parsed.begin(), parsed.end());
    } catch (const util::IOError& e) {
      warn(config_.signals_jsonl(), e);
    }
  }

  if (!config_.ga4_aggregate().empty()) {
    try {
      auto parsed = ParseGa4Aggregate(util::ReadJsonValue(config_.ga4_aggregate()));
      signals.insert(signals.end(), parsed.begin(), parsed.end());
    } catch (const util::IOError& e) {
      warn(config_.ga4_aggregate(), e);
    }
  }

  RESONANCE_LOG_INFO("Signals loaded", {observability::IntField("signals", static_cast<int64_t>(signals.size()))});
  return signals;
}

} // namespace resonance::scoring
