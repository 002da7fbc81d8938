#include "source_reader.hpp"

#include <algorithm>
#include <unordered_map>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json_file.hpp"
#include "internal/util/json_value.hpp"
#include "internal/util/text.hpp"

namespace resonance::loader {

using namespace resonance::graph::v1;
using google::protobuf::Struct;
using google::protobuf::Value;
using resonance::util::GetList;
using resonance::util::GetObject;
using resonance::util::GetString;
using resonance::util::GetStringList;
using resonance::util::NormalizeKey;

namespace {

std::string FirstNonEmpty(std::initializer_list<std::string> candidates) {
  for (const auto& candidate : candidates) {
    if (!candidate.empty()) {
      return candidate;
    }
  }
  return {};
}

// Elements of either a bare array document or the named array inside an object.
const google::protobuf::ListValue* CollectionOf(const Value& document, const char* key) {
  if (document.kind_case() == Value::kListValue) {
    return &document.list_value();
  }
  if (document.kind_case() == Value::kStructValue) {
    return GetList(document.struct_value(), key);
  }
  return nullptr;
}

std::string ToolIdentity(const ToolRecord& tool) {
  return NormalizeKey(FirstNonEmpty({tool.slug(), tool.id(), tool.title()}));
}

} // namespace

// ------------------------------------------------------------
// Record resolution
// ------------------------------------------------------------

std::optional<GateRecord> ResolveGate(const Struct& raw) {
  const auto id = GetString(raw, "id");
  if (id.empty()) {
    return std::nullopt;
  }

  GateRecord gate;
  gate.set_id(id);
  gate.set_title(FirstNonEmpty({GetString(raw, "title"), GetString(raw, "name"), id}));
  return gate;
}

std::optional<PainPointRecord> ResolvePainPoint(const std::string& gate_id, const Struct& raw) {
  const auto id = GetString(raw, "id");
  if (id.empty() || gate_id.empty()) {
    return std::nullopt;
  }

  PainPointRecord pain_point;
  pain_point.set_gate_id(gate_id);
  pain_point.set_id(id);
  pain_point.set_title(FirstNonEmpty({GetString(raw, "title"), id}));
  return pain_point;
}

std::optional<ToolRecord> ResolveTool(const Struct& raw, const std::string& source) {
  const auto title = GetString(raw, "title");
  const auto name  = GetString(raw, "name");

  const auto id = FirstNonEmpty({GetString(raw, "id"), GetString(raw, "slug"), NormalizeKey(FirstNonEmpty({title, name}))});
  if (id.empty()) {
    return std::nullopt;
  }

  ToolRecord tool;
  tool.set_id(id);
  tool.set_slug(FirstNonEmpty({GetString(raw, "slug"), id}));
  tool.set_title(FirstNonEmpty({title, name, id}));
  tool.set_description(FirstNonEmpty({GetString(raw, "description"), GetString(raw, "summary")}));
  for (auto& gate_id : GetStringList(raw, "gateIds")) tool.add_gate_ids(std::move(gate_id));
  for (auto& pain_point_id : GetStringList(raw, "painPointIds")) tool.add_pain_point_ids(std::move(pain_point_id));
  for (auto& keyword : GetStringList(raw, "keywords")) tool.add_keywords(std::move(keyword));
  tool.set_source(source);
  return tool;
}

std::optional<InsightRecord> ResolveInsight(const Struct& raw) {
  const auto slug  = GetString(raw, "slug");
  const auto title = GetString(raw, "title");
  if (slug.empty() && NormalizeKey(title).empty()) {
    return std::nullopt;
  }

  InsightRecord insight;
  insight.set_slug(slug);
  insight.set_title(FirstNonEmpty({title, slug}));
  return insight;
}

// ------------------------------------------------------------
// Tool merge
// ------------------------------------------------------------

void MergeTool(ToolRecord* dst, const ToolRecord& later) {
  // keep the more complete record:
  // earlier non-empty fields win, gaps are filled from the later record

  if (dst->id().empty())
    dst->set_id(later.id());

  if (dst->slug().empty())
    dst->set_slug(later.slug());

  if (dst->title().empty())
    dst->set_title(later.title());

  if (dst->description().empty())
    dst->set_description(later.description());

  if (dst->gate_ids().empty())
    *dst->mutable_gate_ids() = later.gate_ids();

  if (dst->pain_point_ids().empty())
    *dst->mutable_pain_point_ids() = later.pain_point_ids();

  if (dst->keywords().empty())
    *dst->mutable_keywords() = later.keywords();

  if (dst->source().empty())
    dst->set_source(later.source());
}

std::vector<ToolRecord> MergeTools(const std::vector<ToolRecord>& tools) {
  std::vector<ToolRecord>                 merged;
  std::unordered_map<std::string, size_t> index_by_key;

  for (const auto& tool : tools) {
    const auto key = ToolIdentity(tool);
    if (key.empty()) {
      continue;
    }

    auto it = index_by_key.find(key);
    if (it == index_by_key.end()) {
      index_by_key.emplace(key, merged.size());
      merged.push_back(tool);
    } else {
      MergeTool(&merged[it->second], tool);
    }
  }

  return merged;
}

// ------------------------------------------------------------
// Document shapes
// ------------------------------------------------------------

std::vector<GateRecord> ParseGates(const Value& document) {
  std::vector<GateRecord> out;
  const auto*             list = CollectionOf(document, "gates");
  if (!list) {
    return out;
  }

  for (const auto& element : list->values()) {
    if (element.kind_case() != Value::kStructValue) continue;
    if (auto gate = ResolveGate(element.struct_value())) out.push_back(std::move(*gate));
  }
  return out;
}

std::vector<PainPointRecord> ParsePainPoints(const Value& document) {
  std::vector<PainPointRecord> out;
  if (document.kind_case() != Value::kStructValue) {
    return out;
  }

  const auto* by_gate = GetObject(document.struct_value(), "painPoints");
  if (!by_gate) {
    return out;
  }

  // Struct keys carry no order; gates are emitted alphabetically.
  std::vector<std::string> gate_ids;
  for (const auto& entry : by_gate->fields()) gate_ids.push_back(entry.first);
  std::sort(gate_ids.begin(), gate_ids.end());

  for (const auto& gate_id : gate_ids) {
    const auto* list = GetList(*by_gate, gate_id);
    if (!list) continue;

    for (const auto& element : list->values()) {
      if (element.kind_case() != Value::kStructValue) continue;
      if (auto pain_point = ResolvePainPoint(gate_id, element.struct_value())) out.push_back(std::move(*pain_point));
    }
  }
  return out;
}

std::vector<ToolRecord> ParseTools(const Value& document, const std::string& source) {
  std::vector<ToolRecord> out;
  const auto*             list = CollectionOf(document, "tools");
  if (!list) {
    return out;
  }

  for (const auto& element : list->values()) {
    if (element.kind_case() != Value::kStructValue) continue;
    if (auto tool = ResolveTool(element.struct_value(), source)) out.push_back(std::move(*tool));
  }
  return out;
}

std::vector<InsightRecord> ParseInsights(const Value& document) {
  std::vector<InsightRecord> out;
  const auto*                list = CollectionOf(document, "insights");
  if (!list) {
    return out;
  }

  for (const auto& element : list->values()) {
    if (element.kind_case() != Value::kStructValue) continue;
    if (auto insight = ResolveInsight(element.struct_value())) out.push_back(std::move(*insight));
  }
  return out;
}

// ------------------------------------------------------------
// SourceReader
// ------------------------------------------------------------

SourceReader::SourceReader(resonance::runtime::config::SourcesConfig config) : config_(std::move(config)) {
}

std::optional<Value> SourceReader::ReadOptional(const std::string& path, const char* label) const {
  if (path.empty()) {
    return std::nullopt;
  }

  try {
    return resonance::util::ReadJsonValue(path);
  } catch (const resonance::util::IOError& e) {
    RESONANCE_LOG_WARN("Source unavailable, using empty collection", {observability::StringField("source", label),
                                                                      observability::StringField("path", path),
                                                                      observability::StringField("error", e.what())});
    return std::nullopt;
  }
}

ContentSources SourceReader::Read() const {
  ContentSources sources;
  sources.gates_source       = config_.gates();
  sources.pain_points_source = config_.pain_points();
  sources.insights_source    = config_.insights();

  if (auto document = ReadOptional(config_.gates(), "gates")) {
    sources.gates = ParseGates(*document);
  }
  if (auto document = ReadOptional(config_.pain_points(), "pain_points")) {
    sources.pain_points = ParsePainPoints(*document);
  }

  std::vector<ToolRecord> tools;
  if (auto document = ReadOptional(config_.tools_canonical(), "tools_canonical")) {
    tools = ParseTools(*document, config_.tools_canonical());
  }
  if (auto document = ReadOptional(config_.tools(), "tools")) {
    auto fallback = ParseTools(*document, config_.tools());
    tools.insert(tools.end(), fallback.begin(), fallback.end());
  }
  sources.tools = MergeTools(tools);

  if (auto document = ReadOptional(config_.insights(), "insights")) {
    sources.insights = ParseInsights(*document);
  }

  RESONANCE_LOG_INFO("Content sources loaded", {observability::IntField("gates", static_cast<int64_t>(sources.gates.size())),
                                                observability::IntField("pain_points", static_cast<int64_t>(sources.pain_points.size())),
                                                observability::IntField("tools", static_cast<int64_t>(sources.tools.size())),
                                                observability::IntField("insights", static_cast<int64_t>(sources.insights.size()))});
  return sources;
}

} // namespace resonance::loader
