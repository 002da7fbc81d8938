#pragma once

#include <optional>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "config/config.pb.h"
#include "resonance/graph/v1/source.pb.h"

namespace resonance::loader {

/*
  Raw content collections, resolved into typed records.
*/
struct ContentSources {
  std::vector<resonance::graph::v1::GateRecord>      gates;
  std::vector<resonance::graph::v1::PainPointRecord> pain_points;
  std::vector<resonance::graph::v1::ToolRecord>      tools;
  std::vector<resonance::graph::v1::InsightRecord>   insights;

  std::string gates_source;
  std::string pain_points_source;
  std::string insights_source;
};

// ------------------------------------------------------------
// Per-record resolution. nullopt means the record has no usable id.
// ------------------------------------------------------------

std::optional<resonance::graph::v1::GateRecord> ResolveGate(const google::protobuf::Struct& raw);

std::optional<resonance::graph::v1::PainPointRecord> ResolvePainPoint(const std::string&              gate_id,
                                                                      const google::protobuf::Struct& raw);

// id <- id | slug | normalized(title | name)
// slug <- slug | id, title <- title | name | id, description <- description | summary
std::optional<resonance::graph::v1::ToolRecord> ResolveTool(const google::protobuf::Struct& raw,
                                                            const std::string&              source);

std::optional<resonance::graph::v1::InsightRecord> ResolveInsight(const google::protobuf::Struct& raw);

// Fills empty fields of `dst` from `later`; non-empty fields of `dst` are kept.
void MergeTool(resonance::graph::v1::ToolRecord* dst, const resonance::graph::v1::ToolRecord& later);

// Collapses duplicate identities (normalized slug, then id, then title),
// preserving first-appearance order.
std::vector<resonance::graph::v1::ToolRecord> MergeTools(const std::vector<resonance::graph::v1::ToolRecord>& tools);

// ------------------------------------------------------------
// Document shapes
// ------------------------------------------------------------

std::vector<resonance::graph::v1::GateRecord>      ParseGates(const google::protobuf::Value& document);
std::vector<resonance::graph::v1::PainPointRecord> ParsePainPoints(const google::protobuf::Value& document);
std::vector<resonance::graph::v1::ToolRecord>      ParseTools(const google::protobuf::Value& document,
                                                              const std::string&             source);
std::vector<resonance::graph::v1::InsightRecord>   ParseInsights(const google::protobuf::Value& document);

/*
  Reads every configured source. A missing or malformed file is logged and
  treated as an empty collection.
*/
class SourceReader {
 public:
  explicit SourceReader(resonance::runtime::config::SourcesConfig config);

  ContentSources Read() const;

 private:
  std::optional<google::protobuf::Value> ReadOptional(const std::string& path, const char* label) const;

  resonance::runtime::config::SourcesConfig config_;
};

} // namespace resonance::loader
