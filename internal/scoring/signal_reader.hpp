#pragma once

#include <optional>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "config/config.pb.h"
#include "resonance/graph/v1/signal.pb.h"

namespace resonance::scoring {

/*
  Reads aggregate usage signals from up to three sources:

    signals        JSON array (or {"signals": [...]})
    signals_jsonl  one signal object per line; bad lines are skipped
    ga4_aggregate  JSON array of GA4 rows keyed by path

  Every source is optional; an unreadable one contributes nothing.
*/

// nodeId | node_id, path, impressions, clicks, ctr, dwellSeconds,
// traversalDepth | navigationDepth, returnVisits, timestamp, source.
// Numbers may be given as numeric strings.
resonance::graph::v1::Signal ResolveSignal(const google::protobuf::Struct& raw, const std::string& default_source);

// Rows without a path yield nullopt.
std::optional<resonance::graph::v1::Signal> ResolveGa4Row(const google::protobuf::Struct& raw);

std::vector<resonance::graph::v1::Signal> ParseSignalArray(const google::protobuf::Value& document,
                                                           const std::string&             source);

// Returns the parsed signals; *skipped (when given) receives the count of bad lines.
std::vector<resonance::graph::v1::Signal> ParseSignalLines(const std::string& text, const std::string& source,
                                                           size_t* skipped = nullptr);

std::vector<resonance::graph::v1::Signal> ParseGa4Aggregate(const google::protobuf::Value& document);

class SignalReader {
 public:
  explicit SignalReader(resonance::runtime::config::SourcesConfig config);

  std::vector<resonance::graph::v1::Signal> Read() const;

 private:
  resonance::runtime::config::SourcesConfig config_;
};

} // namespace resonance::scoring
