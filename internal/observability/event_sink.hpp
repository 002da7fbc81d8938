#pragma once

#include <filesystem>
#include <fstream>
#include <vector>

#include "resonance/graph/v1/migration.pb.h"

namespace resonance::observability {

/*
  Destination for migration progress events (heartbeat, skip, checkpoint,
  abort, complete). Core logic only talks to this interface.
*/
class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual void Emit(const resonance::graph::v1::HeartbeatRecord& record) = 0;
  virtual void Flush() {
  }
};

/*
  Append-only JSON Lines log. Each record is flushed as it is written so a
  crash loses at most the line in flight.
*/
class JsonlFileSink : public EventSink {
 public:
  explicit JsonlFileSink(std::filesystem::path path);

  void Emit(const resonance::graph::v1::HeartbeatRecord& record) override;
  void Flush() override;

  const std::filesystem::path& path() const {
    return path_;
  }

 private:
  std::filesystem::path path_;
  std::ofstream         out_;
};

class NullEventSink : public EventSink {
 public:
  void Emit(const resonance::graph::v1::HeartbeatRecord&) override {
  }
};

// Keeps every record in memory.
class RecordingEventSink : public EventSink {
 public:
  void Emit(const resonance::graph::v1::HeartbeatRecord& record) override {
    records_.push_back(record);
  }

  const std::vector<resonance::graph::v1::HeartbeatRecord>& records() const {
    return records_;
  }

 private:
  std::vector<resonance::graph::v1::HeartbeatRecord> records_;
};

} // namespace resonance::observability
