#include "event_sink.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/json_file.hpp"

namespace resonance::observability {

JsonlFileSink::JsonlFileSink(std::filesystem::path path) : path_(std::move(path)) {
  if (path_.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path_.parent_path(), ec);
  }

  out_.open(path_, std::ios::out | std::ios::app);
  if (!out_) {
    throw util::IOError("cannot open event log " + path_.string());
  }
}

void JsonlFileSink::Emit(const resonance::graph::v1::HeartbeatRecord& record) {
  out_ << util::ToJson(record, /*pretty=*/false) << '\n';
  out_.flush();
  if (!out_) {
    throw util::IOError("failed appending to event log " + path_.string());
  }
}

void JsonlFileSink::Flush() {
  out_.flush();
}

} // namespace resonance::observability
