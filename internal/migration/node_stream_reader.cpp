#include "node_stream_reader.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace resonance::migration {

using Json = NodeStreamReader::Json;

namespace {

constexpr int kEof = std::char_traits<char>::eof();

bool IsWhitespace(int c) {
  return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

// Steps over one value without building it; remembers a bare number, whose
// terminating character the lexer has already taken off the stream.
class ValueSkipper : public nlohmann::json_sax<Json> {
 public:
  bool null() override {
    return Scalar(false);
  }
  bool boolean(bool) override {
    return Scalar(false);
  }
  bool number_integer(number_integer_t) override {
    return Scalar(true);
  }
  bool number_unsigned(number_unsigned_t) override {
    return Scalar(true);
  }
  bool number_float(number_float_t, const string_t&) override {
    return Scalar(true);
  }
  bool string(string_t&) override {
    return Scalar(false);
  }
  bool binary(binary_t&) override {
    return Scalar(false);
  }
  bool start_object(std::size_t) override {
    ++depth_;
    return true;
  }
  bool key(string_t&) override {
    return true;
  }
  bool end_object() override {
    --depth_;
    return true;
  }
  bool start_array(std::size_t) override {
    ++depth_;
    return true;
  }
  bool end_array() override {
    --depth_;
    return true;
  }
  bool parse_error(std::size_t position, const std::string&, const Json::exception& ex) override {
    error_position = position;
    error          = ex.what();
    return false;
  }

  bool        bare_number{false};
  std::size_t error_position{0};
  std::string error;

 private:
  bool Scalar(bool number) {
    if (depth_ == 0) bare_number = number;
    return true;
  }

  int depth_{0};
};

} // namespace

NodeStreamReader::NodeStreamReader(std::filesystem::path path, size_t chunk_bytes)
    : path_(std::move(path)), buffer_(std::max<size_t>(chunk_bytes, 64)) {
}

void NodeStreamReader::Corrupt(const std::string& what, uint64_t offset) const {
  throw util::CorruptionDetected(path_.string() + ": " + what + " at byte " + std::to_string(offset));
}

// ------------------------------------------------------------
// Input
// ------------------------------------------------------------

int NodeStreamReader::Peek() {
  return in_.rdbuf()->sgetc();
}

int NodeStreamReader::Get() {
  return in_.rdbuf()->sbumpc();
}

void NodeStreamReader::SkipWhitespace() {
  while (IsWhitespace(Peek())) {
    Get();
  }
}

uint64_t NodeStreamReader::Offset() {
  const auto pos = in_.rdbuf()->pubseekoff(0, std::ios::cur, std::ios::in);
  return pos == std::streampos(-1) ? 0 : static_cast<uint64_t>(static_cast<std::streamoff>(pos));
}

// ------------------------------------------------------------
// Structure
// ------------------------------------------------------------

void NodeStreamReader::Open() {
  if (opened_) {
    return;
  }

  std::error_code ec;
  if (!std::filesystem::is_regular_file(path_, ec)) {
    throw util::IOError("migration input not found: " + path_.string());
  }

  in_.rdbuf()->pubsetbuf(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
  in_.open(path_, std::ios::binary);
  if (!in_) {
    throw util::IOError("cannot open migration input: " + path_.string());
  }

  opened_ = true;
  LocateArray();
}

void NodeStreamReader::LocateArray() {
  SkipWhitespace();
  const int first = Get();

  if (first == '[') {
    return;
  }
  if (first == kEof) {
    Corrupt("empty document", Offset());
  }
  if (first != '{') {
    Corrupt("expected a node array or an object with \"nodes\"", Offset());
  }

  while (true) {
    SkipWhitespace();
    if (Peek() == '}') {
      Corrupt("document has no \"nodes\" array", Offset());
    }
    if (Peek() != '"') {
      Corrupt("expected object key", Offset());
    }

    Json key;
    ReadValue(&key);

    SkipWhitespace();
    if (Get() != ':') {
      Corrupt("expected ':' after key", Offset());
    }
    SkipWhitespace();

    if (key.get<std::string>() == "nodes") {
      if (Get() != '[') {
        Corrupt("\"nodes\" is not an array", Offset());
      }
      return;
    }

    ReadValue(nullptr);

    SkipWhitespace();
    const int separator = Get();
    if (separator == '}') {
      Corrupt("document has no \"nodes\" array", Offset());
    }
    if (separator != ',') {
      Corrupt("expected ',' between object members", Offset());
    }
  }
}

// Reads exactly one value off the stream; `out` null discards it.
void NodeStreamReader::ReadValue(Json* out) {
  const uint64_t start       = Offset();
  bool           bare_number = false;

  if (out) {
    try {
      in_ >> *out;
    } catch (const Json::parse_error& e) {
      Corrupt(std::string("malformed value: ") + e.what(), start + e.byte);
    }
    bare_number = out->is_number();
  } else {
    ValueSkipper skipper;
    if (!Json::sax_parse(in_, &skipper, Json::input_format_t::json, /*strict=*/false)) {
      Corrupt("malformed value: " + skipper.error, start + skipper.error_position);
    }
    bare_number = skipper.bare_number;
  }

  // a number ends on the character after it; hand that character back
  if (bare_number && !in_.eof()) {
    in_.rdbuf()->sungetc();
  }
  in_.clear();
}

bool NodeStreamReader::AdvanceElement(Json* out) {
  if (!opened_) {
    Open();
  }
  if (finished_) {
    return false;
  }

  SkipWhitespace();
  if (elements_read_ == 0 && Peek() == ']') {
    Get();
    finished_ = true;
    return false;
  }
  if (Peek() == kEof) {
    Corrupt("truncated node array", Offset());
  }

  ReadValue(out);
  ++elements_read_;

  SkipWhitespace();
  const int separator = Get();
  if (separator == ']') {
    finished_ = true;
  } else if (separator == kEof) {
    Corrupt("truncated node array", Offset());
  } else if (separator != ',') {
    Corrupt("expected ',' or ']' after element", Offset());
  }
  return true;
}

std::optional<std::string> NodeStreamReader::Next() {
  Json element;
  if (!AdvanceElement(&element)) {
    return std::nullopt;
  }
  return element.dump();
}

bool NodeStreamReader::Skip() {
  return AdvanceElement(nullptr);
}

uint64_t NodeStreamReader::CountNodes(const std::filesystem::path& path, size_t chunk_bytes) {
  NodeStreamReader reader(path, chunk_bytes);
  reader.Open();

  uint64_t count = 0;
  while (reader.Skip()) {
    ++count;
  }
  return count;
}

} // namespace resonance::migration
