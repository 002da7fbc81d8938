#include "json_file.hpp"

#include <google/protobuf/util/json_util.h>

#include <fstream>
#include <sstream>

#include "internal/util/errors.hpp"

namespace resonance::util {

std::string ReadFile(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw IOError("file not found: " + path.string());
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw IOError("cannot open file: " + path.string());
  }

  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    throw IOError("failed reading file: " + path.string());
  }
  return buffer.str();
}

google::protobuf::Value ParseJsonValue(const std::string& json) {
  google::protobuf::Value value;
  auto                    status = google::protobuf::util::JsonStringToMessage(json, &value);
  if (!status.ok()) {
    throw IOError("malformed JSON: " + std::string(status.message()));
  }
  return value;
}

google::protobuf::Value ReadJsonValue(const std::filesystem::path& path) {
  const auto contents = ReadFile(path);
  try {
    return ParseJsonValue(contents);
  } catch (const IOError& e) {
    throw IOError(path.string() + ": " + e.what());
  }
}

void ParseJsonMessage(const std::string& json, google::protobuf::Message* message, bool ignore_unknown_fields) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = ignore_unknown_fields;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw ValidationError("invalid " + message->GetTypeName() + ": " + std::string(status.message()));
  }
}

void ReadJsonMessage(const std::filesystem::path& path, google::protobuf::Message* message,
                     bool ignore_unknown_fields) {
  const auto contents = ReadFile(path);
  try {
    ParseJsonMessage(contents, message, ignore_unknown_fields);
  } catch (const ValidationError& e) {
    throw IOError(path.string() + ": " + e.what());
  }
}

std::string ToJson(const google::protobuf::Message& message, bool pretty) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = pretty;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to serialize " + message.GetTypeName() + ": " + std::string(status.message()));
  }
  return json;
}

/*
  Atomic write:
      write tmp → flush → rename
*/
void WriteFileAtomic(const std::filesystem::path& path, const std::string& contents) {
  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      throw IOError("cannot create directory " + path.parent_path().string() + ": " + ec.message());
    }
  }

  const auto tmp_path = std::filesystem::path(path.string() + ".tmp");

  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw IOError("cannot open " + tmp_path.string() + " for writing");
    }
    out << contents;
    out.flush();
    if (!out) {
      throw IOError("failed writing " + tmp_path.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    std::filesystem::remove(tmp_path, ec);
    throw IOError("cannot replace " + path.string());
  }
}

void WriteJsonAtomic(const std::filesystem::path& path, const google::protobuf::Message& message) {
  WriteFileAtomic(path, ToJson(message) + "\n");
}

} // namespace resonance::util
