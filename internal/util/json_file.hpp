#pragma once

#include <filesystem>
#include <string>

#include <google/protobuf/message.h>
#include <google/protobuf/struct.pb.h>

namespace resonance::util {

/*
  JSON persistence helpers on top of google::protobuf::util.

  Reads throw IOError when the file is missing, unreadable or not JSON.
  Writes are atomic: tmp → flush → rename, so a crash never leaves a
  partially written file visible under the final name.
*/

std::string ReadFile(const std::filesystem::path& path);

google::protobuf::Value ReadJsonValue(const std::filesystem::path& path);
google::protobuf::Value ParseJsonValue(const std::string& json);

// Throws ValidationError when the text does not match the message schema.
void ParseJsonMessage(const std::string& json, google::protobuf::Message* message, bool ignore_unknown_fields = true);

void ReadJsonMessage(const std::filesystem::path& path, google::protobuf::Message* message,
                     bool ignore_unknown_fields = true);

std::string ToJson(const google::protobuf::Message& message, bool pretty = true);

void WriteFileAtomic(const std::filesystem::path& path, const std::string& contents);
void WriteJsonAtomic(const std::filesystem::path& path, const google::protobuf::Message& message);

} // namespace resonance::util
