#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <google/protobuf/struct.pb.h>

namespace resonance::util {

/*
  Typed accessors over google::protobuf::Struct for loosely shaped input
  documents. Absent keys, nulls and wrong kinds read as "not set".
*/

const google::protobuf::Value* FindField(const google::protobuf::Struct& object, std::string_view key);

// Strings as-is; integral numbers printed without a fraction.
std::string GetString(const google::protobuf::Struct& object, std::string_view key);

// Numbers or numeric strings.
std::optional<double> GetNumber(const google::protobuf::Struct& object, std::string_view key);

// Non-empty string elements of a list field.
std::vector<std::string> GetStringList(const google::protobuf::Struct& object, std::string_view key);

const google::protobuf::ListValue* GetList(const google::protobuf::Struct& object, std::string_view key);
const google::protobuf::Struct*    GetObject(const google::protobuf::Struct& object, std::string_view key);

std::optional<double> ParseNumber(std::string_view text);

// Plain decimal digits only; nullopt when empty, signed or beyond uint64_t.
std::optional<uint64_t> ParseUnsigned(std::string_view text);

} // namespace resonance::util
