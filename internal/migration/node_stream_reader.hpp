#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace resonance::migration {

/*
  Streams the elements of a node array out of a JSON document without
  materializing the document.

  Accepted shapes:
    [ {...}, {...} ]
    { "version": ..., "nodes": [ {...}, {...} ] }

  The file is read through a buffer of `chunk_bytes`. nlohmann/json parses
  one value at a time off the stream: elements that are kept become a DOM
  and are returned as compact JSON text, skipped elements and unrelated
  members only feed a discarding SAX handler. Structural damage
  (truncation, malformed values, missing separators, no node array) raises
  CorruptionDetected; an unreadable file raises IOError.
*/
class NodeStreamReader {
 public:
  using Json = nlohmann::ordered_json;

  NodeStreamReader(std::filesystem::path path, size_t chunk_bytes);

  // Positions the reader on the first element.
  void Open();

  // Text of the next element; nullopt once the array is exhausted.
  std::optional<std::string> Next();

  // Advances past the next element without building it.
  bool Skip();

  uint64_t elements_read() const {
    return elements_read_;
  }

  // Counting pass over the whole document with a private reader.
  static uint64_t CountNodes(const std::filesystem::path& path, size_t chunk_bytes);

 private:
  int      Peek();
  int      Get();
  void     SkipWhitespace();
  uint64_t Offset();

  void LocateArray();
  bool AdvanceElement(Json* out);
  void ReadValue(Json* out);

  [[noreturn]] void Corrupt(const std::string& what, uint64_t offset) const;

  std::filesystem::path path_;
  std::vector<char>     buffer_;
  std::ifstream         in_;
  uint64_t              elements_read_{0};
  bool                  opened_{false};
  bool                  finished_{false};
};

} // namespace resonance::migration
