#include "internal/migration/node_stream_reader.hpp"

#include <cassert>
#include <iostream>
#include <sstream>
#include <string>

#include "internal/util/errors.hpp"
#include "support/temp_dir.hpp"

namespace {

using resonance::migration::NodeStreamReader;
using resonance::testing::FreshDir;
using resonance::testing::WriteText;

bool ThrowsCorruption(const std::string& test_name, const std::string& content) {
  const auto path = WriteText(FreshDir("node_stream_reader", test_name) / "registry.json", content);
  try {
    (void)NodeStreamReader::CountNodes(path, 64);
  } catch (const resonance::util::CorruptionDetected&) {
    return true;
  }
  return false;
}

void TestBareArray() {
  const auto path = WriteText(FreshDir("node_stream_reader", "bare_array") / "registry.json",
                              R"([ {"id": "a"}, {"id": "b", "tags": ["x", "y"]} ,{"id":"c"} ])");

  NodeStreamReader reader(path, 64);
  // elements come back compact, members in document order
  auto first = reader.Next();
  assert(first && *first == R"({"id":"a"})");
  auto second = reader.Next();
  assert(second && *second == R"({"id":"b","tags":["x","y"]})");
  auto third = reader.Next();
  assert(third && *third == R"({"id":"c"})");
  assert(!reader.Next());
  assert(reader.elements_read() == 3);
}

void TestRegistryObjectWithLeadingMembers() {
  const auto path = WriteText(FreshDir("node_stream_reader", "object") / "registry.json",
                              R"({"version": "1.0", "meta": {"note": "braces } ] inside strings"}, "list": [1, [2]],
                                  "nodes": [{"id": "grief", "title": "say \"hi\" ]"}], "generated": "x"})");

  NodeStreamReader reader(path, 64);
  auto             node = reader.Next();
  assert(node && *node == R"({"id":"grief","title":"say \"hi\" ]"})");
  assert(!reader.Next());
}

void TestNumbersBeforeSeparators() {
  const auto path = WriteText(FreshDir("node_stream_reader", "numbers") / "registry.json",
                              R"({"version": 2, "ratio": -0.5e3,"total":7,
                                  "nodes": [{"id": "z", "resonanceScore": 1.25, "zeta": 1, "alpha": 2}]})");

  NodeStreamReader reader(path, 64);
  auto             node = reader.Next();
  assert(node && *node == R"({"id":"z","resonanceScore":1.25,"zeta":1,"alpha":2})");
  assert(!reader.Next());
}

void TestEmptyArray() {
  const auto path = WriteText(FreshDir("node_stream_reader", "empty") / "registry.json", R"({"nodes": []})");
  assert(NodeStreamReader::CountNodes(path, 64) == 0);
}

void TestNonObjectElementsAreReturnedAsJson() {
  const auto path = WriteText(FreshDir("node_stream_reader", "scalars") / "registry.json", R"([1,"two",null, {},2.5])");

  NodeStreamReader reader(path, 64);
  assert(*reader.Next() == "1");
  assert(*reader.Next() == "\"two\"");
  assert(*reader.Next() == "null");
  assert(*reader.Next() == "{}");
  assert(*reader.Next() == "2.5");
  assert(!reader.Next());
}

void TestSmallChunksAcrossLargeDocument() {
  std::ostringstream doc;
  doc << "{\"nodes\": [";
  for (int i = 0; i < 1640; ++i) {
    if (i) doc << ",\n";
    doc << "{\"id\": \"node-" << i << "\", \"title\": \"Node " << i << "\", \"tags\": [\"a\", \"b\"]}";
  }
  doc << "]}";

  const auto path = WriteText(FreshDir("node_stream_reader", "large") / "registry.json", doc.str());
  assert(NodeStreamReader::CountNodes(path, 1) == 1640);
  assert(NodeStreamReader::CountNodes(path, 4096) == 1640);

  NodeStreamReader reader(path, 7);
  for (int i = 0; i < 1000; ++i) assert(reader.Skip());
  auto node = reader.Next();
  assert(node && node->find("\"node-1000\"") != std::string::npos);
}

void TestStructuralCorruption() {
  assert(ThrowsCorruption("empty_document", ""));
  assert(ThrowsCorruption("no_nodes", R"({"version": "1.0"})"));
  assert(ThrowsCorruption("nodes_not_array", R"({"nodes": {"id": "a"}})"));
  assert(ThrowsCorruption("truncated", R"({"nodes": [{"id": "a"}, {"id": )"));
  assert(ThrowsCorruption("truncated_after_element", R"([{"id": "a"})"));
  assert(ThrowsCorruption("mismatched", R"([{"id": "a"]])"));
  assert(ThrowsCorruption("missing_separator", R"([{"id": "a"} {"id": "b"}])"));
  assert(ThrowsCorruption("unterminated_string", R"([{"id": "a)"));
  assert(ThrowsCorruption("scalar_document", "42"));
  assert(ThrowsCorruption("malformed_element", R"([{"id": tru}])"));
  assert(ThrowsCorruption("malformed_member", R"({"version": [1, 2, "nodes": []})"));
  assert(ThrowsCorruption("number_then_garbage", R"([1 2])"));
}

void TestMissingFileIsIOError() {
  NodeStreamReader reader(FreshDir("node_stream_reader", "missing") / "nope.json", 64);
  bool             threw = false;
  try {
    reader.Open();
  } catch (const resonance::util::IOError&) {
    threw = true;
  }
  assert(threw);
}

void TestCorruptionReportsByteOffset() {
  const auto path = WriteText(FreshDir("node_stream_reader", "offset") / "registry.json", R"([{"id": "a"} x])");
  try {
    (void)NodeStreamReader::CountNodes(path, 64);
    assert(false && "expected corruption");
  } catch (const resonance::util::CorruptionDetected& e) {
    assert(std::string(e.what()).find("at byte 14") != std::string::npos);
  }
}

} // namespace

int main() {
  TestBareArray();
  TestRegistryObjectWithLeadingMembers();
  TestNumbersBeforeSeparators();
  TestEmptyArray();
  TestNonObjectElementsAreReturnedAsJson();
  TestSmallChunksAcrossLargeDocument();
  TestStructuralCorruption();
  TestMissingFileIsIOError();
  TestCorruptionReportsByteOffset();

  std::cout << "resonance_unit_node_stream_reader: pass\n";
  return 0;
}
