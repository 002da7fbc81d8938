#include "internal/migration/node_transform.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/migration/state_machine.hpp"
#include "internal/util/errors.hpp"

namespace {

using resonance::migration::MigrationState;
using resonance::migration::NodeTransformer;

NodeTransformer MakeTransformer() {
  return NodeTransformer({"fathers-sons", "the-griever"}, 0.5, 0.05);
}

bool Rejects(const NodeTransformer& transformer, const std::string& text) {
  try {
    auto node = transformer.Parse(text);
    transformer.Validate(node);
  } catch (const resonance::util::ValidationError&) {
    return true;
  }
  return false;
}

void TestRiskWeight() {
  assert(resonance::migration::RiskWeight(0.5, 0.05) == 0.48);
  assert(resonance::migration::RiskWeight(2.0, 0.0) == 1.0);
  assert(resonance::migration::RiskWeight(0.8, 1.5) == 0.0);
}

void TestTransformWithDefaults() {
  auto transformer = MakeTransformer();
  auto node        = transformer.Parse(R"({"id": "grief::sleepless", "path": "/gates/grief/sleepless",
                                      "type": "pain-point", "unknownField": 1})");
  transformer.Validate(node);

  auto out = transformer.Transform(node);
  assert(out.id() == "grief::sleepless");
  assert(out.has_parent_id() && out.parent_id() == "pain");
  assert(out.risk_weight() == 0.48);
  assert(out.resonance_score() == 0.5);
  assert(out.decay_score() == 0.05);
  assert(out.link_weight() == 1.0);
  assert(out.slug() == "gates/grief/sleepless");
  assert(out.title() == "grief::sleepless");
  assert(!out.is_gold_standard());
}

void TestClusterWinsAsParent() {
  auto transformer = MakeTransformer();
  auto node        = transformer.Parse(
      R"({"id": "tool::journal", "cluster": "grief", "resonanceScore": 1.2, "decayScore": 0.3, "linkWeight": 0.9})");

  auto out = transformer.Transform(node);
  assert(out.parent_id() == "grief");
  assert(out.risk_weight() == 0.84);
  assert(out.link_weight() == 0.9);
}

void TestExplicitZeroScoresAreKept() {
  auto transformer = MakeTransformer();
  auto node        = transformer.Parse(R"({"id": "plain", "resonanceScore": 0, "decayScore": 0})");

  auto out = transformer.Transform(node);
  assert(!out.has_parent_id());
  assert(out.resonance_score() == 0.0);
  assert(out.risk_weight() == 0.0);
}

void TestGoldStandardAnchors() {
  auto transformer = MakeTransformer();
  assert(transformer.IsGoldStandard(transformer.Parse(R"({"id": "fathers-sons"})")));
  assert(transformer.IsGoldStandard(transformer.Parse(R"({"id": "x", "cluster": "the-griever"})")));
  assert(!transformer.IsGoldStandard(transformer.Parse(R"({"id": "x", "cluster": "the-griever-2"})")));
}

void TestValidationFailures() {
  auto transformer = MakeTransformer();
  assert(Rejects(transformer, R"({"title": "no id"})"));
  assert(Rejects(transformer, R"({"id": "a", "connectsTo": ["b", "a"]})"));
  assert(Rejects(transformer, R"({"id": "a", "outboundLinks": ["a"]})"));
  assert(Rejects(transformer, R"({"id": "a", "inboundLinks": ["a"]})"));
  assert(Rejects(transformer, R"("just a string")"));
  assert(Rejects(transformer, R"({"id": 5, "tags": "not-a-list"})"));
  assert(!Rejects(transformer, R"({"id": "a", "connectsTo": ["b"]})"));
}

void TestStateMachineTransitions() {
  static_assert(resonance::migration::CanTransition(MigrationState::kIdle, MigrationState::kLoading));
  static_assert(resonance::migration::CanTransition(MigrationState::kLoading, MigrationState::kAborted));
  static_assert(resonance::migration::CanTransition(MigrationState::kProcessing, MigrationState::kCheckpointing));
  static_assert(resonance::migration::CanTransition(MigrationState::kCheckpointing, MigrationState::kProcessing));
  static_assert(resonance::migration::CanTransition(MigrationState::kProcessing, MigrationState::kCompleted));
  static_assert(!resonance::migration::CanTransition(MigrationState::kIdle, MigrationState::kProcessing));
  static_assert(!resonance::migration::CanTransition(MigrationState::kCompleted, MigrationState::kProcessing));
  static_assert(!resonance::migration::CanTransition(MigrationState::kAborted, MigrationState::kLoading));
  static_assert(!resonance::migration::CanTransition(MigrationState::kLoading, MigrationState::kCompleted));

  assert(std::string(resonance::migration::ToString(MigrationState::kCheckpointing)) == "checkpointing");
}

} // namespace

int main() {
  TestRiskWeight();
  TestTransformWithDefaults();
  TestClusterWinsAsParent();
  TestExplicitZeroScoresAreKept();
  TestGoldStandardAnchors();
  TestValidationFailures();
  TestStateMachineTransitions();

  std::cout << "resonance_unit_node_transform: pass\n";
  return 0;
}
