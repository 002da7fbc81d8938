#include "resonance_scorer.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/text.hpp"

namespace resonance::scoring {

using namespace resonance::graph::v1;

ResonanceScorer::ResonanceScorer(resonance::runtime::config::ScoringConfig config) : config_(std::move(config)) {
}

double ResonanceScorer::Floor(double score) const {
  return std::max(config_.resonance_floor(), score);
}

double ResonanceScorer::ScoreBoost(const Signal& signal) const {
  double ctr = 0.0;
  if (signal.has_ctr() && signal.ctr() != 0.0) {
    ctr = signal.ctr();
  } else if (signal.impressions() > 0.0) {
    ctr = signal.clicks() / signal.impressions();
  }

  return std::min(ctr, config_.ctr_cap()) * config_.ctr_weight() +
         std::min(signal.dwell_seconds() / 60.0, config_.dwell_cap_minutes()) * config_.dwell_weight() +
         std::min(signal.traversal_depth(), config_.depth_cap()) * config_.depth_weight() +
         std::min(signal.return_visits(), config_.return_visit_cap()) * config_.return_visit_weight();
}

// ------------------------------------------------------------
// Signals
// ------------------------------------------------------------

void ResonanceScorer::ApplySignals(std::vector<Node>* nodes, const std::vector<Signal>& signals, util::TimePoint now,
                                   ScoringReport* report) const {
  std::unordered_map<std::string, size_t> by_id;
  std::unordered_map<std::string, size_t> by_path;
  for (size_t i = 0; i < nodes->size(); ++i) {
    const auto& node = (*nodes)[i];
    by_id[node.id()] = i;
    if (!node.path().empty()) {
      by_path[util::StripTrailingSlashes(node.path())] = i;
    }
  }

  for (const auto& signal : signals) {
    Node* target = nullptr;
    if (!signal.node_id().empty()) {
      if (auto it = by_id.find(signal.node_id()); it != by_id.end()) target = &(*nodes)[it->second];
    }
    if (!target && !signal.path().empty()) {
      if (auto it = by_path.find(util::StripTrailingSlashes(signal.path())); it != by_path.end()) {
        target = &(*nodes)[it->second];
      }
    }

    if (!target) {
      ++report->signals_dropped;
      continue;
    }

    target->set_resonance_score(Floor(target->resonance_score() + ScoreBoost(signal)));
    if (signal.has_timestamp()) {
      *target->mutable_last_updated() = signal.timestamp();
    } else {
      *target->mutable_last_updated() = util::ToProto(now);
    }
    ++report->signals_applied;
  }
}

// ------------------------------------------------------------
// Decay
// ------------------------------------------------------------

void ResonanceScorer::ApplyDecay(std::vector<Node>* nodes, util::TimePoint now, ScoringReport* report) const {
  for (auto& node : *nodes) {
    if (!node.has_last_updated()) {
      node.set_decay_score(
          std::min(config_.unobserved_decay_cap(), node.decay_score() + config_.unobserved_decay_step()));
      node.set_resonance_score(Floor(node.resonance_score() - config_.unobserved_decay_step()));
      ++report->nodes_unobserved;
      continue;
    }

    const double age_days = std::max(0.0, util::DaysBetween(util::FromProto(node.last_updated()), now));
    const double decay    = std::min(config_.age_decay_cap(), age_days * config_.age_decay_per_day());
    node.set_decay_score(decay);
    node.set_resonance_score(Floor(node.resonance_score() - decay));
    ++report->nodes_aged;
  }
}

ScoringReport ResonanceScorer::Score(std::vector<Node>* nodes, const std::vector<Signal>& signals,
                                     util::TimePoint now) const {
  ScoringReport report;
  ApplySignals(nodes, signals, now, &report);
  ApplyDecay(nodes, now, &report);

  RESONANCE_LOG_INFO("Resonance scoring complete",
                     {observability::IntField("signals_applied", static_cast<int64_t>(report.signals_applied)),
                      observability::IntField("signals_dropped", static_cast<int64_t>(report.signals_dropped)),
                      observability::IntField("nodes_unobserved", static_cast<int64_t>(report.nodes_unobserved)),
                      observability::IntField("nodes_aged", static_cast<int64_t>(report.nodes_aged))});
  return report;
}

} // namespace resonance::scoring
