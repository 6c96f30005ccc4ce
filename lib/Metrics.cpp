#include "Metrics.h"

namespace hr {

void ParticipationMetrics::recordRound(const std::set<std::string> &expected,
                                       const std::set<std::string> &voters) {
  std::lock_guard<std::mutex> lock(mutex_);
  lastRound_.clear();
  for (const auto &nodeId : expected) {
    lastRound_[nodeId] = voters.count(nodeId) > 0 ? 1.0 : 0.0;
  }
}

std::optional<double>
ParticipationMetrics::samplePerformance(const std::string &nodeId) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = lastRound_.find(nodeId);
  if (it == lastRound_.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace hr
