#ifndef HR_METRICS_H
#define HR_METRICS_H

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace hr {

/**
 * Supplies performance observations for validators, in [0, 1].
 */
class MetricsSource {
public:
  virtual ~MetricsSource() = default;

  // No value means nothing was observed for the node
  virtual std::optional<double> samplePerformance(const std::string &nodeId) = 0;
};

/**
 * Scores validators by participation in the last decided round:
 * 1.0 for a validator that voted, 0.0 for one that was expected to and
 * did not.
 */
class ParticipationMetrics : public MetricsSource {
public:
  void recordRound(const std::set<std::string> &expected,
                   const std::set<std::string> &voters);

  std::optional<double> samplePerformance(const std::string &nodeId) override;

private:
  std::mutex mutex_;
  std::map<std::string, double> lastRound_;
};

} // namespace hr

#endif // HR_METRICS_H
