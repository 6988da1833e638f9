#include "eval/experiment_log.hpp"

#include <algorithm>
#include <numeric>

namespace rulesnake {

void ExperimentLog::record(int score, int turns) {
  std::lock_guard<std::mutex> lock(mu_);
  metrics_[kScore].push_back(static_cast<double>(score));
  metrics_[kTurns].push_back(static_cast<double>(turns));
}

void ExperimentLog::merge(const ExperimentLog& other) {
  if (this == &other) {
    return;
  }
  std::scoped_lock lock(mu_, other.mu_);
  for (const auto& kv : other.metrics_) {
    auto& dst = metrics_[kv.first];
    dst.insert(dst.end(), kv.second.begin(), kv.second.end());
  }
}

std::size_t ExperimentLog::episodes() const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = metrics_.find(kScore);
  return it == metrics_.end() ? 0 : it->second.size();
}

std::vector<double> ExperimentLog::values(const std::string& metric) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = metrics_.find(metric);
  if (it == metrics_.end()) {
    return {};
  }
  return it->second;
}

std::map<std::string, MetricSummary> ExperimentLog::summary() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::map<std::string, MetricSummary> out;
  for (const auto& kv : metrics_) {
    const auto& v = kv.second;
    MetricSummary s;
    s.count = v.size();
    if (!v.empty()) {
      s.mean = std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
      s.max = *std::max_element(v.begin(), v.end());
      s.min = *std::min_element(v.begin(), v.end());
    }
    out[kv.first] = s;
  }
  return out;
}

}  // namespace rulesnake
