#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace rulesnake {

struct MetricSummary {
  std::size_t count = 0;
  double mean = 0.0;
  double max = 0.0;
  double min = 0.0;
};

// Metricas por episodio ("score", "turns"), una entrada por episodio
// completado. Solo se agrega; record() es seguro entre hilos.
class ExperimentLog {
 public:
  static constexpr const char* kScore = "score";
  static constexpr const char* kTurns = "turns";

  void record(int score, int turns);
  void merge(const ExperimentLog& other);

  [[nodiscard]] std::size_t episodes() const;
  [[nodiscard]] std::vector<double> values(const std::string& metric) const;
  [[nodiscard]] std::map<std::string, MetricSummary> summary() const;

 private:
  mutable std::mutex mu_;
  std::map<std::string, std::vector<double>> metrics_;
};

}  // namespace rulesnake
