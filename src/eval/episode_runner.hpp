#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "agent/planner.hpp"
#include "agent/policy.hpp"
#include "common/config.hpp"
#include "env/grid_world.hpp"
#include "eval/experiment_log.hpp"

namespace rulesnake {

enum class EpisodeOutcome { Collided, Timeout, Won };

enum class EndCause { None, Wall, Self, NoSafeMove };

const char* to_string(EpisodeOutcome o);
const char* to_string(EndCause c);

struct EpisodeResult {
  int score = 0;
  int turns = 0;  // ticks ejecutados, incluido el del choque
  EpisodeOutcome outcome = EpisodeOutcome::Timeout;
  EndCause cause = EndCause::None;
};

struct BatchSummary {
  std::map<std::string, MetricSummary> metrics;
  std::map<EpisodeOutcome, int> outcomes;
  int episodes = 0;
};

struct BatchOptions {
  int workers = 1;
  CostWeights weights{};
  bool verbose = false;
};

// Corre un episodio desde el layout inicial. Lanza ConfigError si
// board_size <= 1 o max_steps <= 0, antes de ejecutar cualquier tick.
EpisodeResult run_episode(int board_size,
                          int max_steps,
                          const Policy& policy,
                          uint32_t seed,
                          const CostWeights& weights = {});

// Corre desde un mundo ya construido (escenarios armados a mano).
EpisodeResult run_episode(GridWorld& world,
                          int max_steps,
                          const Policy& policy,
                          const PathPlanner& planner);

// El episodio i usa seed_base + i. Los resultados se agregan al log en orden
// de episodio despues de que terminan todos los workers.
BatchSummary run_batch(int n_episodes,
                       int board_size,
                       int max_steps,
                       const Policy& policy,
                       uint32_t seed_base,
                       ExperimentLog& log,
                       const BatchOptions& options = {});

BatchSummary run_batch(const RunConfig& cfg, const Policy& policy, ExperimentLog& log);

}  // namespace rulesnake
