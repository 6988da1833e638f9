#include "eval/episode_runner.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

#include "agent/perception.hpp"
#include "common/errors.hpp"

namespace rulesnake {
namespace {

void require_episode_args(int board_size, int max_steps) {
  if (board_size <= 1) {
    throw ConfigError("board_size debe ser >= 2 (recibido " + std::to_string(board_size) + ")");
  }
  if (board_size > kMaxBoardSize) {
    throw ConfigError("board_size debe ser <= " + std::to_string(kMaxBoardSize) + " (recibido " +
                      std::to_string(board_size) + ")");
  }
  if (max_steps <= 0) {
    throw ConfigError("max_steps debe ser > 0 (recibido " + std::to_string(max_steps) + ")");
  }
}

EndCause cause_from(CollisionKind k) {
  switch (k) {
    case CollisionKind::Wall:
      return EndCause::Wall;
    case CollisionKind::Self:
      return EndCause::Self;
    case CollisionKind::None:
      break;
  }
  return EndCause::None;
}

}  // namespace

const char* to_string(EpisodeOutcome o) {
  switch (o) {
    case EpisodeOutcome::Collided:
      return "Collided";
    case EpisodeOutcome::Timeout:
      return "Timeout";
    case EpisodeOutcome::Won:
      return "Won";
  }
  return "?";
}

const char* to_string(EndCause c) {
  switch (c) {
    case EndCause::None:
      return "None";
    case EndCause::Wall:
      return "Wall";
    case EndCause::Self:
      return "Self";
    case EndCause::NoSafeMove:
      return "NoSafeMove";
  }
  return "?";
}

EpisodeResult run_episode(int board_size,
                          int max_steps,
                          const Policy& policy,
                          uint32_t seed,
                          const CostWeights& weights) {
  require_episode_args(board_size, max_steps);
  GridWorld world(board_size, seed);
  PathPlanner planner(weights);
  return run_episode(world, max_steps, policy, planner);
}

EpisodeResult run_episode(GridWorld& world,
                          int max_steps,
                          const Policy& policy,
                          const PathPlanner& planner) {
  if (max_steps <= 0) {
    throw ConfigError("max_steps debe ser > 0 (recibido " + std::to_string(max_steps) + ")");
  }

  EpisodeResult out;
  // Un mundo recien construido puede venir ya lleno.
  if (world.is_done()) {
    out.score = world.score();
    out.outcome = world.is_won() ? EpisodeOutcome::Won : EpisodeOutcome::Collided;
    out.cause = cause_from(world.last_collision());
    return out;
  }

  while (out.turns < max_steps) {
    const std::vector<ActionCandidate> candidates = planner.plan(
        world.head(), world.food(), world.snake(), world.direction(), world.board_size());

    Direction action = world.direction();
    try {
      if (policy.needs_board()) {
        action = policy.act_with_board(candidates, encode(world));
      } else {
        action = policy.act(candidates);
      }
    } catch (const NoSafeMove&) {
      // Encerrada: fin normal del episodio, no un fallo.
      out.outcome = EpisodeOutcome::Collided;
      out.cause = EndCause::NoSafeMove;
      out.score = world.score();
      return out;
    }

    const StepOutcome step = world.step(action);
    ++out.turns;

    if (step == StepOutcome::Collided) {
      out.outcome = EpisodeOutcome::Collided;
      out.cause = cause_from(world.last_collision());
      out.score = world.score();
      return out;
    }
    if (world.is_won()) {
      out.outcome = EpisodeOutcome::Won;
      out.score = world.score();
      return out;
    }
  }

  out.outcome = EpisodeOutcome::Timeout;
  out.score = world.score();
  return out;
}

BatchSummary run_batch(int n_episodes,
                       int board_size,
                       int max_steps,
                       const Policy& policy,
                       uint32_t seed_base,
                       ExperimentLog& log,
                       const BatchOptions& options) {
  if (n_episodes <= 0) {
    throw ConfigError("n_episodes debe ser > 0 (recibido " + std::to_string(n_episodes) + ")");
  }
  if (options.workers <= 0) {
    throw ConfigError("workers debe ser > 0 (recibido " + std::to_string(options.workers) + ")");
  }
  require_episode_args(board_size, max_steps);

  const int workers = std::max(1, std::min(options.workers, n_episodes));
  if (options.verbose) {
    std::cout << "  [Batch] policy=" << policy.name() << " workers=" << workers
              << " episodes=" << n_episodes << " board=" << board_size << "x" << board_size
              << " max_steps=" << max_steps << "\n";
  }

  std::vector<EpisodeResult> results(static_cast<std::size_t>(n_episodes));
  std::atomic<int> next_episode{0};
  std::atomic<int> completed{0};
  std::mutex error_mu;
  std::exception_ptr error;
  std::atomic<bool> failed{false};

  // Cada worker tiene su propio GridWorld y semilla; no hay estado compartido
  // dentro de un tick. La politica es const y sin estado.
  std::vector<std::thread> pool;
  pool.reserve(static_cast<std::size_t>(workers));
  for (int w = 0; w < workers; ++w) {
    pool.emplace_back([&]() {
      while (true) {
        const int e = next_episode.fetch_add(1);
        if (e >= n_episodes || failed.load()) {
          break;
        }
        const uint32_t seed = seed_base + static_cast<uint32_t>(e);
        try {
          results[static_cast<std::size_t>(e)] =
              run_episode(board_size, max_steps, policy, seed, options.weights);
        } catch (...) {
          // Se relanza en el hilo llamador despues del join.
          std::lock_guard<std::mutex> lock(error_mu);
          if (!error) {
            error = std::current_exception();
          }
          failed.store(true);
          break;
        }
        completed.fetch_add(1);
      }
    });
  }

  if (options.verbose) {
    while (completed.load() < n_episodes && !failed.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(500));
      std::cout << "      [Heartbeat] episodes=" << completed.load() << "/" << n_episodes << "\n";
    }
  }

  for (auto& th : pool) {
    th.join();
  }
  if (error) {
    std::rethrow_exception(error);
  }

  // Las metricas del resumen cubren solo este lote, aunque el log ya traiga entradas.
  ExperimentLog batch_log;
  BatchSummary summary;
  summary.episodes = n_episodes;
  for (const auto& r : results) {
    batch_log.record(r.score, r.turns);
    ++summary.outcomes[r.outcome];
  }
  log.merge(batch_log);
  summary.metrics = batch_log.summary();

  if (options.verbose) {
    const auto& score = summary.metrics[ExperimentLog::kScore];
    std::cout << "  [Batch] completado | mean_score=" << std::fixed << std::setprecision(2)
              << score.mean << std::defaultfloat << std::setprecision(6)
              << " max_score=" << score.max << "\n";
  }
  return summary;
}

BatchSummary run_batch(const RunConfig& cfg, const Policy& policy, ExperimentLog& log) {
  require_valid_config(cfg);
  BatchOptions options;
  options.workers = cfg.workers;
  options.weights.distance = cfg.distance_weight;
  options.weights.turn = cfg.turn_weight;
  options.verbose = cfg.verbose;
  return run_batch(cfg.episodes, cfg.board_size, cfg.max_steps, policy, cfg.seed, log, options);
}

}  // namespace rulesnake
