#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "agent/planner.hpp"
#include "agent/policy.hpp"
#include "common/cli.hpp"
#include "common/config.hpp"
#include "common/errors.hpp"
#include "env/grid_world.hpp"
#include "eval/episode_runner.hpp"
#include "eval/experiment_log.hpp"

namespace fs = std::filesystem;

using namespace rulesnake;

namespace {

template <typename E, typename Fn>
bool throws(Fn fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

// Ignora la seguridad: sirve para forzar un choque contra la pared.
class AlwaysLeftPolicy : public Policy {
 public:
  Direction act(const std::vector<ActionCandidate>&) const override { return Direction::Left; }
  std::string name() const override { return "always_left"; }
};

// Devuelve un valor fuera del enum de direcciones.
class OutOfRangePolicy : public Policy {
 public:
  Direction act(const std::vector<ActionCandidate>&) const override {
    return static_cast<Direction>(9);
  }
  std::string name() const override { return "out_of_range"; }
};

// Pide el tablero codificado y verifica su forma antes de delegar.
class BoardCheckingPolicy : public Policy {
 public:
  explicit BoardCheckingPolicy(int size) : size_(size) {}

  Direction act(const std::vector<ActionCandidate>& c) const override { return greedy_.act(c); }
  bool needs_board() const override { return true; }
  Direction act_with_board(const std::vector<ActionCandidate>& c,
                           const BoardMatrix& board) const override {
    assert(static_cast<int>(board.size()) == size_);
    int food_cells = 0;
    for (const auto& row : board) {
      assert(static_cast<int>(row.size()) == size_);
      for (int v : row) {
        if (v == kFoodCell) ++food_cells;
      }
    }
    assert(food_cells == 1);
    return greedy_.act(c);
  }
  std::string name() const override { return "board_checking"; }

 private:
  int size_;
  GreedyPolicy greedy_;
};

bool has_duplicates(const std::deque<Position>& body) {
  for (std::size_t i = 0; i < body.size(); ++i) {
    for (std::size_t j = i + 1; j < body.size(); ++j) {
      if (body[i] == body[j]) return true;
    }
  }
  return false;
}

bool contains(const std::deque<Position>& body, const Position& p) {
  for (const auto& s : body) {
    if (s == p) return true;
  }
  return false;
}

}  // namespace

int main() {
  GreedyPolicy greedy;
  LookaheadPolicy lookahead;

  {
    // Configuracion invalida: se rechaza antes de cualquier tick.
    assert(throws<ConfigError>([&] { run_episode(0, 10, greedy, 1); }));
    assert(throws<ConfigError>([&] { run_episode(1, 10, greedy, 1); }));
    assert(throws<ConfigError>([&] { run_episode(10, 0, greedy, 1); }));
    assert(throws<ConfigError>([&] { run_episode(10, -5, greedy, 1); }));
  }

  {
    EpisodeResult r = run_episode(10, 5, greedy, 1);
    assert(r.outcome == EpisodeOutcome::Timeout);
    assert(r.turns == 5);

    EpisodeResult a = run_episode(10, 300, greedy, 77);
    EpisodeResult b = run_episode(10, 300, greedy, 77);
    assert(a.score == b.score && a.turns == b.turns && a.outcome == b.outcome);
  }

  {
    // Una politica que ignora la seguridad choca con la pared en el sexto tick.
    AlwaysLeftPolicy left;
    EpisodeResult r = run_episode(10, 100, left, 3);
    assert(r.outcome == EpisodeOutcome::Collided);
    assert(r.cause == EndCause::Wall);
    assert(r.turns == 6);
  }

  {
    // Encerrada con una unica celda libre: NoSafeMove termina como Collided.
    GridWorld world(3,
                    {{0, 0}, {1, 0}, {2, 0}, {2, 1}, {1, 1}, {0, 1}, {0, 2}, {1, 2}},
                    Direction::Left, Position{2, 2}, 1);
    EpisodeResult r = run_episode(world, 10, greedy, PathPlanner());
    assert(r.outcome == EpisodeOutcome::Collided);
    assert(r.cause == EndCause::NoSafeMove);
    assert(r.turns == 0);
    assert(!world.is_done());
  }

  {
    GridWorld world(2, {{0, 0}, {1, 0}, {1, 1}}, Direction::Left, Position{0, 1}, 1);
    EpisodeResult r = run_episode(world, 10, greedy, PathPlanner());
    assert(r.outcome == EpisodeOutcome::Won);
    assert(r.score == 1);
    assert(r.turns == 1);
  }

  {
    // Invariantes del estado a lo largo de episodios completos.
    PathPlanner planner;
    for (uint32_t seed = 0; seed < 8; ++seed) {
      GridWorld world(8, seed);
      for (int t = 0; t < 400 && !world.is_done(); ++t) {
        assert(!has_duplicates(world.snake()));
        const std::deque<Position> before = world.snake();
        auto cands = planner.plan(world.head(), world.food(), world.snake(), world.direction(),
                                  world.board_size());
        Direction d = world.direction();
        try {
          d = greedy.act(cands);
        } catch (const NoSafeMove&) {
          break;
        }
        const StepOutcome st = world.step(d);
        assert(st != StepOutcome::Collided);
        if (st == StepOutcome::Ate) {
          assert(world.snake_length() == before.size() + 1);
          if (world.has_food()) {
            assert(!contains(world.snake(), world.food()));
          }
        } else {
          assert(world.snake_length() == before.size());
          const Position old_tail = before.back();
          const Position new_tail = world.tail();
          assert(std::abs(new_tail.x - old_tail.x) + std::abs(new_tail.y - old_tail.y) == 1);
          assert(new_tail == before[before.size() - 2]);
        }
        assert(!has_duplicates(world.snake()));
      }
    }
  }

  {
    // El runner codifica el tablero solo para politicas que lo piden.
    BoardCheckingPolicy checking(6);
    EpisodeResult r = run_episode(6, 30, checking, 5);
    EpisodeResult g = run_episode(6, 30, greedy, 5);
    assert(r.score == g.score && r.turns == g.turns);
  }

  {
    ExperimentLog log;
    assert(log.episodes() == 0);
    assert(log.summary().empty());

    log.record(3, 10);
    log.record(5, 20);
    auto s = log.summary();
    assert(s.at(ExperimentLog::kScore).count == 2);
    assert(s.at(ExperimentLog::kScore).mean == 4.0);
    assert(s.at(ExperimentLog::kScore).max == 5.0);
    assert(s.at(ExperimentLog::kScore).min == 3.0);
    assert(s.at(ExperimentLog::kTurns).mean == 15.0);
    assert((log.values(ExperimentLog::kTurns) == std::vector<double>{10.0, 20.0}));
    assert(log.values("unknown").empty());

    ExperimentLog other;
    other.record(1, 4);
    log.merge(other);
    assert(log.episodes() == 3);
    assert(log.summary().at(ExperimentLog::kScore).min == 1.0);
  }

  {
    ExperimentLog log;
    std::vector<std::thread> pool;
    for (int w = 0; w < 4; ++w) {
      pool.emplace_back([&log]() {
        for (int i = 0; i < 250; ++i) {
          log.record(i, i * 2);
        }
      });
    }
    for (auto& th : pool) {
      th.join();
    }
    assert(log.episodes() == 1000);
  }

  {
    // Mismo resumen con 1 o 4 workers; el orden del log sigue el indice de episodio.
    ExperimentLog serial;
    ExperimentLog parallel;
    BatchOptions one;
    one.workers = 1;
    BatchOptions four;
    four.workers = 4;
    BatchSummary a = run_batch(20, 8, 200, greedy, 100, serial, one);
    BatchSummary b = run_batch(20, 8, 200, greedy, 100, parallel, four);
    assert(a.episodes == 20 && b.episodes == 20);
    assert(serial.episodes() == 20 && parallel.episodes() == 20);
    assert(serial.values(ExperimentLog::kScore) == parallel.values(ExperimentLog::kScore));
    assert(serial.values(ExperimentLog::kTurns) == parallel.values(ExperimentLog::kTurns));
    assert(a.metrics.at(ExperimentLog::kScore).mean == b.metrics.at(ExperimentLog::kScore).mean);
    int total = 0;
    for (const auto& kv : b.outcomes) {
      total += kv.second;
    }
    assert(total == 20);

    const auto scores = serial.values(ExperimentLog::kScore);
    for (int i = 0; i < 3; ++i) {
      EpisodeResult r = run_episode(8, 200, greedy, 100 + static_cast<uint32_t>(i));
      assert(scores[static_cast<std::size_t>(i)] == static_cast<double>(r.score));
    }

    ExperimentLog unused;
    BatchOptions zero;
    zero.workers = 0;
    assert(throws<ConfigError>([&] { run_batch(0, 8, 200, greedy, 1, unused, one); }));
    assert(throws<ConfigError>([&] { run_batch(5, 8, 200, greedy, 1, unused, zero); }));
    assert(throws<ConfigError>([&] { run_batch(5, 0, 200, greedy, 1, unused, one); }));
    assert(unused.episodes() == 0);
  }

  {
    // Una accion invalida es fatal: el lote se aborta y no registra nada.
    OutOfRangePolicy bad;
    assert(throws<InvalidAction>([&] { run_episode(8, 50, bad, 1); }));
    ExperimentLog log;
    BatchOptions three;
    three.workers = 3;
    assert(throws<InvalidAction>([&] { run_batch(6, 8, 50, bad, 1, log, three); }));
    assert(log.episodes() == 0);
  }

  {
    // Dos lotes sobre el mismo log: cada resumen cubre solo su lote.
    ExperimentLog log;
    BatchSummary first = run_batch(5, 8, 200, greedy, 10, log);
    BatchSummary second = run_batch(5, 8, 200, greedy, 500, log);
    assert(first.metrics.at(ExperimentLog::kScore).count == 5);
    assert(second.episodes == 5);
    assert(second.metrics.at(ExperimentLog::kScore).count == 5);
    assert(second.metrics.at(ExperimentLog::kTurns).count == 5);
    assert(log.episodes() == 10);

    ExperimentLog fresh;
    BatchSummary alone = run_batch(5, 8, 200, greedy, 500, fresh);
    assert(second.metrics.at(ExperimentLog::kScore).mean ==
           alone.metrics.at(ExperimentLog::kScore).mean);
    assert(second.metrics.at(ExperimentLog::kTurns).max ==
           alone.metrics.at(ExperimentLog::kTurns).max);
  }

  {
    RunConfig cfg;
    cfg.board_size = 6;
    cfg.max_steps = 50;
    cfg.episodes = 6;
    cfg.workers = 2;
    cfg.policy = "lookahead";
    ExperimentLog log;
    BatchSummary s = run_batch(cfg, lookahead, log);
    assert(s.episodes == 6);
    assert(s.metrics.at(ExperimentLog::kTurns).count == 6);
    assert(s.metrics.at(ExperimentLog::kTurns).max <= 50.0);

    cfg.max_steps = 0;
    assert(throws<ConfigError>([&] { run_batch(cfg, lookahead, log); }));
  }

  {
    const fs::path path = fs::temp_directory_path() / "rulesnake_tests_config.yaml";
    {
      std::ofstream out(path);
      out << "# prueba\n"
          << "env:\n"
          << "  board_size: 12\n"
          << "  max_steps: 300\n"
          << "eval:\n"
          << "  episodes: 7\n"
          << "agent:\n"
          << "  policy: \"lookahead\"\n"
          << "planner:\n"
          << "  turn_weight: 3\n"
          << "seed: 9\n"
          << "verbose: true\n";
    }
    RunConfig cfg;
    std::string err;
    assert(load_config_file(path.string(), cfg, err));
    assert(cfg.board_size == 12);
    assert(cfg.max_steps == 300);
    assert(cfg.episodes == 7);
    assert(cfg.policy == "lookahead");
    assert(cfg.turn_weight == 3);
    assert(cfg.distance_weight == 1);
    assert(cfg.seed == 9u);
    assert(cfg.verbose);
    assert(validate_config(cfg, err));

    {
      std::ofstream out(path);
      out << "env:\n  board_size: doce\n";
    }
    RunConfig bad;
    assert(!load_config_file(path.string(), bad, err));
    assert(err.find("linea 2") != std::string::npos);
    fs::remove(path);

    assert(!load_config_file("/nonexistent/rulesnake.yaml", bad, err));

    RunConfig v;
    v.board_size = 0;
    assert(!validate_config(v, err));
    v = RunConfig{};
    v.max_steps = 0;
    assert(!validate_config(v, err));
    v = RunConfig{};
    v.policy = "neural";
    assert(!validate_config(v, err));
    assert(throws<ConfigError>([&] { require_valid_config(v); }));

    RunConfig smoke = with_profile(RunConfig{}, "smoke");
    assert(smoke.profile == "smoke");
    assert(smoke.episodes == 8);
    assert(validate_config(smoke, err));
    RunConfig same = with_profile(RunConfig{}, "unknown");
    assert(same.episodes == RunConfig{}.episodes);
    assert(same.profile == "unknown");
    assert(!validate_config(same, err));
    assert(err.find("unknown") != std::string::npos);

    v = RunConfig{};
    v.board_size = kMaxBoardSize;
    assert(validate_config(v, err));
    v.board_size = 50000;
    assert(!validate_config(v, err));
    assert(throws<ConfigError>([&] { require_valid_config(v); }));
    assert(throws<ConfigError>([] { run_episode(50000, 10, GreedyPolicy(), 1); }));
    {
      ExperimentLog unused;
      assert(throws<ConfigError>([&] { run_batch(2, 50000, 10, GreedyPolicy(), 1, unused); }));
      assert(unused.episodes() == 0);
    }

    const fs::path seed_path = fs::temp_directory_path() / "rulesnake_seed_cfg.yaml";
    {
      std::ofstream out(seed_path);
      out << "seed: -1\n";
    }
    RunConfig neg;
    assert(!load_config_file(seed_path.string(), neg, err));
    assert(err.find("seed") != std::string::npos);
    assert(neg.seed == RunConfig{}.seed);
    {
      std::ofstream out(seed_path);
      out << "seed: 4294967295\n";
    }
    RunConfig top;
    assert(load_config_file(seed_path.string(), top, err));
    assert(top.seed == 4294967295u);
    fs::remove(seed_path);
  }

  {
    char prog[] = "rulesnake_eval";
    char a1[] = "--episodes";
    char a2[] = "12";
    char a3[] = "--size=6";
    char a4[] = "--compare";
    char a5[] = "--seed";
    char a6[] = "abc";
    char* argv[] = {prog, a1, a2, a3, a4, a5, a6};
    CliArgs args = parse_cli(7, argv);
    assert(cli_get_int(args, "--episodes", 1) == 12);
    assert(cli_get_int(args, "--size", 10) == 6);
    assert(cli_get_int(args, "--workers", 3) == 3);
    assert(cli_flag(args, "--compare"));
    assert(!cli_flag(args, "--verbose"));
    assert(throws<ConfigError>([&] { cli_get_seed(args, "--seed", 1); }));
  }

  std::cout << "test_eval: OK\n";
  return 0;
}
