#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "agent/policy.hpp"
#include "common/cli.hpp"
#include "common/config.hpp"
#include "common/errors.hpp"
#include "eval/episode_runner.hpp"
#include "eval/experiment_log.hpp"

using namespace rulesnake;

namespace {

void print_summary(const std::string& policy_name, const BatchSummary& s) {
  std::cout << "\n[Resultado] policy=" << policy_name << " episodes=" << s.episodes << "\n";
  for (const auto& kv : s.metrics) {
    std::cout << "  " << kv.first << ": mean=" << std::fixed << std::setprecision(2)
              << kv.second.mean << std::defaultfloat << std::setprecision(6)
              << " max=" << kv.second.max << " min=" << kv.second.min
              << " count=" << kv.second.count << "\n";
  }
  for (const auto& kv : s.outcomes) {
    std::cout << "  outcome " << to_string(kv.first) << ": " << kv.second << "\n";
  }
}

}  // namespace

int main(int argc, char** argv) {
  auto args = parse_cli(argc, argv);

  RunConfig base_cfg;
  std::string err;
  if (cli_has(args, "--config")) {
    if (!load_config_file(cli_get(args, "--config"), base_cfg, err)) {
      std::cerr << "[ERROR] " << err << "\n";
      return 1;
    }
  }

  RunConfig cfg = with_profile(base_cfg, cli_get(args, "--profile", base_cfg.profile));
  try {
    cfg.episodes = cli_get_int(args, "--episodes", cfg.episodes);
    cfg.board_size = cli_get_int(args, "--size", cfg.board_size);
    cfg.max_steps = cli_get_int(args, "--max_steps", cfg.max_steps);
    cfg.workers = cli_get_int(args, "--workers", cfg.workers);
    cfg.seed = cli_get_seed(args, "--seed", cfg.seed);
  } catch (const ConfigError& e) {
    std::cerr << "[ERROR] " << e.what() << "\n";
    return 1;
  }
  cfg.policy = cli_get(args, "--policy", cfg.policy);
  if (cli_has(args, "--verbose")) {
    cfg.verbose = cli_flag(args, "--verbose");
  }

  if (!validate_config(cfg, err)) {
    std::cerr << "[ERROR] " << err << "\n";
    return 1;
  }

  std::vector<std::string> policies{cfg.policy};
  if (cli_flag(args, "--compare")) {
    policies = policy_names();
  }

  std::cout << "============================================================\n";
  std::cout << " RuleSnake evaluation\n";
  std::cout << " Profile: " << cfg.profile << "\n";
  std::cout << " Board: " << cfg.board_size << "x" << cfg.board_size << "\n";
  std::cout << " Episodes: " << cfg.episodes << " | max_steps: " << cfg.max_steps << "\n";
  std::cout << " Seed: " << cfg.seed << " | workers: " << cfg.workers << "\n";
  std::cout << "============================================================\n";

  try {
    for (const auto& name : policies) {
      RunConfig run = cfg;
      run.policy = name;
      auto policy = make_policy(name);
      ExperimentLog log;
      const BatchSummary summary = run_batch(run, *policy, log);
      print_summary(name, summary);
    }
  } catch (const ConfigError& e) {
    std::cerr << "[ERROR] " << e.what() << "\n";
    return 1;
  }

  return 0;
}
