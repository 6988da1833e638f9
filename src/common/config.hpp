#pragma once

#include <cstdint>
#include <string>

namespace rulesnake {

struct RunConfig {
  int board_size = 10;
  int max_steps = 500;

  int episodes = 100;
  int workers = 4;
  uint32_t seed = 42;

  std::string policy = "greedy";
  int distance_weight = 1;
  int turn_weight = 1;

  std::string profile = "default";
  bool verbose = false;
};

bool load_config_file(const std::string& path, RunConfig& cfg, std::string& error);
RunConfig with_profile(const RunConfig& base, const std::string& profile);

// false + mensaje si algun valor impide correr un episodio.
bool validate_config(const RunConfig& cfg, std::string& error);

// Variante para la API de biblioteca: lanza ConfigError.
void require_valid_config(const RunConfig& cfg);

}  // namespace rulesnake
