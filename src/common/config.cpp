#include "common/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <sstream>

#include "common/errors.hpp"
#include "env/grid_world.hpp"

namespace rulesnake {
namespace {

std::string trim(const std::string& s) {
  std::size_t b = 0;
  while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b]))) {
    ++b;
  }
  std::size_t e = s.size();
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) {
    --e;
  }
  return s.substr(b, e - b);
}

bool parse_kv(const std::string& line, std::string& key, std::string& value) {
  const auto p = line.find(':');
  if (p == std::string::npos) {
    return false;
  }
  key = trim(line.substr(0, p));
  value = trim(line.substr(p + 1));
  if (!value.empty() && (value.front() == '"' || value.front() == '\'')) {
    if (value.back() == value.front() && value.size() > 1) {
      value = value.substr(1, value.size() - 2);
    }
  }
  return !key.empty();
}

template <typename T>
bool to_num(const std::string& s, T& out) {
  std::stringstream ss(s);
  ss >> out;
  return !ss.fail() && ss.eof();
}

bool is_known_policy(const std::string& name) {
  return name == "greedy" || name == "lookahead";
}

bool is_known_profile(const std::string& name) {
  return name == "default" || name == "smoke" || name == "benchmark";
}

}  // namespace

bool load_config_file(const std::string& path, RunConfig& cfg, std::string& error) {
  std::ifstream in(path);
  if (!in) {
    error = "No se pudo abrir config: " + path;
    return false;
  }

  std::string line;
  std::string section;
  std::size_t lineno = 0;

  while (std::getline(in, line)) {
    ++lineno;
    std::string t = trim(line);
    if (t.empty() || t[0] == '#') {
      continue;
    }
    if (t.back() == ':') {
      section = trim(t.substr(0, t.size() - 1));
      continue;
    }

    std::string key;
    std::string value;
    if (!parse_kv(t, key, value)) {
      continue;
    }

    // Claves sin indentacion cierran la seccion actual.
    if (!line.empty() && !std::isspace(static_cast<unsigned char>(line[0]))) {
      section.clear();
    }
    std::string full = section.empty() ? key : (section + "." + key);

    auto invalid = [&]() {
      error = "Valor invalido en linea " + std::to_string(lineno) + ": " + full;
      return false;
    };

    auto set_int = [&](int& target) {
      int v = 0;
      if (!to_num(value, v)) {
        return invalid();
      }
      target = v;
      return true;
    };

    auto set_seed = [&](uint32_t& target) {
      long long v = 0;
      if (!to_num(value, v) || v < 0 || v > static_cast<long long>(UINT32_MAX)) {
        return invalid();
      }
      target = static_cast<uint32_t>(v);
      return true;
    };

    auto set_bool = [&](bool& target) {
      if (value == "true" || value == "1" || value == "yes") {
        target = true;
      } else if (value == "false" || value == "0" || value == "no") {
        target = false;
      } else {
        return invalid();
      }
      return true;
    };

    if (full == "env.board_size" || full == "board_size") {
      if (!set_int(cfg.board_size)) return false;
    } else if (full == "env.max_steps" || full == "max_steps") {
      if (!set_int(cfg.max_steps)) return false;
    } else if (full == "eval.episodes" || full == "episodes") {
      if (!set_int(cfg.episodes)) return false;
    } else if (full == "eval.workers" || full == "workers") {
      if (!set_int(cfg.workers)) return false;
    } else if (full == "agent.policy" || full == "policy") {
      cfg.policy = value;
    } else if (full == "planner.distance_weight" || full == "distance_weight") {
      if (!set_int(cfg.distance_weight)) return false;
    } else if (full == "planner.turn_weight" || full == "turn_weight") {
      if (!set_int(cfg.turn_weight)) return false;
    } else if (full == "seed") {
      if (!set_seed(cfg.seed)) return false;
    } else if (full == "profile") {
      cfg.profile = value;
    } else if (full == "verbose") {
      if (!set_bool(cfg.verbose)) return false;
    }
  }

  return true;
}

RunConfig with_profile(const RunConfig& base, const std::string& profile) {
  RunConfig cfg = base;
  cfg.profile = profile;

  if (profile == "smoke") {
    cfg.board_size = 8;
    cfg.max_steps = 200;
    cfg.episodes = 8;
    cfg.workers = std::min(2, std::max(1, cfg.workers));
    return cfg;
  }

  if (profile == "benchmark") {
    cfg.board_size = 20;
    cfg.max_steps = 4000;
    cfg.episodes = 1000;
    cfg.workers = std::max(8, cfg.workers);
  }

  return cfg;
}

bool validate_config(const RunConfig& cfg, std::string& error) {
  // El cuerpo inicial tiene dos segmentos: un tablero de 1x1 no lo contiene.
  if (cfg.board_size <= 1) {
    error = "board_size debe ser >= 2 (recibido " + std::to_string(cfg.board_size) + ")";
    return false;
  }
  if (cfg.board_size > kMaxBoardSize) {
    error = "board_size debe ser <= " + std::to_string(kMaxBoardSize) + " (recibido " +
            std::to_string(cfg.board_size) + ")";
    return false;
  }
  if (cfg.max_steps <= 0) {
    error = "max_steps debe ser > 0 (recibido " + std::to_string(cfg.max_steps) + ")";
    return false;
  }
  if (cfg.episodes <= 0) {
    error = "episodes debe ser > 0 (recibido " + std::to_string(cfg.episodes) + ")";
    return false;
  }
  if (cfg.workers <= 0) {
    error = "workers debe ser > 0 (recibido " + std::to_string(cfg.workers) + ")";
    return false;
  }
  if (cfg.distance_weight < 0 || cfg.turn_weight < 0) {
    error = "los pesos del planner no pueden ser negativos";
    return false;
  }
  if (!is_known_policy(cfg.policy)) {
    error = "politica desconocida: " + cfg.policy;
    return false;
  }
  if (!is_known_profile(cfg.profile)) {
    error = "perfil desconocido: " + cfg.profile;
    return false;
  }
  return true;
}

void require_valid_config(const RunConfig& cfg) {
  std::string error;
  if (!validate_config(cfg, error)) {
    throw ConfigError(error);
  }
}

}  // namespace rulesnake
