#pragma once

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include "common/errors.hpp"

namespace rulesnake {

using CliArgs = std::unordered_map<std::string, std::string>;

// Acepta "--clave valor", "--clave=valor" y "--flag" (valor "1").
// Los argumentos posicionales se ignoran.
inline CliArgs parse_cli(int argc, char** argv) {
  CliArgs out;
  for (int i = 1; i < argc; ++i) {
    std::string k = argv[i];
    if (k.rfind("--", 0) != 0) {
      continue;
    }
    const auto eq = k.find('=');
    if (eq != std::string::npos) {
      out[k.substr(0, eq)] = k.substr(eq + 1);
      continue;
    }
    std::string v = "1";
    if (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) {
      v = argv[++i];
    }
    out[k] = v;
  }
  return out;
}

inline bool cli_has(const CliArgs& args, const std::string& key) {
  return args.find(key) != args.end();
}

inline std::string cli_get(const CliArgs& args,
                           const std::string& key,
                           const std::string& fallback = "") {
  auto it = args.find(key);
  return it == args.end() ? fallback : it->second;
}

inline bool cli_flag(const CliArgs& args, const std::string& key) {
  const std::string v = cli_get(args, key, "0");
  return v != "0" && v != "false" && v != "False";
}

// Lanza ConfigError si el valor no es un entero completo.
inline long long cli_get_integer(const CliArgs& args, const std::string& key, long long fallback) {
  auto it = args.find(key);
  if (it == args.end()) {
    return fallback;
  }
  std::size_t used = 0;
  long long v = 0;
  try {
    v = std::stoll(it->second, &used);
  } catch (const std::logic_error&) {
    throw ConfigError("valor numerico invalido para " + key + ": " + it->second);
  }
  if (used != it->second.size()) {
    throw ConfigError("valor numerico invalido para " + key + ": " + it->second);
  }
  return v;
}

inline int cli_get_int(const CliArgs& args, const std::string& key, int fallback) {
  const long long v = cli_get_integer(args, key, fallback);
  if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
    throw ConfigError("valor fuera de rango para " + key + ": " + std::to_string(v));
  }
  return static_cast<int>(v);
}

inline uint32_t cli_get_seed(const CliArgs& args, const std::string& key, uint32_t fallback) {
  const long long v = cli_get_integer(args, key, fallback);
  if (v < 0 || v > 0xFFFFFFFFLL) {
    throw ConfigError("semilla fuera de rango: " + std::to_string(v));
  }
  return static_cast<uint32_t>(v);
}

}  // namespace rulesnake
