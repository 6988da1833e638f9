#pragma once

#include <stdexcept>
#include <string>

namespace rulesnake {

// Direccion fuera del conjunto cerrado {UP, DOWN, LEFT, RIGHT}.
class InvalidAction : public std::invalid_argument {
 public:
  explicit InvalidAction(const std::string& what) : std::invalid_argument(what) {}
};

// Configuracion rechazada antes de correr cualquier tick.
class ConfigError : public std::invalid_argument {
 public:
  explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

// La politica no encontro ningun candidato seguro: la serpiente esta encerrada.
class NoSafeMove : public std::runtime_error {
 public:
  explicit NoSafeMove(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace rulesnake
