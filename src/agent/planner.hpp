#pragma once

#include <deque>
#include <vector>

#include "env/direction.hpp"

namespace rulesnake {

// total = distance * dist + turn * turn_cost. Por defecto ambos pesan igual.
struct CostWeights {
  int distance = 1;
  int turn = 1;
};

struct ActionCandidate {
  Direction direction = Direction::Up;
  Position position{};  // celda proyectada de la cabeza
  int distance = 0;     // Manhattan hasta la comida
  int turn_cost = 0;    // 0 si sigue recto, 1 si gira
  int total_cost = 0;
  bool unsafe = false;

  // Anotaciones de lookahead; solo se calculan para candidatos seguros.
  bool eats = false;
  int path_length = -1;  // pasos A* hasta la comida, -1 sin camino
  int reachable_cells = 0;
  int body_length = 0;   // largo del cuerpo tras el movimiento
  bool isolated = false;
};

// Puntua las cuatro direcciones para el tick actual. La salida siempre sigue el
// orden fijo de kAllDirections, sin importar el costo, y no tiene efectos.
class PathPlanner {
 public:
  PathPlanner() = default;
  explicit PathPlanner(const CostWeights& weights) : weights_(weights) {}

  [[nodiscard]] std::vector<ActionCandidate> plan(const Position& head,
                                                  const Position& food,
                                                  const std::deque<Position>& snake_body,
                                                  Direction current_direction,
                                                  int board_size) const;

  [[nodiscard]] const CostWeights& weights() const { return weights_; }

 private:
  CostWeights weights_{};
};

}  // namespace rulesnake
