#pragma once

#include <deque>
#include <vector>

#include "env/direction.hpp"

namespace rulesnake {

// Restricciones duras sobre una posicion candidata para la nueva cabeza.
//
// Inseguro si sale de [0, size) en algun eje o cae sobre el cuerpo. La celda
// de la cola queda exenta cuando tail_vacates es true: en un paso sin comer la
// cola se mueve en el mismo tick, igual que en GridWorld::step. La comida
// nunca esta sobre el cuerpo, asi que la cola solo se queda quieta si la
// propia celda candidata es comida, y eso no puede coincidir con la cola.
[[nodiscard]] bool is_unsafe(const Position& candidate,
                             int board_size,
                             const std::deque<Position>& snake_body,
                             bool tail_vacates = true);

// Cuerpo resultante de mover la cabeza a new_head (sin validar).
std::deque<Position> advance_body(const std::deque<Position>& snake_body,
                                  const Position& new_head,
                                  bool grows);

// La cabeza queda aislada si no alcanza ni la comida ni su propia cola.
// snake_body es el cuerpo despues del movimiento.
[[nodiscard]] bool is_future_isolated(const Position& food,
                                      int board_size,
                                      const std::deque<Position>& snake_body);

struct RolloutResult {
  bool collided = false;
  bool ate = false;
  int steps_survived = 0;
  std::deque<Position> body;
  Direction direction = Direction::Up;
};

// Aplica moves sobre una copia del cuerpo durante n_steps ticks, siguiendo
// recto cuando se acaba la secuencia. La comida comida no se repone.
RolloutResult simulate_moves(const std::deque<Position>& snake_body,
                             Direction direction,
                             const Position& food,
                             int board_size,
                             const std::vector<Direction>& moves,
                             int n_steps);

}  // namespace rulesnake
