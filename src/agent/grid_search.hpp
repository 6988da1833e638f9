#pragma once

#include <deque>
#include <vector>

#include "env/direction.hpp"

namespace rulesnake {

// Busquedas sobre el tablero con el cuerpo de la serpiente como obstaculo.

[[nodiscard]] int manhattan(const Position& a, const Position& b);

// Camino mas corto (A*, heuristica Manhattan) de start a goal. Incluye ambos
// extremos; vacio si no existe. start y goal no cuentan como obstaculos, asi
// que sirve tambien para buscar la propia cola.
std::vector<Position> a_star_path(const Position& start,
                                  const Position& goal,
                                  int board_size,
                                  const std::deque<Position>& body);

[[nodiscard]] bool has_path(const Position& start,
                            const Position& goal,
                            int board_size,
                            const std::deque<Position>& body);

// Celdas alcanzables desde start (incluida) por flood fill.
[[nodiscard]] int reachable_area(const Position& start,
                                 int board_size,
                                 const std::deque<Position>& body);

}  // namespace rulesnake
