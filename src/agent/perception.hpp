#pragma once

#include <deque>
#include <vector>

#include "env/direction.hpp"
#include "env/grid_world.hpp"

namespace rulesnake {

constexpr int kEmptyCell = 0;
constexpr int kSnakeCell = 1;
constexpr int kFoodCell = 2;

// Matriz size x size indexada [y][x].
using BoardMatrix = std::vector<std::vector<int>>;

// Codificacion derivada del estado; nunca lo modifica. Los segmentos
// solapados (solo posibles con un bug en otro lado) se resuelven con la
// ultima escritura. La comida se marca despues de los segmentos.
BoardMatrix encode(int board_size, const std::deque<Position>& snake_body, const Position& food);
BoardMatrix encode(const GridWorld& world);

}  // namespace rulesnake
