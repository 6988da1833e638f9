#include "agent/perception.hpp"

namespace rulesnake {
namespace {

bool inside(const Position& p, int n) { return p.x >= 0 && p.y >= 0 && p.x < n && p.y < n; }

}  // namespace

BoardMatrix encode(int board_size, const std::deque<Position>& snake_body, const Position& food) {
  const std::size_t n = static_cast<std::size_t>(board_size > 0 ? board_size : 0);
  BoardMatrix board(n, std::vector<int>(n, kEmptyCell));

  for (const auto& s : snake_body) {
    if (inside(s, board_size)) {
      board[static_cast<std::size_t>(s.y)][static_cast<std::size_t>(s.x)] = kSnakeCell;
    }
  }
  if (inside(food, board_size)) {
    board[static_cast<std::size_t>(food.y)][static_cast<std::size_t>(food.x)] = kFoodCell;
  }
  return board;
}

BoardMatrix encode(const GridWorld& world) {
  if (!world.has_food()) {
    // Tablero lleno: no hay celda de comida que marcar.
    return encode(world.board_size(), world.snake(), Position{-1, -1});
  }
  return encode(world.board_size(), world.snake(), world.food());
}

}  // namespace rulesnake
