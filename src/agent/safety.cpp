#include "agent/safety.hpp"

#include "agent/grid_search.hpp"

namespace rulesnake {

bool is_unsafe(const Position& candidate,
               int board_size,
               const std::deque<Position>& snake_body,
               bool tail_vacates) {
  if (candidate.x < 0 || candidate.y < 0 || candidate.x >= board_size ||
      candidate.y >= board_size) {
    return true;
  }
  const std::size_t n = snake_body.size();
  for (std::size_t i = 0; i < n; ++i) {
    if (tail_vacates && i == n - 1) {
      continue;
    }
    if (snake_body[i] == candidate) {
      return true;
    }
  }
  return false;
}

std::deque<Position> advance_body(const std::deque<Position>& snake_body,
                                  const Position& new_head,
                                  bool grows) {
  std::deque<Position> out = snake_body;
  out.push_front(new_head);
  if (!grows && !out.empty()) {
    out.pop_back();
  }
  return out;
}

bool is_future_isolated(const Position& food,
                        int board_size,
                        const std::deque<Position>& snake_body) {
  if (snake_body.empty()) {
    return false;
  }
  const Position head = snake_body.front();
  if (has_path(head, food, board_size, snake_body)) {
    return false;
  }
  if (snake_body.size() > 1 && has_path(head, snake_body.back(), board_size, snake_body)) {
    return false;
  }
  return true;
}

RolloutResult simulate_moves(const std::deque<Position>& snake_body,
                             Direction direction,
                             const Position& food,
                             int board_size,
                             const std::vector<Direction>& moves,
                             int n_steps) {
  RolloutResult out;
  out.body = snake_body;
  out.direction = direction;
  if (out.body.empty()) {
    return out;
  }

  bool food_present = true;
  for (int i = 0; i < n_steps; ++i) {
    const Direction d =
        i < static_cast<int>(moves.size()) ? moves[static_cast<std::size_t>(i)] : out.direction;
    const Position next = moved(out.body.front(), d);
    const bool grows = food_present && next == food;

    if (is_unsafe(next, board_size, out.body, !grows)) {
      out.collided = true;
      break;
    }

    out.body = advance_body(out.body, next, grows);
    if (grows) {
      out.ate = true;
      food_present = false;
    }
    out.direction = d;
    ++out.steps_survived;
  }
  return out;
}

}  // namespace rulesnake
