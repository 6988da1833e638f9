#include "agent/planner.hpp"

#include "agent/grid_search.hpp"
#include "agent/safety.hpp"

namespace rulesnake {

std::vector<ActionCandidate> PathPlanner::plan(const Position& head,
                                               const Position& food,
                                               const std::deque<Position>& snake_body,
                                               Direction current_direction,
                                               int board_size) const {
  std::vector<ActionCandidate> out;
  out.reserve(kAllDirections.size());

  for (Direction d : kAllDirections) {
    ActionCandidate c;
    c.direction = d;
    c.position = moved(head, d);
    c.unsafe = is_unsafe(c.position, board_size, snake_body);
    c.distance = manhattan(c.position, food);
    c.turn_cost = d == current_direction ? 0 : 1;
    c.total_cost = weights_.distance * c.distance + weights_.turn * c.turn_cost;

    if (!c.unsafe) {
      c.eats = c.position == food;
      const std::deque<Position> next_body = advance_body(snake_body, c.position, c.eats);
      c.body_length = static_cast<int>(next_body.size());
      if (c.eats) {
        c.path_length = 0;
      } else {
        const std::vector<Position> path = a_star_path(c.position, food, board_size, next_body);
        c.path_length = path.empty() ? -1 : static_cast<int>(path.size()) - 1;
      }
      c.reachable_cells = reachable_area(c.position, board_size, next_body);
      c.isolated = is_future_isolated(food, board_size, next_body);
    }

    out.push_back(c);
  }
  return out;
}

}  // namespace rulesnake
