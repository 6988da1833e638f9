#include <cassert>
#include <iostream>
#include <vector>

#include "agent/grid_search.hpp"
#include "agent/perception.hpp"
#include "agent/planner.hpp"
#include "agent/policy.hpp"
#include "agent/safety.hpp"
#include "common/errors.hpp"
#include "env/grid_world.hpp"

using namespace rulesnake;

namespace {

template <typename E, typename Fn>
bool throws(Fn fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

ActionCandidate safe_candidate(Direction d, int total) {
  ActionCandidate c;
  c.direction = d;
  c.total_cost = total;
  return c;
}

ActionCandidate unsafe_candidate(Direction d) {
  ActionCandidate c;
  c.direction = d;
  c.unsafe = true;
  return c;
}

}  // namespace

int main() {
  {
    // Fuera del tablero o sobre el cuerpo es inseguro; la cola queda exenta.
    const std::deque<Position> body{{5, 5}, {5, 6}, {5, 7}};
    assert(is_unsafe({-1, 5}, 10, body));
    assert(is_unsafe({10, 5}, 10, body));
    assert(is_unsafe({5, -1}, 10, body));
    assert(is_unsafe({5, 10}, 10, body));
    assert(is_unsafe({5, 6}, 10, body));
    assert(is_unsafe({5, 5}, 10, body));
    assert(!is_unsafe({5, 7}, 10, body));
    assert(is_unsafe({5, 7}, 10, body, false));
    assert(!is_unsafe({4, 5}, 10, body));
  }

  {
    assert(manhattan({0, 0}, {3, 4}) == 7);

    const std::deque<Position> body{{2, 2}, {2, 3}, {2, 4}};
    auto to_food = a_star_path({2, 2}, {0, 0}, 10, body);
    assert(to_food.size() == 5);
    assert((to_food.front() == Position{2, 2}));
    assert((to_food.back() == Position{0, 0}));

    // La cola como destino no es obstaculo; hay que rodear (2,3).
    auto to_tail = a_star_path({2, 2}, {2, 4}, 10, body);
    assert(to_tail.size() == 5);
    assert((to_tail.back() == Position{2, 4}));
    assert(has_path({2, 2}, {2, 4}, 10, body));

    // Columna central bloqueada en 3x3.
    const std::deque<Position> wall{{1, 0}, {1, 1}, {1, 2}};
    assert(a_star_path({0, 1}, {2, 1}, 3, wall).empty());
    assert(!has_path({0, 1}, {2, 1}, 3, wall));
    assert(reachable_area({0, 1}, 3, wall) == 3);
    assert(reachable_area({0, 0}, 4, {}) == 16);
  }

  {
    // Cabeza encerrada sin acceso a comida ni cola.
    const std::deque<Position> trapped{{0, 0}, {1, 0}, {1, 1}, {0, 1}, {0, 2}};
    assert(is_future_isolated({2, 2}, 3, trapped));
    const std::deque<Position> open{{5, 5}, {5, 6}, {5, 7}};
    assert(!is_future_isolated({0, 0}, 10, open));

    auto grown = advance_body(open, {5, 4}, true);
    assert(grown.size() == 4 && (grown.front() == Position{5, 4}));
    auto shifted = advance_body(open, {5, 4}, false);
    assert(shifted.size() == 3 && (shifted.back() == Position{5, 6}));
  }

  {
    const std::deque<Position> body{{2, 2}, {2, 3}};
    RolloutResult r =
        simulate_moves(body, Direction::Up, {0, 0}, 5, {Direction::Right, Direction::Right}, 2);
    assert(!r.collided);
    assert(r.steps_survived == 2);
    assert((r.body.front() == Position{4, 2}));

    // Sigue recto tras la secuencia y choca con la pared.
    r = simulate_moves(body, Direction::Up, {0, 0}, 5, {Direction::Right, Direction::Right}, 3);
    assert(r.collided);
    assert(r.steps_survived == 2);

    r = simulate_moves(body, Direction::Up, {3, 2}, 5, {Direction::Right}, 1);
    assert(r.ate);
    assert(r.body.size() == 3);
  }

  {
    const std::deque<Position> body{{2, 2}, {2, 3}};
    BoardMatrix b = encode(5, body, {0, 0});
    assert(b.size() == 5 && b[0].size() == 5);
    assert(b[2][2] == kSnakeCell);
    assert(b[3][2] == kSnakeCell);
    assert(b[0][0] == kFoodCell);
    int marked = 0;
    for (const auto& row : b) {
      for (int v : row) {
        if (v != kEmptyCell) ++marked;
      }
    }
    assert(marked == 3);
    assert(encode(5, body, {0, 0}) == b);

    GridWorld world(5, body, Direction::Up, {0, 0}, 3);
    assert(encode(world) == b);
    assert(encode(world) == encode(world));
  }

  {
    // Escenario 10x10: serpiente [(5,5),(5,6)] rumbo UP, comida en (2,2).
    const std::deque<Position> body{{5, 5}, {5, 6}};
    PathPlanner planner;
    auto cands = planner.plan({5, 5}, {2, 2}, body, Direction::Up, 10);
    assert(cands.size() == 4);

    assert(cands[0].direction == Direction::Up);
    assert((cands[0].position == Position{5, 4}));
    assert(cands[0].distance == 5 && cands[0].turn_cost == 0 && cands[0].total_cost == 5);
    assert(!cands[0].unsafe);

    // DOWN entra en la cola, que se libera este tick.
    assert(cands[1].direction == Direction::Down);
    assert(cands[1].distance == 7 && cands[1].turn_cost == 1 && cands[1].total_cost == 8);
    assert(!cands[1].unsafe);

    assert(cands[2].direction == Direction::Left);
    assert((cands[2].position == Position{4, 5}));
    assert(cands[2].distance == 5 && cands[2].turn_cost == 1 && cands[2].total_cost == 6);
    assert(!cands[2].unsafe);

    assert(cands[3].direction == Direction::Right);
    assert(cands[3].distance == 7 && cands[3].turn_cost == 1 && cands[3].total_cost == 8);
    assert(!cands[3].unsafe);

    assert(cands[0].path_length == 5);
    assert(cands[0].body_length == 2);
    assert(cands[0].reachable_cells == 99);
    assert(!cands[0].isolated);
    assert(!cands[0].eats);

    GreedyPolicy greedy;
    assert(greedy.act(cands) == Direction::Up);

    // Determinismo: mismas entradas, mismos candidatos.
    auto again = planner.plan({5, 5}, {2, 2}, body, Direction::Up, 10);
    for (std::size_t i = 0; i < cands.size(); ++i) {
      assert(again[i].direction == cands[i].direction);
      assert(again[i].total_cost == cands[i].total_cost);
      assert(again[i].unsafe == cands[i].unsafe);
      assert(again[i].path_length == cands[i].path_length);
    }

    PathPlanner turn_heavy(CostWeights{1, 10});
    auto weighted = turn_heavy.plan({5, 5}, {2, 2}, body, Direction::Up, 10);
    assert(weighted[0].total_cost == 5);
    assert(weighted[2].total_cost == 15);
  }

  {
    // Empate: gana el primero en el orden de enumeracion.
    GreedyPolicy greedy;
    std::vector<ActionCandidate> cands{safe_candidate(Direction::Right, 6),
                                       safe_candidate(Direction::Left, 6),
                                       unsafe_candidate(Direction::Up),
                                       safe_candidate(Direction::Down, 9)};
    assert(greedy.act(cands) == Direction::Left);
    assert(greedy.act(cands) == Direction::Left);

    // Un inseguro con costo menor nunca se elige.
    cands[2].total_cost = 0;
    assert(greedy.act(cands) == Direction::Left);

    std::vector<ActionCandidate> none{unsafe_candidate(Direction::Up),
                                      unsafe_candidate(Direction::Down),
                                      unsafe_candidate(Direction::Left),
                                      unsafe_candidate(Direction::Right)};
    assert(throws<NoSafeMove>([&] { greedy.act(none); }));
    assert(throws<NoSafeMove>([&] { greedy.act({}); }));

    assert(!greedy.needs_board());
    assert(greedy.act_with_board(cands, BoardMatrix{}) == Direction::Left);
  }

  {
    // Encerrada con una sola celda libre: ningun vecino es seguro.
    const std::deque<Position> body{{0, 0}, {1, 0}, {2, 0}, {2, 1},
                                    {1, 1}, {0, 1}, {0, 2}, {1, 2}};
    auto cands = PathPlanner().plan({0, 0}, {2, 2}, body, Direction::Left, 3);
    for (const auto& c : cands) {
      assert(c.unsafe);
    }
    assert(throws<NoSafeMove>([&] { GreedyPolicy().act(cands); }));
    assert(throws<NoSafeMove>([&] { LookaheadPolicy().act(cands); }));
  }

  {
    ActionCandidate c;
    c.turn_cost = 1;
    c.path_length = 3;
    c.body_length = 3;
    assert(LookaheadPolicy::score(c) == 8);
    c.path_length = -1;
    assert(LookaheadPolicy::score(c) == 1005);
    c.isolated = true;
    c.reachable_cells = 2;
    assert(LookaheadPolicy::score(c) == 1505);
    c.reachable_cells = 6;
    assert(LookaheadPolicy::score(c) == 1005);

    ActionCandidate eat;
    eat.eats = true;
    eat.path_length = 0;
    assert(LookaheadPolicy::score(eat) == -100);

    // Comida a la izquierda: girar y comer gana aunque cueste un giro.
    const std::deque<Position> body{{1, 1}, {1, 2}};
    auto cands = PathPlanner().plan({1, 1}, {0, 1}, body, Direction::Up, 10);
    assert(cands[2].eats);
    assert(LookaheadPolicy().act(cands) == Direction::Left);
    assert(GreedyPolicy().act(cands) == Direction::Left);
  }

  {
    assert(make_policy("greedy")->name() == "greedy");
    assert(make_policy("lookahead")->name() == "lookahead");
    assert(throws<ConfigError>([] { make_policy("neural"); }));
    assert(policy_names().size() == 2);
  }

  std::cout << "test_agent: OK\n";
  return 0;
}
