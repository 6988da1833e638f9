#include <cassert>
#include <iostream>
#include <stdexcept>

#include "common/errors.hpp"
#include "env/direction.hpp"
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

bool contains(const std::deque<Position>& body, const Position& p) {
  for (const auto& s : body) {
    if (s == p) return true;
  }
  return false;
}

}  // namespace

int main() {
  {
    // Acciones: conjunto cerrado de cuatro valores.
    assert(to_index(Direction::Up) == 0 && to_index(Direction::Right) == 3);
    assert(direction_from_index(2) == Direction::Left);
    assert(throws<InvalidAction>([] { direction_from_index(4); }));
    assert(throws<InvalidAction>([] { direction_from_index(-1); }));
    assert(throws<InvalidAction>([] { parse_direction("NORTH"); }));
    assert(parse_direction("DOWN") == Direction::Down);
    assert(delta(Direction::Up).y == -1 && delta(Direction::Right).x == 1);
    assert(opposite(Direction::Left) == Direction::Right);
    assert(absolute_direction(Direction::Right, RelativeAction::TurnLeft) == Direction::Up);
    assert(absolute_direction(Direction::Up, RelativeAction::TurnRight) == Direction::Right);
    assert(absolute_direction(Direction::Down, RelativeAction::Straight) == Direction::Down);
  }

  {
    // Layout por defecto en 10x10.
    GridWorld env(10, 123);
    assert(env.snake_length() == 2);
    assert((env.head() == Position{5, 5}));
    assert((env.tail() == Position{5, 6}));
    assert(env.direction() == Direction::Up);
    assert(env.has_food());
    assert(env.in_bounds(env.food()));
    assert(!contains(env.snake(), env.food()));
  }

  {
    // Misma semilla, misma comida.
    GridWorld a(10, 7);
    GridWorld b(10, 7);
    assert(a.food() == b.food());
  }

  {
    // Tableros invalidos.
    assert(throws<ConfigError>([] { GridWorld w(0, 1); }));
    assert(throws<ConfigError>([] { GridWorld w(1, 1); }));
    assert(throws<ConfigError>([] { GridWorld w(-3, 1); }));
    assert(throws<ConfigError>(
        [] { GridWorld w(5, {{1, 1}, {1, 2}}, Direction::Up, Position{1, 2}, 1); }));
    assert(throws<ConfigError>(
        [] { GridWorld w(5, {{1, 1}, {1, 1}}, Direction::Up, Position{0, 0}, 1); }));
    assert(throws<ConfigError>(
        [] { GridWorld w(5, {{5, 1}}, Direction::Up, Position{0, 0}, 1); }));
    // Cuerpo no contiguo: la cola no podria avanzar una sola celda.
    assert(throws<ConfigError>(
        [] { GridWorld w(5, {{0, 0}, {3, 3}}, Direction::Up, Position{4, 4}, 1); }));
    assert(throws<ConfigError>(
        [] { GridWorld w(5, {{1, 1}, {2, 2}}, Direction::Up, Position{4, 4}, 1); }));
    // Lado maximo: size*size no debe desbordar int.
    assert(throws<ConfigError>([] { GridWorld w(kMaxBoardSize + 1, 1); }));
    assert(throws<ConfigError>([] { GridWorld w(50000, 1); }));
    assert(throws<ConfigError>(
        [] { GridWorld w(50000, {{0, 0}, {0, 1}}, Direction::Up, Position{1, 1}, 1); }));
  }

  {
    // Accion fuera del conjunto: InvalidAction y el estado no cambia.
    GridWorld env(10, {{5, 5}, {5, 6}, {5, 7}}, Direction::Up, Position{0, 0}, 1);
    const std::deque<Position> before = env.snake();
    assert(throws<InvalidAction>([&] { env.step(static_cast<Direction>(7)); }));
    assert(env.snake() == before);
    assert(env.direction() == Direction::Up);
    assert(env.steps() == 0);
    assert(env.score() == 0);
    assert(!env.is_done());
    assert(env.step(Direction::Up) == StepOutcome::Continue);
  }

  {
    // Continue: largo constante, la cola avanza una celda.
    GridWorld env(10, {{5, 5}, {5, 6}, {5, 7}}, Direction::Up, Position{0, 0}, 1);
    StepOutcome st = env.step(Direction::Up);
    assert(st == StepOutcome::Continue);
    assert(env.snake_length() == 3);
    assert((env.head() == Position{5, 4}));
    assert((env.tail() == Position{5, 6}));
    assert(env.steps() == 1);
    assert(env.score() == 0);
  }

  {
    // Ate: crece en uno y la comida se reubica fuera del cuerpo.
    GridWorld env(5, {{2, 2}, {2, 3}}, Direction::Up, Position{2, 1}, 99);
    StepOutcome st = env.step(Direction::Up);
    assert(st == StepOutcome::Ate);
    assert(env.snake_length() == 3);
    assert(env.score() == 1);
    assert((env.tail() == Position{2, 3}));
    assert(env.has_food());
    assert(!contains(env.snake(), env.food()));
    assert(!env.is_done());
  }

  {
    // Choque contra la pared: el estado no cambia y el episodio termina.
    GridWorld env(3, {{0, 1}, {1, 1}}, Direction::Left, Position{2, 2}, 1);
    StepOutcome st = env.step(Direction::Left);
    assert(st == StepOutcome::Collided);
    assert(env.last_collision() == CollisionKind::Wall);
    assert(env.is_done());
    assert(!env.is_won());
    assert((env.head() == Position{0, 1}));
    assert(env.snake_length() == 2);
    assert(throws<std::logic_error>([&] { env.step(Direction::Up); }));
  }

  {
    // Choque contra un segmento que no es la cola.
    GridWorld env(5, {{2, 2}, {2, 3}, {3, 3}, {3, 2}, {3, 1}}, Direction::Up, Position{0, 0}, 1);
    StepOutcome st = env.step(Direction::Right);
    assert(st == StepOutcome::Collided);
    assert(env.last_collision() == CollisionKind::Self);
  }

  {
    // Entrar en la celda de la cola en un paso sin comer es valido.
    GridWorld env(5, {{1, 1}, {2, 1}, {2, 2}, {1, 2}}, Direction::Up, Position{4, 4}, 1);
    StepOutcome st = env.step(Direction::Down);
    assert(st == StepOutcome::Continue);
    assert((env.head() == Position{1, 2}));
    assert((env.tail() == Position{2, 2}));
  }

  {
    // Tablero lleno tras comer: partida ganada.
    GridWorld env(2, {{0, 0}, {1, 0}, {1, 1}}, Direction::Left, Position{0, 1}, 1);
    StepOutcome st = env.step(Direction::Down);
    assert(st == StepOutcome::Ate);
    assert(env.is_done());
    assert(env.is_won());
    assert(!env.has_food());
    assert(env.snake_length() == 4);
    assert(env.free_cells().empty());
  }

  {
    GridWorld env(10, 123);
    assert(!env.set_food(env.head()));
    assert(!env.set_food({10, 0}));
    assert(env.set_food({0, 0}));
    assert((env.food() == Position{0, 0}));

    env.step(Direction::Left);
    env.reset(5);
    assert(env.steps() == 0);
    assert(env.snake_length() == 2);
    assert(env.direction() == Direction::Up);
  }

  std::cout << "test_env: OK\n";
  return 0;
}
