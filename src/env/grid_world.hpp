#pragma once

#include <cstdint>
#include <deque>
#include <random>
#include <vector>

#include "env/direction.hpp"

namespace rulesnake {

// Lado maximo del tablero; mantiene size*size y los indices de celda dentro de int.
constexpr int kMaxBoardSize = 1024;

enum class StepOutcome { Continue, Ate, Collided };

enum class CollisionKind { None, Wall, Self };

const char* to_string(StepOutcome o);
const char* to_string(CollisionKind k);

// Entorno de la serpiente: tablero size x size, cuerpo cabeza-a-cola, rumbo y comida.
// Durante un episodio el estado solo cambia a traves de step(); set_food y reset
// existen para armar escenarios. La comida se reubica con un mt19937 sembrado
// explicitamente para que los episodios sean reproducibles.
class GridWorld {
 public:
  // Layout inicial: cabeza en (size/2, size/2), cola justo debajo, rumbo UP.
  GridWorld(int board_size, uint32_t seed);
  // Estado explicito (pruebas y escenarios). Lanza ConfigError si el layout es invalido.
  GridWorld(int board_size,
            std::deque<Position> body,
            Direction direction,
            Position food,
            uint32_t seed);

  void reset(uint32_t seed);
  void reset();

  // Lanza std::logic_error si el episodio ya termino.
  StepOutcome step(Direction direction);

  [[nodiscard]] std::vector<Position> free_cells() const;
  // false si la celda esta fuera del tablero o sobre el cuerpo.
  bool set_food(const Position& p);

  [[nodiscard]] int board_size() const { return board_size_; }
  [[nodiscard]] Direction direction() const { return direction_; }
  [[nodiscard]] const std::deque<Position>& snake() const { return snake_; }
  [[nodiscard]] std::size_t snake_length() const { return snake_.size(); }
  [[nodiscard]] Position head() const { return snake_.front(); }
  [[nodiscard]] Position tail() const { return snake_.back(); }
  [[nodiscard]] Position food() const { return food_; }
  [[nodiscard]] bool has_food() const { return has_food_; }
  [[nodiscard]] int score() const { return score_; }
  [[nodiscard]] int steps() const { return steps_; }
  [[nodiscard]] bool is_done() const { return done_; }
  [[nodiscard]] bool is_won() const { return won_; }
  [[nodiscard]] CollisionKind last_collision() const { return last_collision_; }

  [[nodiscard]] bool in_bounds(const Position& p) const;

 private:
  int board_size_ = 10;
  int score_ = 0;
  int steps_ = 0;
  Direction direction_ = Direction::Up;

  bool done_ = false;
  bool won_ = false;
  bool has_food_ = false;
  CollisionKind last_collision_ = CollisionKind::None;

  std::deque<Position> snake_;
  Position food_{};

  std::mt19937 rng_;

  [[nodiscard]] bool hits_body(const Position& p) const;
  void spawn_food();
};

}  // namespace rulesnake
