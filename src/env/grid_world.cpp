#include "env/grid_world.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <utility>

#include "common/errors.hpp"

namespace rulesnake {

const char* to_string(StepOutcome o) {
  switch (o) {
    case StepOutcome::Continue:
      return "Continue";
    case StepOutcome::Ate:
      return "Ate";
    case StepOutcome::Collided:
      return "Collided";
  }
  return "?";
}

const char* to_string(CollisionKind k) {
  switch (k) {
    case CollisionKind::None:
      return "None";
    case CollisionKind::Wall:
      return "Wall";
    case CollisionKind::Self:
      return "Self";
  }
  return "?";
}

GridWorld::GridWorld(int board_size, uint32_t seed) : board_size_(board_size), rng_(seed) {
  if (board_size_ <= 1) {
    throw ConfigError("board_size debe ser >= 2 (recibido " + std::to_string(board_size_) + ")");
  }
  if (board_size_ > kMaxBoardSize) {
    throw ConfigError("board_size debe ser <= " + std::to_string(kMaxBoardSize) + " (recibido " +
                      std::to_string(board_size_) + ")");
  }
  reset();
}

GridWorld::GridWorld(int board_size,
                     std::deque<Position> body,
                     Direction direction,
                     Position food,
                     uint32_t seed)
    : board_size_(board_size), direction_(direction), snake_(std::move(body)), rng_(seed) {
  if (board_size_ <= 0) {
    throw ConfigError("board_size debe ser > 0 (recibido " + std::to_string(board_size_) + ")");
  }
  if (board_size_ > kMaxBoardSize) {
    throw ConfigError("board_size debe ser <= " + std::to_string(kMaxBoardSize) + " (recibido " +
                      std::to_string(board_size_) + ")");
  }
  if (snake_.empty()) {
    throw ConfigError("el cuerpo de la serpiente no puede estar vacio");
  }
  for (std::size_t i = 0; i < snake_.size(); ++i) {
    if (!in_bounds(snake_[i])) {
      throw ConfigError("segmento fuera del tablero en indice " + std::to_string(i));
    }
    for (std::size_t j = 0; j < i; ++j) {
      if (snake_[j] == snake_[i]) {
        throw ConfigError("segmentos duplicados en indice " + std::to_string(i));
      }
    }
    // Segmentos consecutivos deben ser vecinos ortogonales.
    if (i > 0) {
      const int dx = std::abs(snake_[i].x - snake_[i - 1].x);
      const int dy = std::abs(snake_[i].y - snake_[i - 1].y);
      if (dx + dy != 1) {
        throw ConfigError("cuerpo no contiguo en indice " + std::to_string(i));
      }
    }
  }
  if (!set_food(food)) {
    throw ConfigError("comida fuera del tablero o sobre el cuerpo");
  }
}

void GridWorld::reset(uint32_t seed) {
  rng_.seed(seed);
  reset();
}

void GridWorld::reset() {
  done_ = false;
  won_ = false;
  score_ = 0;
  steps_ = 0;
  last_collision_ = CollisionKind::None;
  direction_ = Direction::Up;

  // En 10x10 queda [(5,5), (5,6)].
  const int cx = board_size_ / 2;
  int cy = board_size_ / 2;
  if (cy + 1 >= board_size_) {
    cy = board_size_ - 2;
  }
  snake_.clear();
  snake_.push_back({cx, cy});
  snake_.push_back({cx, cy + 1});

  spawn_food();
}

bool GridWorld::in_bounds(const Position& p) const {
  return p.x >= 0 && p.y >= 0 && p.x < board_size_ && p.y < board_size_;
}

bool GridWorld::hits_body(const Position& p) const {
  for (const auto& s : snake_) {
    if (s == p) {
      return true;
    }
  }
  return false;
}

StepOutcome GridWorld::step(Direction direction) {
  if (done_) {
    throw std::logic_error("step() sobre un episodio terminado");
  }

  const Position h2 = moved(snake_.front(), direction);
  const bool grow = has_food_ && h2 == food_;

  if (!in_bounds(h2)) {
    done_ = true;
    last_collision_ = CollisionKind::Wall;
    return StepOutcome::Collided;
  }

  // Si no crece, la cola se mueve y no cuenta como colision.
  for (std::size_t i = 0; i < snake_.size(); ++i) {
    if (!grow && i == snake_.size() - 1) {
      continue;
    }
    if (snake_[i] == h2) {
      done_ = true;
      last_collision_ = CollisionKind::Self;
      return StepOutcome::Collided;
    }
  }

  direction_ = direction;
  snake_.push_front(h2);
  ++steps_;

  if (!grow) {
    snake_.pop_back();
    return StepOutcome::Continue;
  }

  ++score_;
  spawn_food();
  return StepOutcome::Ate;
}

std::vector<Position> GridWorld::free_cells() const {
  std::vector<Position> out;
  const auto n = static_cast<std::size_t>(board_size_);
  out.reserve(n * n);
  for (int y = 0; y < board_size_; ++y) {
    for (int x = 0; x < board_size_; ++x) {
      Position p{x, y};
      if (!hits_body(p)) {
        out.push_back(p);
      }
    }
  }
  return out;
}

bool GridWorld::set_food(const Position& p) {
  if (!in_bounds(p) || hits_body(p)) {
    return false;
  }
  food_ = p;
  has_food_ = true;
  return true;
}

void GridWorld::spawn_food() {
  std::vector<Position> free = free_cells();
  if (free.empty()) {
    // Tablero lleno: no hay donde poner comida, la partida esta ganada.
    has_food_ = false;
    done_ = true;
    won_ = true;
    return;
  }
  std::uniform_int_distribution<int> dist(0, static_cast<int>(free.size() - 1));
  food_ = free[static_cast<std::size_t>(dist(rng_))];
  has_food_ = true;
}

}  // namespace rulesnake
