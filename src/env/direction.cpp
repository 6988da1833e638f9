#include "env/direction.hpp"

#include "common/errors.hpp"

namespace rulesnake {

Position delta(Direction d) {
  switch (d) {
    case Direction::Up:
      return {0, -1};
    case Direction::Down:
      return {0, 1};
    case Direction::Left:
      return {-1, 0};
    case Direction::Right:
      return {1, 0};
  }
  throw InvalidAction("direccion invalida: " + std::to_string(static_cast<int>(d)));
}

Position moved(const Position& p, Direction d) {
  const Position off = delta(d);
  return {p.x + off.x, p.y + off.y};
}

Direction opposite(Direction d) {
  switch (d) {
    case Direction::Up:
      return Direction::Down;
    case Direction::Down:
      return Direction::Up;
    case Direction::Left:
      return Direction::Right;
    case Direction::Right:
      return Direction::Left;
  }
  throw InvalidAction("direccion invalida: " + std::to_string(static_cast<int>(d)));
}

Direction absolute_direction(Direction current, RelativeAction rel) {
  if (rel == RelativeAction::Straight) {
    return current;
  }
  const bool left = rel == RelativeAction::TurnLeft;
  switch (current) {
    case Direction::Up:
      return left ? Direction::Left : Direction::Right;
    case Direction::Down:
      return left ? Direction::Right : Direction::Left;
    case Direction::Left:
      return left ? Direction::Down : Direction::Up;
    case Direction::Right:
      return left ? Direction::Up : Direction::Down;
  }
  throw InvalidAction("direccion invalida: " + std::to_string(static_cast<int>(current)));
}

int to_index(Direction d) { return static_cast<int>(d); }

Direction direction_from_index(int index) {
  if (index < 0 || index >= kNumDirections) {
    throw InvalidAction("indice de accion fuera de rango: " + std::to_string(index));
  }
  return kAllDirections[static_cast<std::size_t>(index)];
}

Direction parse_direction(const std::string& name) {
  if (name == "UP" || name == "up") return Direction::Up;
  if (name == "DOWN" || name == "down") return Direction::Down;
  if (name == "LEFT" || name == "left") return Direction::Left;
  if (name == "RIGHT" || name == "right") return Direction::Right;
  throw InvalidAction("accion desconocida: " + name);
}

const char* to_string(Direction d) {
  switch (d) {
    case Direction::Up:
      return "UP";
    case Direction::Down:
      return "DOWN";
    case Direction::Left:
      return "LEFT";
    case Direction::Right:
      return "RIGHT";
  }
  return "?";
}

}  // namespace rulesnake
