#pragma once

#include <array>
#include <string>

namespace rulesnake {

// x crece a la derecha, y crece hacia abajo; (0,0) es la esquina superior izquierda.
struct Position {
  int x = 0;
  int y = 0;
};

inline bool operator==(const Position& a, const Position& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Position& a, const Position& b) { return !(a == b); }

// Espacio de acciones cerrado. El orden de declaracion es el orden fijo de
// enumeracion que usan el planner y los desempates de las politicas.
enum class Direction { Up = 0, Down = 1, Left = 2, Right = 3 };

constexpr int kNumDirections = 4;
constexpr std::array<Direction, kNumDirections> kAllDirections{
    Direction::Up, Direction::Down, Direction::Left, Direction::Right};

// Acciones relativas al rumbo actual.
enum class RelativeAction { Straight, TurnLeft, TurnRight };

Position delta(Direction d);
Position moved(const Position& p, Direction d);
Direction opposite(Direction d);
Direction absolute_direction(Direction current, RelativeAction rel);

int to_index(Direction d);
// Lanzan InvalidAction fuera del conjunto de cuatro valores.
Direction direction_from_index(int index);
Direction parse_direction(const std::string& name);

const char* to_string(Direction d);

}  // namespace rulesnake
