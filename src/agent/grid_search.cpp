#include "agent/grid_search.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <queue>

namespace rulesnake {
namespace {

bool inside(const Position& p, int n) { return p.x >= 0 && p.y >= 0 && p.x < n && p.y < n; }

std::size_t cell_index(const Position& p, int n) {
  const auto side = static_cast<std::size_t>(n);
  return static_cast<std::size_t>(p.y) * side + static_cast<std::size_t>(p.x);
}

std::vector<uint8_t> obstacle_grid(int n, const std::deque<Position>& body) {
  const auto side = static_cast<std::size_t>(n);
  std::vector<uint8_t> grid(side * side, 0);
  for (const auto& s : body) {
    if (inside(s, n)) {
      grid[cell_index(s, n)] = 1;
    }
  }
  return grid;
}

struct OpenNode {
  int f = 0;
  int g = 0;
  long order = 0;  // FIFO entre empates: el resultado no depende del heap
  Position cell{};
};

struct OpenCompare {
  bool operator()(const OpenNode& a, const OpenNode& b) const {
    if (a.f != b.f) return a.f > b.f;
    if (a.g != b.g) return a.g < b.g;
    return a.order > b.order;
  }
};

}  // namespace

int manhattan(const Position& a, const Position& b) {
  return std::abs(a.x - b.x) + std::abs(a.y - b.y);
}

std::vector<Position> a_star_path(const Position& start,
                                  const Position& goal,
                                  int board_size,
                                  const std::deque<Position>& body) {
  const int n = board_size;
  if (!inside(start, n) || !inside(goal, n)) {
    return {};
  }

  std::vector<uint8_t> blocked = obstacle_grid(n, body);
  blocked[cell_index(start, n)] = 0;
  blocked[cell_index(goal, n)] = 0;

  const std::size_t cells = static_cast<std::size_t>(n) * static_cast<std::size_t>(n);
  std::vector<int> g_score(cells, -1);
  std::vector<int> came_from(cells, -1);
  std::vector<uint8_t> closed(cells, 0);

  std::priority_queue<OpenNode, std::vector<OpenNode>, OpenCompare> open;
  long order = 0;
  g_score[cell_index(start, n)] = 0;
  open.push({manhattan(start, goal), 0, order++, start});

  while (!open.empty()) {
    const OpenNode cur = open.top();
    open.pop();
    const std::size_t ci = cell_index(cur.cell, n);
    if (closed[ci]) {
      continue;
    }
    closed[ci] = 1;

    if (cur.cell == goal) {
      std::vector<Position> path;
      for (int idx = static_cast<int>(ci); idx != -1; idx = came_from[static_cast<std::size_t>(idx)]) {
        path.push_back({idx % n, idx / n});
      }
      std::reverse(path.begin(), path.end());
      return path;
    }

    for (Direction d : kAllDirections) {
      const Position nb = moved(cur.cell, d);
      if (!inside(nb, n)) {
        continue;
      }
      const std::size_t ni = cell_index(nb, n);
      if (blocked[ni] || closed[ni]) {
        continue;
      }
      const int g2 = cur.g + 1;
      if (g_score[ni] == -1 || g2 < g_score[ni]) {
        g_score[ni] = g2;
        came_from[ni] = static_cast<int>(ci);
        open.push({g2 + manhattan(nb, goal), g2, order++, nb});
      }
    }
  }

  return {};
}

bool has_path(const Position& start,
              const Position& goal,
              int board_size,
              const std::deque<Position>& body) {
  const int n = board_size;
  if (!inside(start, n) || !inside(goal, n)) {
    return false;
  }
  if (start == goal) {
    return true;
  }

  std::vector<uint8_t> blocked = obstacle_grid(n, body);
  blocked[cell_index(goal, n)] = 0;
  blocked[cell_index(start, n)] = 1;  // visitado

  std::deque<Position> q{start};
  while (!q.empty()) {
    const Position cur = q.front();
    q.pop_front();
    for (Direction d : kAllDirections) {
      const Position nb = moved(cur, d);
      if (!inside(nb, n)) {
        continue;
      }
      const std::size_t ni = cell_index(nb, n);
      if (blocked[ni]) {
        continue;
      }
      if (nb == goal) {
        return true;
      }
      blocked[ni] = 1;
      q.push_back(nb);
    }
  }
  return false;
}

int reachable_area(const Position& start, int board_size, const std::deque<Position>& body) {
  const int n = board_size;
  if (!inside(start, n)) {
    return 0;
  }

  std::vector<uint8_t> blocked = obstacle_grid(n, body);
  blocked[cell_index(start, n)] = 1;

  int count = 0;
  std::deque<Position> q{start};
  while (!q.empty()) {
    const Position cur = q.front();
    q.pop_front();
    ++count;
    for (Direction d : kAllDirections) {
      const Position nb = moved(cur, d);
      if (!inside(nb, n)) {
        continue;
      }
      const std::size_t ni = cell_index(nb, n);
      if (blocked[ni]) {
        continue;
      }
      blocked[ni] = 1;
      q.push_back(nb);
    }
  }
  return count;
}

}  // namespace rulesnake
