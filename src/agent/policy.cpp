#include "agent/policy.hpp"

#include "common/errors.hpp"

namespace rulesnake {
namespace {

// Recorre los seguros y se queda con el de menor costo. Empates: gana la
// direccion que aparece antes en kAllDirections.
template <typename CostFn>
Direction pick_min(const std::vector<ActionCandidate>& candidates, CostFn cost) {
  const ActionCandidate* best = nullptr;
  int best_cost = 0;
  for (const auto& c : candidates) {
    if (c.unsafe) {
      continue;
    }
    const int k = cost(c);
    if (best == nullptr || k < best_cost ||
        (k == best_cost && to_index(c.direction) < to_index(best->direction))) {
      best = &c;
      best_cost = k;
    }
  }
  if (best == nullptr) {
    throw NoSafeMove("sin movimientos seguros entre " + std::to_string(candidates.size()) +
                     " candidatos");
  }
  return best->direction;
}

}  // namespace

Direction Policy::act_with_board(const std::vector<ActionCandidate>& candidates,
                                 const BoardMatrix& /*board*/) const {
  return act(candidates);
}

Direction GreedyPolicy::act(const std::vector<ActionCandidate>& candidates) const {
  return pick_min(candidates, [](const ActionCandidate& c) { return c.total_cost; });
}

int LookaheadPolicy::score(const ActionCandidate& c) {
  int cost = kTurnWeight * c.turn_cost;
  cost += c.path_length >= 0 ? c.path_length : kNoPathCost;
  if (c.eats) {
    cost -= kEatBonus;
  }
  if (c.isolated && c.reachable_cells < 2 * c.body_length) {
    cost += kIsolationCost;
  }
  return cost;
}

Direction LookaheadPolicy::act(const std::vector<ActionCandidate>& candidates) const {
  return pick_min(candidates, &LookaheadPolicy::score);
}

std::unique_ptr<Policy> make_policy(const std::string& name) {
  if (name == "greedy") {
    return std::make_unique<GreedyPolicy>();
  }
  if (name == "lookahead") {
    return std::make_unique<LookaheadPolicy>();
  }
  throw ConfigError("politica desconocida: " + name);
}

std::vector<std::string> policy_names() { return {"greedy", "lookahead"}; }

}  // namespace rulesnake
