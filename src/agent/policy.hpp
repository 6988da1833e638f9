#pragma once

#include <memory>
#include <string>
#include <vector>

#include "agent/perception.hpp"
#include "agent/planner.hpp"

namespace rulesnake {

// Contrato de decision: elige una direccion a partir de los candidatos del
// planner. Las implementaciones no guardan estado entre llamadas, asi que una
// misma instancia puede compartirse entre workers.
class Policy {
 public:
  virtual ~Policy() = default;

  // Lanza NoSafeMove si todos los candidatos son inseguros.
  virtual Direction act(const std::vector<ActionCandidate>& candidates) const = 0;

  // Politicas que necesitan el tablero codificado (p. ej. un puntuador
  // aprendido) devuelven true y sobreescriben act_with_board.
  [[nodiscard]] virtual bool needs_board() const { return false; }
  virtual Direction act_with_board(const std::vector<ActionCandidate>& candidates,
                                   const BoardMatrix& board) const;

  [[nodiscard]] virtual std::string name() const = 0;
};

// Menor total_cost entre los seguros; empate por orden de enumeracion.
class GreedyPolicy : public Policy {
 public:
  Direction act(const std::vector<ActionCandidate>& candidates) const override;
  [[nodiscard]] std::string name() const override { return "greedy"; }
};

// Usa las anotaciones de lookahead: largo del camino A*, bono por comer y
// castigo por quedar encerrado en un area chica.
class LookaheadPolicy : public Policy {
 public:
  static constexpr int kTurnWeight = 5;
  static constexpr int kNoPathCost = 1000;
  static constexpr int kEatBonus = 100;
  static constexpr int kIsolationCost = 500;

  Direction act(const std::vector<ActionCandidate>& candidates) const override;
  [[nodiscard]] std::string name() const override { return "lookahead"; }

  [[nodiscard]] static int score(const ActionCandidate& c);
};

// "greedy" | "lookahead"; lanza ConfigError con cualquier otro nombre.
std::unique_ptr<Policy> make_policy(const std::string& name);
std::vector<std::string> policy_names();

}  // namespace rulesnake
