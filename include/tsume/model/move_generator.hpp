#pragma once

#include <vector>

#include "../engine/move_buffer.hpp"
#include "board.hpp"
#include "game_state.hpp"
#include "hands.hpp"

namespace tsume::model {

struct Move;
class Position;

class MoveGenerator {
 public:
  // Volle Pseudolegal-Gen: Brettzüge (inkl. Promotions) + Drops
  void generatePseudoLegalMoves(const Board& b, const Hands& h, const GameState& st,
                                std::vector<Move>& out) const;

  // Nur Brettzüge, Promotion-Varianten inklusive
  void generateBoardMoves(const Board& b, const GameState& st, std::vector<Move>& out) const;

  // Drops auf leere Felder ohne tote Felder und ohne Nifu; Uchifuzume prüft doMove()
  void generateDrops(const Board& b, const Hands& h, const GameState& st,
                     std::vector<Move>& out) const;

  // Evasions bei Schach: Königszüge plus (bei Single-Check) Checker schlagen / blocken,
  // blocken auch per Drop. Pseudolegal – finale Legalität via doMove()
  void generateEvasions(const Board& b, const Hands& h, const GameState& st,
                        std::vector<Move>& out) const;

  // Legal für die Seite am Zug (Evasions falls im Schach)
  void generateLegalMoves(Position& pos, std::vector<Move>& out) const;

  // Return: Anzahl generierter Züge
  int generatePseudoLegalMoves(const Board& b, const Hands& h, const GameState& st,
                               engine::MoveBuffer& buf) const;
  int generateBoardMoves(const Board& b, const GameState& st, engine::MoveBuffer& buf) const;
  int generateEvasions(const Board& b, const Hands& h, const GameState& st,
                       engine::MoveBuffer& buf) const;
};

}  // namespace tsume::model
