#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "board.hpp"
#include "game_state.hpp"
#include "hands.hpp"
#include "zobrist.hpp"

namespace tsume::model {

class Position {
 public:
  Position() = default;

  // Übernimmt Brett und Hände; wirft std::invalid_argument bei unmöglichen Handzahlen
  void setup(const Board& board, const Hands& hands, core::Color sideToMove);

  Board& getBoard() { return m_board; }
  const Board& getBoard() const { return m_board; }
  Hands& getHands() { return m_hands; }
  const Hands& getHands() const { return m_hands; }
  GameState& getState() { return m_state; }
  const GameState& getState() const { return m_state; }

  [[nodiscard]] inline std::uint64_t hash() const noexcept { return m_hash; }
  [[nodiscard]] inline bool lastMoveGaveCheck() const noexcept {
    return !m_history.empty() && m_history.back().gaveCheck != 0;
  }
  [[nodiscard]] std::size_t historySize() const noexcept { return m_history.size(); }
  const std::vector<StateInfo>& history() const noexcept { return m_history; }

  void buildHash() { m_hash = Zobrist::compute(*this); }

  // Make/Unmake. doMove lässt die Stellung bei illegalen Zügen unverändert und gibt false zurück
  bool doMove(const Move& m);
  void undoMove();

  // Statusabfragen
  bool inCheck() const;
  bool isInCheck(core::Color c) const;
  bool isLegal(const Move& m);
  bool hasLegalMove();
  bool isCheckmate();

 private:
  Board m_board;
  Hands m_hands;
  GameState m_state;
  std::vector<StateInfo> m_history;
  std::uint64_t m_hash = 0;

  // interne Helfer
  bool isPseudoValid(const Move& m) const;
  void applyMove(const Move& m, StateInfo& st);
  void unapplyMove(const StateInfo& st);
  bool hasLegalBoardMove();

  // Zobrist inkrementell
  inline void hashXorPiece(const Piece& p, core::Square s) {
    m_hash ^= Zobrist::piece[ci(p.color)][kind_of(p)][s];
  }
  inline void hashHandChange(core::Color c, core::PieceType t, int before, int after) {
    m_hash ^= Zobrist::hand[ci(c)][static_cast<int>(t)][before];
    m_hash ^= Zobrist::hand[ci(c)][static_cast<int>(t)][after];
  }
  inline void hashXorSide() { m_hash ^= Zobrist::side; }
};

}  // namespace tsume::model
