#include "tsume/engine/mate1ply.hpp"

#include <array>

#include "tsume/engine/config.hpp"

namespace tsume::engine {

bool Mate1Ply::isMatingMove(model::Position& pos, const model::Move& m) const {
  if (!pos.doMove(m)) return false;
  const bool mated = pos.lastMoveGaveCheck() && !pos.hasLegalMove();
  pos.undoMove();
  return mated;
}

std::optional<model::Move> Mate1Ply::findAmong(model::Position& pos, const model::Move* moves,
                                               int n) const {
  for (int i = 0; i < n; ++i)
    if (isMatingMove(pos, moves[i])) return moves[i];
  return std::nullopt;
}

std::optional<model::Move> Mate1Ply::find(model::Position& pos) const {
  std::array<model::Move, MAX_MOVES> moves;
  MoveBuffer buf(moves.data(), MAX_MOVES);
  const int n = pos.inCheck()
                    ? mg.generateEvasions(pos.getBoard(), pos.getHands(), pos.getState(), buf)
                    : mg.generatePseudoLegalMoves(pos.getBoard(), pos.getHands(), pos.getState(),
                                                  buf);
  return findAmong(pos, moves.data(), n);
}

}  // namespace tsume::engine
