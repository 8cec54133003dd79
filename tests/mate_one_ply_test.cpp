#include <cassert>

#include "tsume/engine/mate1ply.hpp"
#include "tsume/engine/mate_service.hpp"
#include "tsume/model/sfen.hpp"

using namespace tsume;

static core::Square sq(int file, char rank) {
  return core::make_square(file, rank - 'a' + 1);
}

static std::optional<model::Move> one_ply(const char* sfen) {
  auto pos = model::sfen::parse(sfen);
  return engine::findOneMoveCheckmate(pos.getBoard(), pos.getHands(),
                                      pos.getState().sideToMove);
}

int main() {
  using core::Color;
  using core::PieceType;

  // Head gold: king in the corner boxed in by its own knight and silver
  {
    auto m = one_ply("7nk/7s1/8P/9/9/9/9/9/K8 b G 1");
    assert(m);
    assert(m->isDrop() && m->piece.type == PieceType::Gold && m->to == sq(1, 'b'));
  }

  // Rook slides up the file to the back rank
  {
    auto m = one_ply("4k4/3ppp3/9/9/9/9/9/9/R7K b - 1");
    assert(m);
    assert(!m->isDrop());
    assert(m->from == sq(9, 'i') && m->to == sq(9, 'a'));
  }

  // White as attacker (same pattern turned around)
  {
    auto m = one_ply("8k/9/9/9/9/9/p8/1S7/KN7 w g 1");
    assert(m);
    assert(m->isDrop() && m->piece.color == Color::White && m->to == sq(9, 'h'));
  }

  // Pawn-drop mate never counts as a mating move
  {
    assert(!one_ply("7nk/7s1/7G1/9/9/9/9/9/K8 b P 1"));
    auto gold = one_ply("7nk/7s1/7G1/9/9/9/9/9/K8 b G 1");
    assert(gold && gold->isDrop() && gold->to == sq(1, 'b'));
  }

  // Open king in the centre: no mate with a single gold
  {
    assert(!one_ply("9/9/9/9/4k4/9/9/9/K8 b G 1"));
    assert(!one_ply("4k4/9/9/9/9/9/9/9/4K4 b - 1"));
  }

  // Inputs stay untouched, the Position variant restores itself
  {
    auto pos = model::sfen::parse("7nk/7s1/8P/9/9/9/9/9/K8 b G 1");
    const model::Board board = pos.getBoard();
    const model::Hands hands = pos.getHands();
    engine::MateSearchService service;
    auto m = service.findOneMoveCheckmate(board, hands, Color::Black);
    assert(m);
    assert(board == pos.getBoard() && hands == pos.getHands());

    const auto hash = pos.hash();
    engine::Mate1Ply mate1;
    auto again = mate1.find(pos);
    assert(again && *again == *m);
    assert(pos.hash() == hash && pos.historySize() == 0);
    assert(mate1.isMatingMove(pos, *m));
  }

  return 0;
}
