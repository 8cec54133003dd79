#include <cassert>
#include <stdexcept>
#include <string>
#include <vector>

#include "tsume/model/board.hpp"
#include "tsume/model/move_generator.hpp"
#include "tsume/model/position.hpp"
#include "tsume/model/sfen.hpp"
#include "tsume/model/zobrist.hpp"

using namespace tsume;

static core::Square sq(int file, char rank) {
  return core::make_square(file, rank - 'a' + 1);
}

int main() {
  using core::Color;
  using core::PieceType;

  // Board caches: king squares and unpromoted pawns per file
  {
    model::Board b;
    assert(b.kingSquare(Color::Black) == core::NO_SQUARE);
    b.setPiece(sq(5, 'i'), {PieceType::King, Color::Black, false});
    b.setPiece(sq(5, 'g'), {PieceType::Pawn, Color::Black, false});
    b.setPiece(sq(3, 'c'), {PieceType::Pawn, Color::White, true});
    assert(b.kingSquare(Color::Black) == sq(5, 'i'));
    assert(b.kingCount(Color::Black) == 1);
    assert(b.hasPawnOnFile(Color::Black, 5));
    assert(!b.hasPawnOnFile(Color::White, 3));  // Tokin zählt nicht

    auto p = b.getPiece(sq(3, 'c'));
    assert(p && p->type == PieceType::Pawn && p->color == Color::White && p->promoted);

    b.movePiece(sq(5, 'g'), sq(5, 'c'), true);
    assert(!b.hasPawnOnFile(Color::Black, 5));
    assert(b.getPiece(sq(5, 'c'))->promoted);

    b.removePiece(sq(5, 'i'));
    assert(b.kingSquare(Color::Black) == core::NO_SQUARE);
    assert(b.kingCount(Color::Black) == 0);

    // Gold und König können nicht befördert werden
    b.setPiece(sq(1, 'a'), {PieceType::Gold, Color::Black, true});
    assert(!b.getPiece(sq(1, 'a'))->promoted);
  }

  // Capturing a promoted piece puts the unpromoted type into the hand; undo restores it
  {
    auto pos = model::sfen::parse("4k4/9/4+b4/9/9/9/9/4R4/4K4 b - 1");
    const std::string before = model::sfen::to_sfen(pos);
    const auto hashBefore = pos.hash();

    auto mv = model::sfen::parse_usi_move(pos, "5h5c+");
    assert(mv && mv->isCapture() && mv->promote);
    assert(pos.doMove(*mv));
    assert(pos.getHands().count(Color::Black, PieceType::Bishop) == 1);
    auto dragon = pos.getBoard().getPiece(sq(5, 'c'));
    assert(dragon && dragon->type == PieceType::Rook && dragon->promoted);
    assert(pos.lastMoveGaveCheck());
    assert(pos.inCheck());
    assert(pos.hash() == model::Zobrist::compute(pos));

    pos.undoMove();
    assert(model::sfen::to_sfen(pos) == before);
    assert(pos.hash() == hashBefore);
    auto horse = pos.getBoard().getPiece(sq(5, 'c'));
    assert(horse && horse->type == PieceType::Bishop && horse->promoted &&
           horse->color == Color::White);
    assert(pos.getHands().count(Color::Black, PieceType::Bishop) == 0);
  }

  // Exact undo over every move and reply, hash kept incrementally
  {
    auto pos = model::sfen::parse("4k4/2+R3g2/p3+b3P/9/9/9/9/3S5/4K4 b GN2Prl 1");
    const std::string before = model::sfen::to_sfen(pos);
    const auto hashBefore = pos.hash();
    const model::Board boardBefore = pos.getBoard();
    const model::Hands handsBefore = pos.getHands();

    model::MoveGenerator mg;
    std::vector<model::Move> moves;
    mg.generateLegalMoves(pos, moves);
    assert(!moves.empty());

    for (const auto& m : moves) {
      assert(pos.doMove(m));
      assert(pos.hash() == model::Zobrist::compute(pos));
      const std::string mid = model::sfen::to_sfen(pos);

      std::vector<model::Move> replies;
      mg.generateLegalMoves(pos, replies);
      for (const auto& r : replies) {
        assert(pos.doMove(r));
        assert(pos.hash() == model::Zobrist::compute(pos));
        pos.undoMove();
        assert(model::sfen::to_sfen(pos) == mid);
      }

      pos.undoMove();
      assert(pos.hash() == hashBefore);
      assert(model::sfen::to_sfen(pos) == before);
    }
    assert(pos.getBoard() == boardBefore);
    assert(pos.getHands() == handsBefore);
    assert(pos.historySize() == 0);
  }

  // Illegal moves leave the position untouched
  {
    auto pos = model::sfen::parse("4k4/9/9/9/9/9/9/9/4K4 b P 1");
    const auto hashBefore = pos.hash();
    // Figur des Gegners ziehen
    assert(!pos.doMove(model::Move::relocate(sq(5, 'a'), sq(5, 'b'),
                                             {PieceType::King, Color::White, false}, false)));
    // Drop ohne Figur in der Hand
    assert(!pos.doMove(model::Move::drop(sq(5, 'e'), PieceType::Gold, Color::Black)));
    // Bauer auf die letzte Reihe
    assert(!pos.doMove(model::Move::drop(sq(3, 'a'), PieceType::Pawn, Color::Black)));
    // König zieht zwei Felder
    assert(!pos.doMove(model::Move::relocate(sq(5, 'i'), sq(5, 'g'),
                                             {PieceType::King, Color::Black, false}, false)));
    assert(pos.hash() == hashBefore);
    assert(pos.historySize() == 0);
  }

  // Board plus both hands may not hold more pieces than one set
  {
    auto throws_invalid = [](const std::string& sfen) {
      try {
        (void)model::sfen::parse(sfen);
      } catch (const std::invalid_argument&) {
        return true;
      }
      return false;
    };
    // 18 Bauern in der Hand + einer auf dem Brett
    assert(throws_invalid("4k4/9/9/9/4p4/4R4/9/9/K8 b 18P 1"));
    assert(throws_invalid("4k4/9/9/9/9/9/9/9/4K4 b 2Bb 1"));
    assert(throws_invalid("4k4/9/9/9/9/9/9/9/4K4 b 3L2l 1"));

    // genau ein Satz: Schlagen bleibt im Bereich, Hash stimmt
    auto pos = model::sfen::parse("4k4/9/9/9/4p4/4R4/9/9/K8 b 9P8p 1");
    auto mv = model::sfen::parse_usi_move(pos, "5f5e");
    assert(mv && mv->isCapture());
    assert(pos.doMove(*mv));
    assert(pos.getHands().count(Color::Black, PieceType::Pawn) == 10);
    assert(pos.hash() == model::Zobrist::compute(pos));
    pos.undoMove();

    model::Board b;
    b.setPiece(sq(5, 'a'), {PieceType::King, Color::White, false});
    b.setPiece(sq(5, 'i'), {PieceType::King, Color::Black, false});
    b.setPiece(sq(2, 'b'), {PieceType::Rook, Color::White, true});
    model::Hands h;
    h.add(Color::Black, PieceType::Rook, 2);
    model::Position bad;
    bool threw = false;
    try {
      bad.setup(b, h, Color::Black);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
  }

  // Side to move is part of the hash
  {
    auto black = model::sfen::parse("4k4/9/9/9/9/9/9/9/4K4 b - 1");
    auto white = model::sfen::parse("4k4/9/9/9/9/9/9/9/4K4 w - 1");
    assert(black.hash() != white.hash());
  }

  return 0;
}
