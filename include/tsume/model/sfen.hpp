#pragma once

#include <optional>
#include <string>

#include "move.hpp"
#include "position.hpp"

namespace tsume::model::sfen {

// Performs a basic structural validation of an SFEN string: nine ranks of
// nine files, known piece letters ('+' only before promotable pieces), side
// to move 'b' or 'w', a hand field and an optional move number.
bool is_basic_sfen_valid(const std::string& sfen);

// Builds a Position from SFEN. Throws std::invalid_argument on malformed input.
Position parse(const std::string& sfen);

std::string to_sfen(const Position& pos);

// "5e" style square names, file digit then rank letter
std::string square_to_usi(core::Square sq);
std::optional<core::Square> usi_to_square(const std::string& s);

// "7g7f", "8h2b+", "G*5b"
std::string move_to_usi(const Move& m);

// Matches the text against the legal moves of the side to move
std::optional<Move> parse_usi_move(Position& pos, const std::string& usi);

}  // namespace tsume::model::sfen
