#include "tsume/model/board.hpp"

#include <cassert>

namespace tsume::model {

namespace {
// Packed byte layout:
//  low 4 bits: (typeIndex + 1) in [1..8], 0 means empty
//  bit 4: promoted
//  bit 5: color (0 black, 1 white)
constexpr std::uint8_t PROMOTED_BIT = 0x10;
constexpr std::uint8_t COLOR_BIT = 0x20;

inline int decode_ti(std::uint8_t packed) noexcept {
  return (packed & 0xF) - 1;
}  // only if packed!=0
inline int decode_ci(std::uint8_t packed) noexcept {
  return (packed & COLOR_BIT) ? 1 : 0;
}  // only if packed!=0
}  // namespace

// ---- Board ----

Board::Board() {
  clear();
}

void Board::clear() noexcept {
  m_piece_on.fill(0);
  m_king_sq = {core::NO_SQUARE, core::NO_SQUARE};
  m_king_count = {0, 0};
  for (auto& files : m_pawn_files) files.fill(0);
}

inline std::uint8_t Board::pack_piece(Piece p) noexcept {
  if (p.type == core::PieceType::None) return 0;
  const int ti = static_cast<int>(p.type);
  assert(ti >= 0 && ti < core::PIECE_TYPE_NB && "Invalid PieceType");
  const bool promoted = p.promoted && is_promotable(p.type);
  return static_cast<std::uint8_t>((ti + 1) | (promoted ? PROMOTED_BIT : 0) |
                                   (p.color == core::Color::White ? COLOR_BIT : 0));
}

inline Piece Board::unpack_piece(std::uint8_t pp) noexcept {
  if (pp == 0) return Piece{};
  return Piece{static_cast<core::PieceType>(decode_ti(pp)),
               decode_ci(pp) ? core::Color::White : core::Color::Black,
               (pp & PROMOTED_BIT) != 0};
}

// Caches für König und Bauernlinien nachführen (delta = +1 Einsetzen, -1 Entfernen)
void Board::track(std::uint8_t packed, core::Square sq, int delta) noexcept {
  const int ti = decode_ti(packed);
  const int c = decode_ci(packed);
  if (ti == static_cast<int>(core::PieceType::King)) {
    m_king_count[c] = static_cast<std::uint8_t>(m_king_count[c] + delta);
    if (delta > 0) {
      m_king_sq[c] = sq;
    } else if (m_king_sq[c] == sq) {
      m_king_sq[c] = core::NO_SQUARE;
      // weitere Könige (nur in ungültigen Aufstellungen) wiederfinden
      for (int s = 0; s < core::SQ_NB && m_king_count[c] > 0; ++s) {
        const std::uint8_t pp = m_piece_on[s];
        if (s != sq && pp && decode_ti(pp) == ti && decode_ci(pp) == c) {
          m_king_sq[c] = static_cast<core::Square>(s);
          break;
        }
      }
    }
  } else if (ti == static_cast<int>(core::PieceType::Pawn) && !(packed & PROMOTED_BIT)) {
    auto& cnt = m_pawn_files[c][core::file_of(sq) - 1];
    cnt = static_cast<std::uint8_t>(cnt + delta);
  }
}

void Board::setPiece(core::Square sq, Piece p) noexcept {
  const int s = static_cast<int>(sq);
  assert(s >= 0 && s < core::SQ_NB);

  const std::uint8_t newPacked = pack_piece(p);
  const std::uint8_t oldPacked = m_piece_on[s];
  if (oldPacked == newPacked) return;

  if (oldPacked) {
    m_piece_on[s] = 0;
    track(oldPacked, sq, -1);
  }
  if (newPacked) {
    m_piece_on[s] = newPacked;
    track(newPacked, sq, +1);
  }
}

void Board::removePiece(core::Square sq) noexcept {
  const int s = static_cast<int>(sq);
  assert(s >= 0 && s < core::SQ_NB);

  const std::uint8_t packed = m_piece_on[s];
  if (!packed) return;  // already empty
  m_piece_on[s] = 0;
  track(packed, sq, -1);
}

std::optional<Piece> Board::getPiece(core::Square sq) const noexcept {
  const std::uint8_t packed = m_piece_on[static_cast<int>(sq)];
  if (!packed) return std::nullopt;
  return unpack_piece(packed);
}

void Board::movePiece(core::Square from, core::Square to, bool promote) noexcept {
  const int sf = static_cast<int>(from);
  const int st = static_cast<int>(to);
  assert(sf >= 0 && sf < core::SQ_NB && st >= 0 && st < core::SQ_NB);
  assert(m_piece_on[st] == 0 && "movePiece: 'to' must be empty");

  std::uint8_t packed = m_piece_on[sf];
  if (!packed) return;

  m_piece_on[sf] = 0;
  track(packed, from, -1);
  if (promote) packed = static_cast<std::uint8_t>(packed | PROMOTED_BIT);
  m_piece_on[st] = packed;
  track(packed, to, +1);
}

}  // namespace tsume::model
