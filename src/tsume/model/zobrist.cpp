#include "tsume/model/zobrist.hpp"

#include <mutex>

namespace tsume::model {

// Static storage
std::uint64_t Zobrist::piece[2][16][core::SQ_NB];
std::uint64_t Zobrist::hand[2][core::HAND_TYPE_NB][19];
std::uint64_t Zobrist::side;

namespace {
// SplitMix64: schnell, gute Streuung, deterministisch
static inline std::uint64_t splitmix64(std::uint64_t& x) {
  std::uint64_t z = (x += 0x9E3779B97F4A7C15ULL);
  z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
  z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
  return z ^ (z >> 31);
}

// Thread-sichere Einmal-Init für Zobrist::init()
std::once_flag g_once_init;
}  // namespace

void Zobrist::init(std::uint64_t seed) {
  // Fülle alle Keys; vermeide 0-Werte
  auto next = [&]() {
    std::uint64_t v;
    do {
      v = splitmix64(seed);
    } while (v == 0);
    return v;
  };

  for (int c = 0; c < 2; ++c)
    for (int k = 0; k < 16; ++k)
      for (int s = 0; s < core::SQ_NB; ++s) piece[c][k][s] = next();

  for (int c = 0; c < 2; ++c)
    for (int t = 0; t < core::HAND_TYPE_NB; ++t)
      for (int n = 0; n < 19; ++n) hand[c][t][n] = next();

  side = next();
}

void Zobrist::init() {
  // Fester, reproduzierbarer Seed
  std::call_once(g_once_init, [] { Zobrist::init(0x5A6E1C0FFEE2024ULL); });
}

}  // namespace tsume::model
