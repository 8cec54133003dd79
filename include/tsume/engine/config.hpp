#pragma once
#include <cstdint>

namespace tsume::engine {
struct MateConfig {
  int defaultDepth = 7;                 // Plies, ungerade; findCheckmate() nutzt das ebenfalls
  std::uint64_t defaultTimeoutMs = 30000;  // 0 = unbegrenzt
  std::uint32_t tickStep = 32;          // Uhr nur alle N Knoten prüfen
  bool useDisproofTable = true;         // pro Suche, wird nie über Aufrufe geteilt
  bool verbose = false;                 // [MateSearch]-Zeilen nach std::cerr
};
// grobe Figurwerte für die Zugsortierung (Pawn..King)
static const int base_value[8] = {1, 3, 4, 5, 6, 8, 10, 0};
constexpr int MAX_PLY = 128;
constexpr int MAX_MOVES = 1024;  // Pseudolegal inkl. Promotions und Drops, großzügig
// größere Zeitlimits gelten als unbegrenzt (steady_clock + ms darf nicht überlaufen)
constexpr std::uint64_t MAX_TIMEOUT_MS = 365ULL * 24 * 60 * 60 * 1000;
}  // namespace tsume::engine
