#pragma once

// -----------------------------------------------------------------------------
// Branch-Prediction Hints
// -----------------------------------------------------------------------------
#if defined(__GNUC__) || defined(__clang__)
#define TSUME_LIKELY(x) __builtin_expect(!!(x), 1)
#define TSUME_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define TSUME_LIKELY(x) (x)
#define TSUME_UNLIKELY(x) (x)
#endif

#include <array>
#include <chrono>
#include <cstdint>
#include <exception>
#include <unordered_map>
#include <vector>

#include "../model/move_generator.hpp"
#include "../model/position.hpp"
#include "config.hpp"
#include "mate1ply.hpp"

namespace tsume::engine {

struct SearchStoppedException : public std::exception {
  const char* what() const noexcept override { return "Search stopped"; }
};

struct SearchOptions {
  int maxDepth = 7;                 // Plies ab der Wurzel, erster Angriffszug = Ply 1
  std::uint64_t timeoutMs = 30000;  // 0 oder > MAX_TIMEOUT_MS = unbegrenzt
};

// -----------------------------------------------------------------------------
// SearchResult – bei isMate ist moves ungerade lang, abwechselnd Angreifer/Verteidiger
// -----------------------------------------------------------------------------
struct SearchResult {
  bool isMate = false;
  std::vector<model::Move> moves;
  std::uint64_t nodeCount = 0;
  std::uint64_t elapsedMs = 0;
  bool timedOut = false;  // Zeitlimit erreicht, isMate ist dann false
};

// Wirft std::invalid_argument wenn die Stellung keine Mattsuche für die Seite am Zug erlaubt
void validate_mate_root(const model::Position& pos, const SearchOptions& opts);

// -----------------------------------------------------------------------------
// MateSearch – OR/AND-Tiefensuche mit iterativer Vertiefung über ungerade Tiefen
// -----------------------------------------------------------------------------
class MateSearch {
 public:
  explicit MateSearch(const MateConfig& cfg);
  ~MateSearch() = default;

  MateSearch(const MateSearch&) = delete;
  MateSearch& operator=(const MateSearch&) = delete;
  MateSearch(MateSearch&&) = delete;
  MateSearch& operator=(MateSearch&&) = delete;

  // Angreifer ist die Seite am Zug. pos ist nach der Rückkehr unverändert, auch bei Timeout.
  SearchResult search(model::Position& pos, const SearchOptions& opts);

  [[nodiscard]] std::uint64_t nodes() const noexcept { return nodes_; }

 private:
  bool or_node(model::Position& pos, int depth, int ply, std::vector<model::Move>& line);
  bool and_node(model::Position& pos, int depth, int ply, std::vector<model::Move>& line);

  // legale Schachzüge bzw. legale Antworten, sortiert, in genArr_[ply]
  int gen_checks(model::Position& pos, int ply);
  int gen_evasions(model::Position& pos, int ply);

  std::uint32_t tick_ = 0;

  inline void fast_tick() {
    ++nodes_;
    if (!hasDeadline_) return;
    if (TSUME_LIKELY(++tick_ < tickStep_)) return;
    tick_ = 0;
    if (std::chrono::steady_clock::now() >= deadline_) throw SearchStoppedException();
  }

  // ---------------------------------------------------------------------------
  // Daten
  // ---------------------------------------------------------------------------
  MateConfig cfg;
  model::MoveGenerator mg;
  Mate1Ply mate1;
  std::uint32_t tickStep_ = 1;

  std::vector<std::array<model::Move, MAX_MOVES>> genArr_;  // [MAX_PLY]
  std::array<int, MAX_MOVES> scoreBuf_{};

  // Stellung -> größte Resttiefe ohne Matt (nur innerhalb eines search()-Aufrufs)
  std::unordered_map<std::uint64_t, int> disproof_;

  std::uint64_t nodes_ = 0;
  bool hasDeadline_ = false;
  std::chrono::steady_clock::time_point deadline_{};
};

}  // namespace tsume::engine
