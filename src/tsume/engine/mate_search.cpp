#include "tsume/engine/mate_search.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

#include "tsume/engine/move_buffer.hpp"
#include "tsume/engine/move_list.hpp"
#include "tsume/engine/move_order.hpp"

namespace tsume::engine {

void validate_mate_root(const model::Position& pos, const SearchOptions& opts) {
  if (opts.maxDepth < 1) throw std::invalid_argument("mate search: maxDepth must be >= 1");

  const auto& b = pos.getBoard();
  const core::Color attacker = pos.getState().sideToMove;
  const core::Color defender = ~attacker;
  if (b.kingCount(defender) == 0)
    throw std::invalid_argument("mate search: defender has no king");
  if (b.kingCount(defender) > 1 || b.kingCount(attacker) > 1)
    throw std::invalid_argument("mate search: more than one king for a side");
  if (pos.isInCheck(defender))
    throw std::invalid_argument("mate search: defender is already in check");
}

MateSearch::MateSearch(const MateConfig& cfg_) : cfg(cfg_), genArr_(MAX_PLY) {
  tickStep_ = cfg.tickStep > 0 ? cfg.tickStep : 1;
}

// ---------------------------------------------------------------------------
// Zugerzeugung pro Ply
// ---------------------------------------------------------------------------

int MateSearch::gen_checks(model::Position& pos, int ply) {
  auto& arr = genArr_[ply];
  MoveBuffer buf(arr.data(), MAX_MOVES);
  // Steht der Angreifer selbst im Schach (Gegenschach), muss er ausweichen
  const int raw = pos.inCheck()
                      ? mg.generateEvasions(pos.getBoard(), pos.getHands(), pos.getState(), buf)
                      : mg.generatePseudoLegalMoves(pos.getBoard(), pos.getHands(),
                                                    pos.getState(), buf);
  int n = 0;
  for (int i = 0; i < raw; ++i) {
    const model::Move m = arr[i];
    if (!pos.doMove(m)) continue;
    const bool check = pos.lastMoveGaveCheck();
    pos.undoMove();
    if (!check) continue;
    scoreBuf_[n] = check_order_score(pos, m);
    arr[n++] = m;
  }
  sort_by_score_desc(scoreBuf_.data(), arr.data(), n);
  return n;
}

int MateSearch::gen_evasions(model::Position& pos, int ply) {
  auto& arr = genArr_[ply];
  MoveBuffer buf(arr.data(), MAX_MOVES);
  const int raw = mg.generateEvasions(pos.getBoard(), pos.getHands(), pos.getState(), buf);
  int n = 0;
  for (int i = 0; i < raw; ++i) {
    const model::Move m = arr[i];
    if (!pos.isLegal(m)) continue;
    scoreBuf_[n] = evasion_order_score(pos, m);
    arr[n++] = m;
  }
  sort_by_score_desc(scoreBuf_.data(), arr.data(), n);
  return n;
}

// ---------------------------------------------------------------------------
// OR-Knoten: Angreifer am Zug, ein Schachzug muss reichen
// ---------------------------------------------------------------------------

bool MateSearch::or_node(model::Position& pos, int depth, int ply,
                         std::vector<model::Move>& line) {
  fast_tick();

  if (cfg.useDisproofTable) {
    auto it = disproof_.find(pos.hash());
    if (it != disproof_.end() && it->second >= depth) return false;
  }

  const int n = gen_checks(pos, ply);
  const model::Move* moves = genArr_[ply].data();

  // 1) einzügige Matts zuerst
  if (auto m = mate1.findAmong(pos, moves, n)) {
    line.assign(1, *m);
    return true;
  }

  // 2) jeden Schach tiefer beweisen
  if (depth >= 3) {
    std::vector<model::Move> sub;
    for (int i = 0; i < n; ++i) {
      const model::Move m = genArr_[ply][i];
      if (!pos.doMove(m)) continue;
      sub.clear();
      const bool proven = and_node(pos, depth - 1, ply + 1, sub);
      pos.undoMove();
      if (proven) {
        line.clear();
        line.push_back(m);
        line.insert(line.end(), sub.begin(), sub.end());
        return true;
      }
    }
  }

  if (cfg.useDisproofTable) {
    int& stored = disproof_[pos.hash()];
    stored = std::max(stored, depth);
  }
  return false;
}

// ---------------------------------------------------------------------------
// AND-Knoten: Verteidiger im Schach, jede Antwort muss widerlegt werden
// ---------------------------------------------------------------------------

bool MateSearch::and_node(model::Position& pos, int depth, int ply,
                          std::vector<model::Move>& line) {
  fast_tick();

  const int n = gen_evasions(pos, ply);
  if (n == 0) return true;  // Matt

  std::vector<model::Move> best;
  std::vector<model::Move> sub;
  bool haveBest = false;
  for (int i = 0; i < n; ++i) {
    const model::Move m = genArr_[ply][i];
    if (!pos.doMove(m)) continue;
    sub.clear();
    const bool proven = or_node(pos, depth - 1, ply + 1, sub);
    pos.undoMove();
    if (!proven) return false;
    // längste Verteidigung berichten, bei Gleichstand die erste
    if (!haveBest || sub.size() + 1 > best.size()) {
      best.clear();
      best.push_back(m);
      best.insert(best.end(), sub.begin(), sub.end());
      haveBest = true;
    }
  }
  line = std::move(best);
  return true;
}

// ---------------------------------------------------------------------------
// Root: iterative Vertiefung 1, 3, 5, ...
// ---------------------------------------------------------------------------

SearchResult MateSearch::search(model::Position& pos, const SearchOptions& opts) {
  validate_mate_root(pos, opts);

  using steady_clock = std::chrono::steady_clock;
  const auto t0 = steady_clock::now();

  SearchResult res;
  nodes_ = 0;
  tick_ = 0;
  disproof_.clear();
  hasDeadline_ = opts.timeoutMs > 0 && opts.timeoutMs <= MAX_TIMEOUT_MS;
  if (hasDeadline_)
    deadline_ = t0 + std::chrono::milliseconds(static_cast<std::int64_t>(opts.timeoutMs));

  const int maxDepth = std::min(opts.maxDepth, MAX_PLY - 1);
  const std::size_t rootHistory = pos.historySize();

  try {
    for (int depth = 1; depth <= maxDepth; depth += 2) {
      std::vector<model::Move> line;
      const bool mate = or_node(pos, depth, 0, line);
      if (cfg.verbose) {
        std::cerr << "[MateSearch] depth=" << depth << " nodes=" << nodes_
                  << " result=" << (mate ? "mate" : "none") << "\n";
      }
      if (mate) {
        res.isMate = true;
        res.moves = std::move(line);
        break;
      }
    }
  } catch (const SearchStoppedException&) {
    // Stellung auf den Stand vor der Suche zurückrollen
    while (pos.historySize() > rootHistory) pos.undoMove();
    res.isMate = false;
    res.moves.clear();
    res.timedOut = true;
  }

  res.nodeCount = nodes_;
  res.elapsedMs = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(steady_clock::now() - t0).count());
  disproof_.clear();
  return res;
}

}  // namespace tsume::engine
