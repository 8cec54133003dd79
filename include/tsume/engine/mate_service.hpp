#pragma once

#include <optional>

#include "../model/board.hpp"
#include "../model/hands.hpp"
#include "../model/move.hpp"
#include "../model/position.hpp"
#include "config.hpp"
#include "mate_search.hpp"

namespace tsume::engine {

class MateSearchService {
 public:
  explicit MateSearchService(const MateConfig& cfg = {});
  ~MateSearchService();

  MateSearchService(const MateSearchService&) = delete;
  MateSearchService& operator=(const MateSearchService&) = delete;

  // Matt für 'attacker' innerhalb opts.maxDepth Plies suchen.
  // Wirft std::invalid_argument bei ungültiger Eingabe (siehe validate_mate_root).
  SearchResult search(const model::Board& board, const model::Hands& hands,
                      core::Color attacker, const SearchOptions& opts);
  // mit defaultDepth / defaultTimeoutMs aus der Config
  SearchResult search(const model::Board& board, const model::Hands& hands,
                      core::Color attacker);
  // Angreifer = Seite am Zug; pos selbst wird nicht verändert
  SearchResult search(const model::Position& pos, const SearchOptions& opts);

  std::optional<model::Move> findOneMoveCheckmate(const model::Board& board,
                                                  const model::Hands& hands,
                                                  core::Color attacker) const;

  const MateConfig& getConfig() const;

 private:
  struct Impl;
  Impl* pimpl;
};

// Bequeme Einstiegspunkte ohne eigene Service-Instanz
SearchResult findCheckmate(const model::Board& board, const model::Hands& hands,
                           core::Color attacker, int maxDepth = 7);
std::optional<model::Move> findOneMoveCheckmate(const model::Board& board,
                                                const model::Hands& hands, core::Color attacker);

}  // namespace tsume::engine
