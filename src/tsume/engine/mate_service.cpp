#include "tsume/engine/mate_service.hpp"

#include <iostream>
#include <string>

#include "tsume/engine/mate1ply.hpp"
#include "tsume/model/sfen.hpp"

namespace tsume::engine {

struct MateSearchService::Impl {
  MateConfig cfg;
  MateSearch search;
  Mate1Ply mate1;

  explicit Impl(const MateConfig& c) : cfg(c), search(c) {}
};

namespace {

model::Position make_root(const model::Board& board, const model::Hands& hands,
                          core::Color attacker) {
  model::Position pos;
  pos.setup(board, hands, attacker);
  return pos;
}

void log_result(const SearchResult& res, const SearchOptions& opts) {
  const char* reason = res.timedOut ? "timeout" : (res.isMate ? "mate" : "nomate");
  std::cerr << "[MateSearch] Search finished: depth=" << opts.maxDepth
            << " timeout=" << opts.timeoutMs << "ms time=" << res.elapsedMs
            << "ms reason=" << reason << "\n";
  std::cerr << "[MateSearch] info nodes=" << res.nodeCount << " length=" << res.moves.size()
            << "\n";
  if (!res.moves.empty()) {
    std::cerr << "[MateSearch] pv ";
    bool first = true;
    for (const auto& mv : res.moves) {
      if (!first) std::cerr << " ";
      first = false;
      std::cerr << model::sfen::move_to_usi(mv);
    }
    std::cerr << "\n";
  }
}

}  // namespace

MateSearchService::MateSearchService(const MateConfig& cfg) : pimpl(new Impl(cfg)) {}

MateSearchService::~MateSearchService() {
  delete pimpl;
}

SearchResult MateSearchService::search(const model::Position& pos, const SearchOptions& opts) {
  model::Position root = pos;
  SearchResult res = pimpl->search.search(root, opts);
  if (pimpl->cfg.verbose) log_result(res, opts);
  return res;
}

SearchResult MateSearchService::search(const model::Board& board, const model::Hands& hands,
                                       core::Color attacker, const SearchOptions& opts) {
  return search(make_root(board, hands, attacker), opts);
}

SearchResult MateSearchService::search(const model::Board& board, const model::Hands& hands,
                                       core::Color attacker) {
  SearchOptions opts;
  opts.maxDepth = pimpl->cfg.defaultDepth;
  opts.timeoutMs = pimpl->cfg.defaultTimeoutMs;
  return search(board, hands, attacker, opts);
}

std::optional<model::Move> MateSearchService::findOneMoveCheckmate(const model::Board& board,
                                                                   const model::Hands& hands,
                                                                   core::Color attacker) const {
  model::Position pos = make_root(board, hands, attacker);
  return pimpl->mate1.find(pos);
}

const MateConfig& MateSearchService::getConfig() const {
  return pimpl->cfg;
}

SearchResult findCheckmate(const model::Board& board, const model::Hands& hands,
                           core::Color attacker, int maxDepth) {
  MateSearchService service;
  SearchOptions opts;
  opts.maxDepth = maxDepth;
  opts.timeoutMs = service.getConfig().defaultTimeoutMs;
  return service.search(board, hands, attacker, opts);
}

std::optional<model::Move> findOneMoveCheckmate(const model::Board& board,
                                                const model::Hands& hands, core::Color attacker) {
  model::Position pos;
  pos.setup(board, hands, attacker);
  return Mate1Ply().find(pos);
}

}  // namespace tsume::engine
