#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "tsume/engine/mate_service.hpp"
#include "tsume/model/sfen.hpp"

using namespace tsume;

struct BenchPosition {
  std::string name;
  std::string description;
  std::string sfen;  // Angreifer = Seite am Zug
  int expectedDepth;  // Matt in höchstens so vielen Plies, 0 = kein Matt
};

struct BenchResult {
  std::string position;
  int depth = 0;
  std::uint64_t nodeCount = 0;
  std::uint64_t elapsedMs = 0;
  std::uint64_t nodesPerSecond = 0;
  bool isMate = false;
  bool timedOut = false;
  std::size_t moveCount = 0;
  bool asExpected = true;
};

struct BenchSummary {
  std::size_t totalPositions = 0;
  std::uint64_t totalNodes = 0;
  std::uint64_t totalElapsedMs = 0;
  std::uint64_t averageNodesPerSecond = 0;
  std::vector<BenchResult> results;
};

static std::vector<BenchPosition> standard_positions() {
  return {
      {"mate1-head-gold", "gold drop on the king's head, knight and silver block the escapes",
       "7nk/7s1/8P/9/9/9/9/9/K8 b G 1", 1},
      {"mate1-back-rank", "rook to the back rank behind a pawn wall",
       "4k4/3ppp3/9/9/9/9/9/9/R7K b - 1", 1},
      {"mate1-white", "White mates with a gold drop in the corner", "8k/9/9/9/9/9/p8/1S7/KN7 w g 1",
       1},
      {"mate3-gold-rook", "gold drop drives the king, rook finishes on the first rank",
       "3k5/3ppp3/1N7/9/9/9/9/9/K7R b G 1", 3},
      {"mate5-interpose", "as mate3-gold-rook, but the defender can interpose a pawn",
       "3k5/3ppp3/1N7/9/9/9/9/9/K7R b Gp 1", 5},
      {"nomate-rook", "lone rook against an open king", "4k4/9/9/9/7R1/9/9/9/4K4 b - 1", 0},
      {"nomate-bare", "bare kings, no checks at all", "4k4/9/9/9/9/9/9/9/4K4 b - 1", 0},
  };
}

static std::uint64_t nps(std::uint64_t nodes, std::uint64_t ms) {
  return (nodes > 0 && ms > 0) ? nodes * 1000 / ms : 0;
}

static BenchResult run_single(engine::MateSearchService& service, const BenchPosition& bp,
                              int maxDepth) {
  const auto pos = model::sfen::parse(bp.sfen);
  engine::SearchOptions opts;
  opts.maxDepth = maxDepth;
  opts.timeoutMs = service.getConfig().defaultTimeoutMs;
  const auto res = service.search(pos, opts);

  BenchResult r;
  r.position = bp.name;
  r.depth = maxDepth;
  r.nodeCount = res.nodeCount;
  r.elapsedMs = res.elapsedMs;
  r.nodesPerSecond = nps(res.nodeCount, res.elapsedMs);
  r.isMate = res.isMate;
  r.timedOut = res.timedOut;
  r.moveCount = res.moves.size();
  // nur bewerten, wenn die Tiefe für die Erwartung reicht
  if (!res.timedOut && bp.expectedDepth <= maxDepth) {
    if (bp.expectedDepth == 0)
      r.asExpected = !res.isMate;
    else
      r.asExpected = res.isMate && static_cast<int>(r.moveCount) <= bp.expectedDepth;
  }
  return r;
}

static std::string result_text(const BenchResult& r) {
  if (r.timedOut) return "Timeout";
  if (!r.isMate) return "No mate";
  return "Mate in " + std::to_string(r.moveCount);
}

static BenchSummary run_suite(engine::MateSearchService& service,
                              const std::vector<BenchPosition>& positions, int maxDepth) {
  BenchSummary summary;
  summary.totalPositions = positions.size();
  for (const auto& bp : positions) {
    std::cout << "Running benchmark: " << bp.name << "\n";
    auto r = run_single(service, bp, maxDepth);
    summary.totalNodes += r.nodeCount;
    summary.totalElapsedMs += r.elapsedMs;
    std::cout << "  - Nodes: " << r.nodeCount << ", Time: " << r.elapsedMs
              << "ms, NPS: " << r.nodesPerSecond << "\n";
    std::cout << "  - Result: " << result_text(r) << (r.asExpected ? "" : " (unexpected)")
              << "\n";
    summary.results.push_back(std::move(r));
  }
  summary.averageNodesPerSecond = nps(summary.totalNodes, summary.totalElapsedMs);
  return summary;
}

// ungerade Tiefen bis zum ersten Matt
static void run_depth_analysis(engine::MateSearchService& service, const BenchPosition& bp,
                               int maxDepth) {
  for (int depth = 1; depth <= maxDepth; depth += 2) {
    std::cout << "Testing depth " << depth << "\n";
    const auto r = run_single(service, bp, depth);
    std::cout << "  - Nodes: " << r.nodeCount << ", Time: " << r.elapsedMs << "ms\n";
    if (r.isMate) {
      std::cout << "Mate found at depth " << depth << "\n";
      break;
    }
  }
}

static std::string format_results(const BenchSummary& summary) {
  std::ostringstream os;
  os << "=== Mate Search Benchmark Results ===\n";
  os << "Total Positions: " << summary.totalPositions << "\n";
  os << "Total Nodes: " << summary.totalNodes << "\n";
  os << "Total Time: " << summary.totalElapsedMs << "ms\n";
  os << "Average NPS: " << summary.averageNodesPerSecond << "\n\n";
  os << "Position Results:\n";
  for (const auto& r : summary.results) {
    os << "- " << r.position << "\n";
    os << "  Nodes: " << r.nodeCount << "\n";
    os << "  Time: " << r.elapsedMs << "ms\n";
    os << "  NPS: " << r.nodesPerSecond << "\n";
    os << "  Result: " << result_text(r) << (r.asExpected ? "" : " (unexpected)") << "\n";
  }
  return os.str();
}

int main(int argc, char** argv) {
  int maxDepth = 7;
  std::string analyze;
  std::string export_path;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--depth" && i + 1 < argc) {
      maxDepth = std::stoi(argv[++i]);
    } else if (arg == "--analyze" && i + 1 < argc) {
      analyze = argv[++i];
    } else if (arg == "--export" && i + 1 < argc) {
      export_path = argv[++i];
    }
  }

  const auto positions = standard_positions();
  engine::MateSearchService service;

  try {
    if (!analyze.empty()) {
      for (const auto& bp : positions) {
        if (bp.name != analyze) continue;
        run_depth_analysis(service, bp, maxDepth);
        return 0;
      }
      std::cerr << "[MateBench] unknown position " << analyze << "\n";
      return 1;
    }

    const auto summary = run_suite(service, positions, maxDepth);
    const std::string report = format_results(summary);
    std::cout << "\n" << report;

    if (!export_path.empty()) {
      std::ofstream out(export_path);
      if (!out) {
        std::cerr << "[MateBench] Failed to open " << export_path << "\n";
        return 1;
      }
      out << report;
      std::cout << "Exported benchmark results to " << export_path << "\n";
    }

    for (const auto& r : summary.results)
      if (!r.asExpected) return 1;
  } catch (const std::invalid_argument& e) {
    std::cerr << "[MateBench] error: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
