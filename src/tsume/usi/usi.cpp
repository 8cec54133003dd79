#include "tsume/usi/usi.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "tsume/constants.hpp"
#include "tsume/engine/mate_service.hpp"
#include "tsume/model/sfen.hpp"

namespace tsume {

static std::vector<std::string> split_ws(const std::string& s) {
  std::istringstream iss(s);
  std::vector<std::string> out;
  std::string tok;
  while (iss >> tok) out.push_back(tok);
  return out;
}

static std::string extract_sfen_after(const std::string& line) {
  auto pos = line.find("sfen");
  if (pos == std::string::npos) return "";
  pos += 4;
  while (pos < line.size() && isspace((unsigned char)line[pos])) ++pos;
  auto moves_pos = line.find(" moves", pos);
  if (moves_pos == std::string::npos) return line.substr(pos);
  return line.substr(pos, moves_pos - pos);
}

USI::USI() {
  m_position = model::sfen::parse(core::START_SFEN);
}

void USI::showOptions(std::ostream& out) {
  out << "option name MateDepth type spin default " << m_options.mateDepth
      << " min 1 max " << (engine::MAX_PLY - 1) << "\n";
  out << "option name Verbose type check default " << (m_options.verbose ? "true" : "false")
      << "\n";
}

void USI::setOption(const std::string& line) {
  auto tokens = split_ws(line);
  std::string name;
  std::string value;
  for (size_t i = 1; i + 1 < tokens.size(); ++i) {
    if (tokens[i] == "name") name = tokens[i + 1];
    if (tokens[i] == "value") value = tokens[i + 1];
  }
  if (name.empty()) return;

  if (name == "MateDepth") {
    int v = std::stoi(value);
    v = std::max(1, std::min(engine::MAX_PLY - 1, v));
    m_options.mateDepth = v;
  } else if (name == "Verbose") {
    std::string vl = value;
    std::transform(vl.begin(), vl.end(), vl.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    m_options.verbose = (vl == "true" || vl == "1" || vl == "on");
  }
}

void USI::setPosition(const std::string& line) {
  if (line.find("startpos") != std::string::npos) {
    m_position = model::sfen::parse(core::START_SFEN);
  } else if (line.find("sfen") != std::string::npos) {
    std::string sfen = extract_sfen_after(line);
    if (!sfen.empty()) m_position = model::sfen::parse(sfen);
  }
  auto posMoves = line.find(" moves");
  if (posMoves == std::string::npos) return;

  std::istringstream iss(line.substr(posMoves + 6));
  std::string moveUsi;
  while (iss >> moveUsi) {
    auto mv = model::sfen::parse_usi_move(m_position, moveUsi);
    if (!mv || !m_position.doMove(*mv)) {
      std::cerr << "[USI] warning: illegal move " << moveUsi << "\n";
      break;
    }
  }
}

void USI::goMate(const std::string& line, std::ostream& out) {
  auto tokens = split_ws(line);
  engine::SearchOptions opts;
  opts.maxDepth = m_options.mateDepth;
  opts.timeoutMs = 0;
  for (size_t i = 1; i < tokens.size(); ++i) {
    if (tokens[i] == "mate" && i + 1 < tokens.size()) {
      const std::string& t = tokens[++i];
      opts.timeoutMs = (t == "infinite") ? 0 : std::stoull(t);
    }
  }

  engine::MateSearchService service(m_options.toMateConfig());
  engine::SearchResult res;
  try {
    res = service.search(m_position, opts);
  } catch (const std::invalid_argument& e) {
    std::cerr << "[USI] go mate rejected: " << e.what() << "\n";
    out << "checkmate nomate\n";
    return;
  }

  if (res.timedOut) {
    out << "checkmate timeout\n";
  } else if (!res.isMate) {
    out << "checkmate nomate\n";
  } else {
    out << "checkmate";
    for (const auto& mv : res.moves) out << " " << model::sfen::move_to_usi(mv);
    out << "\n";
  }
}

int USI::run() {
  return run(std::cin, std::cout);
}

int USI::run(std::istream& in, std::ostream& out) {
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) continue;

    auto tokens = split_ws(line);
    if (tokens.empty()) continue;
    const std::string& cmd = tokens[0];

    try {
      if (cmd == "usi") {
        out << "id name " << m_name << " " << m_version << "\n";
        out << "id author unknown\n";
        showOptions(out);
        out << "usiok\n";
      } else if (cmd == "isready") {
        out << "readyok\n";
      } else if (cmd == "setoption") {
        setOption(line);
      } else if (cmd == "usinewgame") {
        m_position = model::sfen::parse(core::START_SFEN);
      } else if (cmd == "position") {
        setPosition(line);
      } else if (cmd == "go") {
        if (std::find(tokens.begin(), tokens.end(), "mate") != tokens.end())
          goMate(line, out);
        else
          std::cerr << "[USI] only 'go mate' is supported\n";
      } else if (cmd == "stop") {
        // Suche läuft synchron, nichts zu stoppen
      } else if (cmd == "quit") {
        break;
      }
    } catch (const std::invalid_argument& e) {
      std::cerr << "[USI] error: " << e.what() << "\n";
    } catch (const std::out_of_range& e) {
      std::cerr << "[USI] error: " << e.what() << "\n";
    }
    out.flush();
  }
  return 0;
}

}  // namespace tsume
