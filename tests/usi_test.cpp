#include <cassert>
#include <iostream>
#include <sstream>
#include <string>

#include "tsume/usi/usi.hpp"

using namespace tsume;

static std::string run_usi(const std::string& input) {
  std::istringstream in(input);
  std::ostringstream out;
  USI usi;
  const int rc = usi.run(in, out);
  assert(rc == 0);
  return out.str();
}

int main() {
  // Handshake and options
  {
    auto out = run_usi("usi\nisready\nquit\n");
    assert(out.find("option name MateDepth") != std::string::npos);
    assert(out.find("usiok") != std::string::npos);
    assert(out.find("readyok") != std::string::npos);
  }

  // go mate answers with the mating line
  {
    auto out = run_usi(
        "setoption name MateDepth value 5\n"
        "position sfen 3k5/3ppp3/1N7/9/9/9/9/9/K7R b G 1\n"
        "go mate 10000\n"
        "quit\n");
    assert(out.find("checkmate ") != std::string::npos);
    assert(out.find("nomate") == std::string::npos);
    assert(out.find("timeout") == std::string::npos);
  }

  // Moves after the sfen are applied before the search
  {
    auto out = run_usi(
        "position sfen 3k5/3ppp3/1N7/9/9/9/9/9/K7R b G 1 moves G*7a 6a5a\n"
        "go mate infinite\n");
    assert(out.find("checkmate 1i1a") != std::string::npos);
  }

  // A negative time wraps to a huge value and is treated as unbounded
  {
    auto out = run_usi(
        "position sfen 3k5/3ppp3/1N7/9/9/9/9/9/K7R b G 1\n"
        "go mate -1\n"
        "quit\n");
    assert(out.find("checkmate ") != std::string::npos);
    assert(out.find("timeout") == std::string::npos);
  }

  // Verbose search logging stays off the protocol stream
  {
    std::ostringstream coutCapture, cerrCapture;
    auto* oldCout = std::cout.rdbuf(coutCapture.rdbuf());
    auto* oldCerr = std::cerr.rdbuf(cerrCapture.rdbuf());
    auto out = run_usi(
        "setoption name Verbose value true\n"
        "position sfen 3k5/3ppp3/1N7/9/9/9/9/9/K7R b G 1\n"
        "go mate 10000\n"
        "quit\n");
    std::cout.rdbuf(oldCout);
    std::cerr.rdbuf(oldCerr);
    assert(out.find("checkmate ") != std::string::npos);
    assert(out.find("[MateSearch]") == std::string::npos);
    assert(coutCapture.str().empty());
    assert(cerrCapture.str().find("[MateSearch] Search finished") != std::string::npos);
  }

  // No mate, and rejected positions answer nomate as well
  {
    auto out = run_usi(
        "position sfen 4k4/9/9/9/9/9/9/9/4K4 b - 1\n"
        "go mate 1000\n"
        "position sfen 4k4/9/9/9/9/9/9/4R4/5K3 b G 1\n"
        "go mate 1000\n"
        "quit\n");
    std::size_t first = out.find("checkmate nomate");
    assert(first != std::string::npos);
    assert(out.find("checkmate nomate", first + 1) != std::string::npos);
  }

  return 0;
}
