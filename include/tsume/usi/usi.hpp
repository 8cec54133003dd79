#pragma once
#include <iosfwd>
#include <string>

#include "../engine/config.hpp"
#include "../model/position.hpp"

namespace tsume {

class USI {
 public:
  USI();
  int run();
  int run(std::istream& in, std::ostream& out);

 private:
  void showOptions(std::ostream& out);
  void setOption(const std::string& line);
  void setPosition(const std::string& line);
  void goMate(const std::string& line, std::ostream& out);

  struct Options {
    int mateDepth = 7;
    bool verbose = false;
    engine::MateConfig toMateConfig() const {
      engine::MateConfig cfg;
      cfg.defaultDepth = mateDepth;
      cfg.verbose = verbose;
      return cfg;
    }
  } m_options;

  std::string m_name = "TsumeSolver";
  std::string m_version = "1.0";

  model::Position m_position;
};

}  // namespace tsume
