#pragma once

#include <optional>

#include "../model/move.hpp"
#include "../model/move_generator.hpp"
#include "../model/position.hpp"

namespace tsume::engine {

// Einzügiges Matt für die Seite am Zug. Die Stellung wird nach jedem
// Versuch zurückgenommen und ist danach unverändert.
class Mate1Ply {
 public:
  // erster mattsetzender Zug in Generierungsreihenfolge (Brettzüge, dann Drops)
  std::optional<model::Move> find(model::Position& pos) const;

  // wie find(), aber nur über die gegebenen Kandidaten; illegale werden übersprungen
  std::optional<model::Move> findAmong(model::Position& pos, const model::Move* moves,
                                       int n) const;

  // true wenn m legal ist, Schach gibt und der Gegner keinen legalen Zug hat
  bool isMatingMove(model::Position& pos, const model::Move& m) const;

 private:
  model::MoveGenerator mg;
};

}  // namespace tsume::engine
