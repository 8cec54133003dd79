#pragma once
#include "../model/move.hpp"

namespace tsume::engine {

// Nicht-besitzender Schreibpuffer über ein festes Move-Array
struct MoveBuffer {
  model::Move* out;
  int n = 0;
  int cap;

  MoveBuffer(model::Move* o, int c) : out(o), cap(c) {}
  inline void push(const model::Move& m) {
    if (n < cap) out[n++] = m;
  }
  inline int size() const { return n; }
};

}  // namespace tsume::engine
