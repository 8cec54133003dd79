#include "tsume/usi/usi.hpp"

int main() {
  // USI-Loop: position ... / go mate ...
  tsume::USI usi;
  return usi.run();
}
