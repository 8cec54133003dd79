#pragma once

#include <string>

namespace tsume::core {
const std::string START_SFEN = "lnsgkgsnl/1r5b1/ppppppppp/9/9/9/PPPPPPPPP/1B5R1/LNSGKGSNL b - 1";
}  // namespace tsume::core
