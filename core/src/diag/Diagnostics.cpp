#include "pc/diag/Diagnostics.hpp"

#include <cstdio>

namespace pc {

DiagnosticSink stderrSink() {
  return [](const PieWarning& w) {
    std::fprintf(stderr, "[PieLayout] WARN %s: %s\n",
                 w.code.c_str(), w.message.c_str());
  };
}

} // namespace pc
