#pragma once

#include <redlog.hpp>

namespace f0rge::util {

// -v count to log level: info, verbose, trace, debug, then pedantic for anything higher
inline redlog::level level_from_verbosity(int count) {
  switch (count) {
  case 0:
    return redlog::level::info;
  case 1:
    return redlog::level::verbose;
  case 2:
    return redlog::level::trace;
  case 3:
    return redlog::level::debug;
  default:
    return count < 0 ? redlog::level::info : redlog::level::pedantic;
  }
}

inline void apply_verbosity(int count) { redlog::set_level(level_from_verbosity(count)); }

} // namespace f0rge::util
