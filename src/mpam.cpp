#include "mpam/mpam.hpp"
#include <string>

namespace mpam {

Version version() { return {0, 1, 0}; }

std::string version_string() {
  const Version v = version();
  return "mpam " + std::to_string(v.major) + "." + std::to_string(v.minor) + "." + std::to_string(v.patch);
}

} // namespace mpam
