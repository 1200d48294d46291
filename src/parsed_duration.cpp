#include "parsed_duration.hpp"

#include <spdlog/fmt/fmt.h>

namespace tparse {

std::string to_string(const ParsedDuration &duration) {
  if (duration.is_integer()) {
    return std::to_string(duration.integer());
  }
  return fmt::format("{}", duration.real());
}

} // namespace tparse
