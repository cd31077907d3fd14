#include "lancet/core/id_generator.h"

#include "lancet/core/random.h"

#include <cstdio>

namespace lancet::core {

std::string RandomIdGenerator::next(std::string_view prefix) {
  return std::string(prefix) + "_" + random_hex(8);
}

std::string DeterministicIdGenerator::next(std::string_view prefix) {
  const auto c = counter_.fetch_add(1, std::memory_order_relaxed) + 1;
  char buf[17];
  std::snprintf(buf, sizeof(buf), "%016llx", c);
  return std::string(prefix) + "_" + buf;
}

}  // namespace lancet::core
