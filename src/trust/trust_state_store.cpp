#include "lancet/trust/trust_state_store.h"

#include <cmath>

namespace lancet::trust {

std::string format_rejection_reason(const double rate) {
  const auto percent = static_cast<long long>(std::llround(rate * 100.0));
  return "High rejection rate (" + std::to_string(percent) + "%)";
}

}  // namespace lancet::trust
