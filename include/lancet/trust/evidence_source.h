#pragma once

#include <string>
#include <vector>

namespace lancet::trust {

// ClaimConfidence is the evidence tally for one claim.
struct ClaimConfidence {
  double confidence{0.0};      // NOLINT(readability-identifier-naming)
  int supporting_count{0};     // NOLINT(readability-identifier-naming)
  int refuting_count{0};       // NOLINT(readability-identifier-naming)
  int neutral_count{0};        // NOLINT(readability-identifier-naming)
  int independent_sources{0};  // NOLINT(readability-identifier-naming)
};

// Contradiction is a pair of claims the evidence graph holds to disagree.
struct Contradiction {
  std::string claim1_id;   // NOLINT(readability-identifier-naming)
  std::string claim2_id;   // NOLINT(readability-identifier-naming)
  double confidence{0.0};  // NOLINT(readability-identifier-naming)
};

// IEvidenceSource is the read side of the evidence graph consumed by SourceVerifier.
// Implementations may throw; exceptions propagate out of verify_claim.
class IEvidenceSource {
 public:
  virtual ~IEvidenceSource() = default;

  virtual ClaimConfidence calculate_claim_confidence(const std::string& claim_id) = 0;
  virtual std::vector<Contradiction> find_contradictions() = 0;

 protected:
  IEvidenceSource() = default;
  IEvidenceSource(const IEvidenceSource&) = default;
  IEvidenceSource& operator=(const IEvidenceSource&) = default;
  IEvidenceSource(IEvidenceSource&&) = default;
  IEvidenceSource& operator=(IEvidenceSource&&) = default;
};

}  // namespace lancet::trust
