#pragma once

#include "lancet/trust/evidence_source.h"
#include "lancet/trust/notifier.h"

#include <nlohmann/json.hpp>

#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace lancet::testing {

// FakeEvidenceSource answers from a fixed table; unknown claims have no evidence.
class FakeEvidenceSource final : public trust::IEvidenceSource {
 public:
  void set_confidence(const std::string& claim_id, trust::ClaimConfidence confidence) {
    confidence_[claim_id] = confidence;
  }
  void set_sources(const std::string& claim_id, const int sources) {
    trust::ClaimConfidence c;
    c.independent_sources = sources;
    c.supporting_count = sources;
    confidence_[claim_id] = c;
  }
  void add_contradiction(std::string a, std::string b) {
    contradictions_.push_back({std::move(a), std::move(b), 0.9});
  }
  void fail_with(std::string message) { failure_ = std::move(message); }

  trust::ClaimConfidence calculate_claim_confidence(const std::string& claim_id) override {
    if (!failure_.empty()) {
      throw std::runtime_error(failure_);
    }
    const auto it = confidence_.find(claim_id);
    return it == confidence_.end() ? trust::ClaimConfidence{} : it->second;
  }
  std::vector<trust::Contradiction> find_contradictions() override { return contradictions_; }

 private:
  std::map<std::string, trust::ClaimConfidence> confidence_;
  std::vector<trust::Contradiction> contradictions_;
  std::string failure_;
};

// RecordingNotifier keeps every delivered notification; it can be told to fail.
class RecordingNotifier final : public trust::INotifier {
 public:
  nlohmann::json notify_domain_blocked(const trust::BlockedDomainNotification& n) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_) {
      throw std::runtime_error("channel unavailable");
    }
    delivered_.push_back(n);
    return nlohmann::json{{"channel", "test"}, {"sequence", delivered_.size()}};
  }

  void set_fail(const bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_ = fail;
  }
  [[nodiscard]] std::vector<trust::BlockedDomainNotification> delivered() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return delivered_;
  }

 private:
  mutable std::mutex mutex_;
  bool fail_{false};
  std::vector<trust::BlockedDomainNotification> delivered_;
};

}  // namespace lancet::testing
