#pragma once

#include <atomic>
#include <string>
#include <string_view>

namespace lancet::core {

// Abstract ID generator interface for dependency injection.
// IDs have the form "<prefix>_<16 lower-case hex>" (e.g. "err_9f86d081884c7d65").
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;

  // Contract: returned ID is non-empty and starts with prefix followed by '_'.
  virtual std::string next(std::string_view prefix) = 0;

 protected:
  IIdGenerator() = default;
  IIdGenerator(const IIdGenerator&) = default;
  IIdGenerator& operator=(const IIdGenerator&) = default;
  IIdGenerator(IIdGenerator&&) = default;
  IIdGenerator& operator=(IIdGenerator&&) = default;
};

// Production ID generator: 64 bits of CSPRNG output per ID. Thread-safe.
class RandomIdGenerator final : public IIdGenerator {
 public:
  RandomIdGenerator() = default;
  ~RandomIdGenerator() override = default;

  RandomIdGenerator(const RandomIdGenerator&) = delete;
  RandomIdGenerator& operator=(const RandomIdGenerator&) = delete;
  RandomIdGenerator(RandomIdGenerator&&) = delete;
  RandomIdGenerator& operator=(RandomIdGenerator&&) = delete;

  std::string next(std::string_view prefix) override;
};

// Deterministic ID generator: sequential counter rendered as 16 hex digits.
// Thread-safe. Same sequence of next() calls produces the same IDs.
class DeterministicIdGenerator final : public IIdGenerator {
 public:
  DeterministicIdGenerator() = default;
  ~DeterministicIdGenerator() override = default;

  DeterministicIdGenerator(const DeterministicIdGenerator&) = delete;
  DeterministicIdGenerator& operator=(const DeterministicIdGenerator&) = delete;
  DeterministicIdGenerator(DeterministicIdGenerator&&) = delete;
  DeterministicIdGenerator& operator=(DeterministicIdGenerator&&) = delete;

  std::string next(std::string_view prefix) override;

 private:
  std::atomic<unsigned long long> counter_{0};
};

}  // namespace lancet::core
