#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "log.hpp"

enum class VerificationResult {
  Match,
  Mismatch,
  NoDigestRegistered,
  FileMissing
};

const char* verification_label(VerificationResult result);

class Verifier {
public:
  static constexpr std::size_t kDefaultBlockSize = 1000 * 1000;

  explicit Verifier(std::size_t block_size = kDefaultBlockSize,
                    std::shared_ptr<Logger> logger = nullptr);

  // Never deletes or rewrites the file. Read errors throw
  // FetchFailure(LocalStateUnavailable).
  VerificationResult verify(const std::filesystem::path& target,
                            const std::optional<std::string>& expected_digest) const;

  // Streams the file through SHA-256; lowercase hex.
  std::string file_digest(const std::filesystem::path& target) const;

private:
  std::size_t block_size_;
  std::shared_ptr<Logger> logger_;
};
