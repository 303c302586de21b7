#include "verifier.hpp"

#include <fstream>
#include <stdexcept>
#include <vector>

#include "errors.hpp"
#include "local_state.hpp"
#include "utils.hpp"

const char* verification_label(VerificationResult result) {
  switch(result) {
    case VerificationResult::Match: return "Match";
    case VerificationResult::Mismatch: return "Mismatch";
    case VerificationResult::NoDigestRegistered: return "NoDigestRegistered";
    case VerificationResult::FileMissing: return "FileMissing";
  }
  return "Unknown";
}

Verifier::Verifier(std::size_t block_size, std::shared_ptr<Logger> logger)
  : block_size_(block_size == 0 ? kDefaultBlockSize : block_size),
    logger_(std::move(logger)) {}

std::string Verifier::file_digest(const std::filesystem::path& target) const {
  std::ifstream in(target, std::ios::binary);
  if(!in) {
    throw FetchFailure(FetchError::LocalStateUnavailable, "Unable to open " + target.string());
  }

  std::string hex;
  bool read_failed = false;
  try {
    Sha256Stream digest;
    std::vector<char> buffer(block_size_);
    while(in) {
      in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
      digest.update(buffer.data(), static_cast<std::size_t>(in.gcount()));
    }
    read_failed = in.bad();
    hex = digest.finish_hex();
  } catch(const std::runtime_error& e) {
    throw FetchFailure(FetchError::LocalStateUnavailable,
                       "Hashing " + target.string() + " failed: " + e.what());
  }
  if(read_failed) {
    throw FetchFailure(FetchError::LocalStateUnavailable, "Read of " + target.string() + " failed");
  }
  return hex;
}

VerificationResult Verifier::verify(const std::filesystem::path& target,
                                    const std::optional<std::string>& expected_digest) const {
  const auto name = target.filename().string();
  if(!expected_digest || expected_digest->empty()) {
    print_out(logger_.get(), "File {} has no hash.", name);
    return VerificationResult::NoDigestRegistered;
  }
  if(!inspect_local_state(target).exists) {
    print_out(logger_.get(), "File {} is missing. Run download first.", name);
    return VerificationResult::FileMissing;
  }

  auto actual = file_digest(target);
  if(!iequals(actual, *expected_digest)) {
    log_debug(logger_.get(), "{}: expected {} got {}", name, *expected_digest, actual);
    print_out(logger_.get(), "File {} is corrupt. Delete it manually and restart the program.", name);
    return VerificationResult::Mismatch;
  }
  print_out(logger_.get(), "File {} is validated.", name);
  return VerificationResult::Match;
}
