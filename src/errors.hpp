#pragma once

#include <stdexcept>
#include <string>

enum class FetchError {
  ProbeFailed,           // remote metadata could not be fetched
  LocalStateUnavailable, // filesystem refused stat/open/read
  TransferInterrupted,   // partial body on disk, recoverable by resume
  DigestMismatch,        // corrupt file, operator must delete it
  ConfigInvalid
};

inline const char* fetch_error_label(FetchError error) {
  switch(error) {
    case FetchError::ProbeFailed: return "ProbeFailed";
    case FetchError::LocalStateUnavailable: return "LocalStateUnavailable";
    case FetchError::TransferInterrupted: return "TransferInterrupted";
    case FetchError::DigestMismatch: return "DigestMismatch";
    case FetchError::ConfigInvalid: return "ConfigInvalid";
  }
  return "Unknown";
}

class FetchFailure : public std::runtime_error {
public:
  FetchFailure(FetchError code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

  FetchError code() const { return code_; }

private:
  FetchError code_;
};
