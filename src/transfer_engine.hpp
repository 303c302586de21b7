#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

#include "http_client.hpp"
#include "log.hpp"

struct TransferMode {
  enum class Kind {
    Skip,
    ResumeFrom,
    FreshStart
  };

  Kind kind = Kind::FreshStart;
  uint64_t offset = 0; // only meaningful for ResumeFrom

  static TransferMode skip() { return {Kind::Skip, 0}; }
  static TransferMode resume_from(uint64_t offset) { return {Kind::ResumeFrom, offset}; }
  static TransferMode fresh_start() { return {Kind::FreshStart, 0}; }

  bool operator==(const TransferMode& other) const {
    return kind == other.kind && offset == other.offset;
  }
  bool operator!=(const TransferMode& other) const { return !(*this == other); }
};

const char* transfer_mode_label(TransferMode::Kind kind);
std::string describe(const TransferMode& mode);

// (bytes of the file present so far, total expected or 0 if unknown)
using ProgressCallback = std::function<void(uint64_t transferred, uint64_t total)>;

struct TransferResult {
  bool performed = false;        // false for Skip
  int http_status = 0;
  uint64_t bytes_written = 0;    // bytes appended or written by this call
  uint64_t expected_total = 0;   // 0 if the server did not declare it
  bool range_ignored = false;    // server answered a ranged GET with the full body
  bool already_complete = false; // server answered 416 to a resume
};

class TransferEngine {
public:
  TransferEngine(HttpClient& client, std::shared_ptr<Logger> logger = nullptr);

  // FreshStart truncates, ResumeFrom appends and never truncates, Skip does nothing.
  // Network failures leave the flushed prefix on disk and throw
  // FetchFailure(TransferInterrupted); write failures throw
  // FetchFailure(LocalStateUnavailable).
  TransferResult transfer(const std::string& locator,
                          const std::filesystem::path& target,
                          const TransferMode& mode,
                          const ProgressCallback& progress = {});

private:
  HttpClient& client_;
  std::shared_ptr<Logger> logger_;
};
