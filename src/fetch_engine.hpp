#pragma once

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "catalog.hpp"
#include "errors.hpp"
#include "fetch_config.hpp"
#include "http_client.hpp"
#include "log.hpp"
#include "reconciler.hpp"
#include "remote_probe.hpp"
#include "transfer_engine.hpp"
#include "verifier.hpp"

class FetchEngine {
public:
  struct DownloadReport {
    std::vector<ReconcileOutcome> outcomes;
    std::size_t skipped = 0;
    std::size_t transferred = 0;
    std::size_t failed = 0;

    bool ok() const { return failed == 0; }
  };

  struct ValidationItem {
    std::filesystem::path path;
    std::optional<VerificationResult> result; // empty when verification itself failed
    std::optional<FetchError> error;
    std::string message;
  };

  struct ValidationReport {
    std::vector<ValidationItem> items;
    std::size_t matched = 0;
    std::size_t mismatched = 0;
    std::size_t no_digest = 0;
    std::size_t missing = 0;
    std::size_t failed = 0;

    bool ok() const { return mismatched == 0 && missing == 0 && failed == 0; }
  };

  FetchEngine(FetchConfig config,
              Catalog catalog,
              std::shared_ptr<Logger> logger = nullptr,
              std::ostream* meter_out = nullptr);

  // Reconciles and transfers every catalog entry in order.
  DownloadReport download();
  // Verifies every catalog entry's file in order.
  ValidationReport validate();

  // Runs actions in order ("download", "validate"); returns the process exit status.
  int run(const std::vector<std::string>& actions);

  static const std::vector<std::string>& action_names();
  static bool is_action(const std::string& word);

  const FetchConfig& config() const { return config_; }
  const Catalog& catalog() const { return catalog_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

  LogListenerHandle add_log_listener(Logger::Listener listener, void* user_data = nullptr);
  void remove_log_listener(LogListenerHandle handle);

private:
  FetchConfig config_;
  Catalog catalog_;
  std::shared_ptr<Logger> logger_;
  std::ostream* meter_out_;
  HttpClient client_;
  RemoteProbe probe_;
  TransferEngine transfer_;
  Reconciler reconciler_;
  Verifier verifier_;
};
