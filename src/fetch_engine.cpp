#include "fetch_engine.hpp"

#include <iostream>
#include <system_error>

#include "progress_meter.hpp"

namespace {

HttpClient::Options client_options(const FetchConfig& config) {
  HttpClient::Options options;
  options.timeout = config.timeout;
  options.max_redirects = config.max_redirects;
  options.verify_tls = config.verify_tls;
  options.ca_file = config.ca_file.string();
  options.read_chunk = config.chunk_size;
  return options;
}

} // namespace

FetchEngine::FetchEngine(FetchConfig config,
                         Catalog catalog,
                         std::shared_ptr<Logger> logger,
                         std::ostream* meter_out)
  : config_(std::move(config)),
    catalog_(std::move(catalog)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("fetch-engine")),
    meter_out_(meter_out ? meter_out : &std::cout),
    client_(client_options(config_), logger_),
    probe_(client_, logger_),
    transfer_(client_, logger_),
    reconciler_(probe_, transfer_, config_.target_dir, logger_),
    verifier_(config_.verify_block_size, logger_) {}

const std::vector<std::string>& FetchEngine::action_names() {
  static const std::vector<std::string> names = {"download", "validate"};
  return names;
}

bool FetchEngine::is_action(const std::string& word) {
  for(const auto& name : action_names()) {
    if(name == word) return true;
  }
  return false;
}

LogListenerHandle FetchEngine::add_log_listener(Logger::Listener listener, void* user_data) {
  return logger_->add_listener(std::move(listener), user_data);
}

void FetchEngine::remove_log_listener(LogListenerHandle handle) {
  logger_->remove_listener(handle);
}

FetchEngine::DownloadReport FetchEngine::download() {
  DownloadReport report;
  logger_->print("\n### Start downloading required files.\n");

  std::error_code ec;
  std::filesystem::create_directories(config_.target_dir, ec);
  if(ec) {
    logger_->error("Unable to create {}: {}", config_.target_dir.string(), ec.message());
    for(const auto& entry : catalog_.entries()) {
      ReconcileOutcome outcome;
      outcome.status = ReconcileOutcome::Status::Failed;
      outcome.error = FetchError::LocalStateUnavailable;
      outcome.message = "target directory unavailable: " + ec.message();
      outcome.local.path = reconciler_.target_path(entry);
      report.outcomes.push_back(std::move(outcome));
      ++report.failed;
    }
    logger_->print("\n### End\n");
    return report;
  }

  for(const auto& entry : catalog_.entries()) {
    ProgressMeter meter(entry.file_name(), config_.progress_meter_size, config_.show_progress, *meter_out_);
    auto outcome = reconciler_.reconcile(entry, [&meter](uint64_t transferred, uint64_t total){
      meter.update(transferred, total);
    });
    meter.finish();

    switch(outcome.status) {
      case ReconcileOutcome::Status::Skipped: ++report.skipped; break;
      case ReconcileOutcome::Status::Transferred: ++report.transferred; break;
      case ReconcileOutcome::Status::Failed: ++report.failed; break;
    }
    report.outcomes.push_back(std::move(outcome));
  }

  logger_->print("\n### End\n");
  if(report.failed > 0) {
    logger_->warn("{} of {} files failed; run download again to resume them",
                  report.failed, catalog_.size());
  }
  return report;
}

FetchEngine::ValidationReport FetchEngine::validate() {
  ValidationReport report;
  logger_->print("### Start validating required files.\n");

  for(const auto& entry : catalog_.entries()) {
    ValidationItem item;
    item.path = reconciler_.target_path(entry);
    try {
      item.result = verifier_.verify(item.path, entry.expected_digest);
      switch(*item.result) {
        case VerificationResult::Match: ++report.matched; break;
        case VerificationResult::Mismatch:
          ++report.mismatched;
          item.error = FetchError::DigestMismatch;
          break;
        case VerificationResult::NoDigestRegistered: ++report.no_digest; break;
        case VerificationResult::FileMissing: ++report.missing; break;
      }
    } catch(const FetchFailure& e) {
      item.error = e.code();
      item.message = e.what();
      logger_->error("{} [{}]", e.what(), fetch_error_label(e.code()));
      ++report.failed;
    }
    report.items.push_back(std::move(item));
  }

  logger_->print("\n### End\n");
  if(report.mismatched > 0) {
    logger_->warn("{} corrupt file(s): delete them and run download again", report.mismatched);
  }
  return report;
}

int FetchEngine::run(const std::vector<std::string>& actions) {
  bool ok = true;
  for(const auto& action : actions) {
    if(action == "download") {
      ok = download().ok() && ok;
    } else if(action == "validate") {
      ok = validate().ok() && ok;
    } else {
      logger_->error("Unknown action '{}'", action);
      ok = false;
    }
  }
  return ok ? 0 : 1;
}
