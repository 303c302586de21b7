#include "reconciler.hpp"

const char* completeness_label(LocalCompleteness state) {
  switch(state) {
    case LocalCompleteness::NotStarted: return "NotStarted";
    case LocalCompleteness::Incomplete: return "Incomplete";
    case LocalCompleteness::Complete: return "Complete";
    case LocalCompleteness::Oversized: return "Oversized";
  }
  return "Unknown";
}

TransferDecision decide_transfer(const LocalFileState& local, const RemoteObjectMeta& remote) {
  if(!local.exists) {
    return {LocalCompleteness::NotStarted, TransferMode::fresh_start()};
  }
  if(!remote.size_known()) {
    // an unverifiable resume could corrupt a good file
    return {LocalCompleteness::Complete, TransferMode::skip()};
  }
  if(local.size_bytes < remote.total_size_bytes) {
    return {LocalCompleteness::Incomplete, TransferMode::resume_from(local.size_bytes)};
  }
  if(local.size_bytes == remote.total_size_bytes) {
    return {LocalCompleteness::Complete, TransferMode::skip()};
  }
  return {LocalCompleteness::Oversized, TransferMode::fresh_start()};
}

Reconciler::Reconciler(RemoteProbe& probe,
                       TransferEngine& engine,
                       std::filesystem::path target_dir,
                       std::shared_ptr<Logger> logger)
  : probe_(probe),
    engine_(engine),
    target_dir_(std::move(target_dir)),
    logger_(std::move(logger)) {}

std::filesystem::path Reconciler::target_path(const CatalogEntry& entry) const {
  return target_dir_ / entry.file_name();
}

ReconcileOutcome Reconciler::reconcile(const CatalogEntry& entry, const ProgressCallback& progress) {
  ReconcileOutcome outcome;
  const auto path = target_path(entry);
  const auto shown = path.string();
  Logger* log = logger_.get();

  try {
    outcome.local = inspect_local_state(path);
    outcome.remote = probe_.probe(entry.locator);
    outcome.decision = decide_transfer(outcome.local, outcome.remote);
    log_debug(log, "{}: local={} remote={} -> {} {}", shown,
              outcome.local.exists ? std::to_string(outcome.local.size_bytes) : std::string("absent"),
              outcome.remote.total_size_bytes,
              completeness_label(outcome.decision.state),
              describe(outcome.decision.mode));

    switch(outcome.decision.state) {
      case LocalCompleteness::NotStarted:
        print_out(log, "File {} does not exist. Start download.", shown);
        break;
      case LocalCompleteness::Incomplete:
        print_out(log, "File {} is incomplete. Resume download.", shown);
        break;
      case LocalCompleteness::Complete:
        if(outcome.remote.size_known()) {
          print_out(log, "File {} is complete. Skip download.", shown);
        } else {
          print_out(log, "File {} exists and the remote size is unknown. Skip download.", shown);
        }
        break;
      case LocalCompleteness::Oversized:
        log_warn(log, "{} is {} bytes but the remote object is {} bytes", shown,
                 outcome.local.size_bytes, outcome.remote.total_size_bytes);
        print_out(log, "File {} is larger than the remote file. Restart download.", shown);
        break;
    }

    outcome.transfer = engine_.transfer(entry.locator, path, outcome.decision.mode, progress);
    if(!outcome.transfer.performed) {
      outcome.status = ReconcileOutcome::Status::Skipped;
      return outcome;
    }

    if(outcome.remote.size_known()) {
      auto after = inspect_local_state(path);
      if(after.size_bytes != outcome.remote.total_size_bytes) {
        throw FetchFailure(FetchError::TransferInterrupted,
                           "Size of " + shown + " after transfer is " + std::to_string(after.size_bytes) +
                           " bytes, expected " + std::to_string(outcome.remote.total_size_bytes));
      }
    }
    outcome.status = ReconcileOutcome::Status::Transferred;
  } catch(const FetchFailure& e) {
    outcome.status = ReconcileOutcome::Status::Failed;
    outcome.error = e.code();
    outcome.message = e.what();
    log_error(log, "{} [{}]", e.what(), fetch_error_label(e.code()));
    if(e.code() == FetchError::TransferInterrupted) {
      print_out(log, "File {} is incomplete. Run download again to resume.", shown);
    }
  }
  return outcome;
}
