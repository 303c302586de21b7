#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "catalog.hpp"
#include "errors.hpp"
#include "local_state.hpp"
#include "log.hpp"
#include "remote_probe.hpp"
#include "transfer_engine.hpp"

enum class LocalCompleteness {
  NotStarted,
  Incomplete,
  Complete,
  Oversized // local file larger than the remote object
};

const char* completeness_label(LocalCompleteness state);

struct TransferDecision {
  LocalCompleteness state = LocalCompleteness::NotStarted;
  TransferMode mode;
};

// Pure decision table over (local, remote). Never resumes against an unknown
// remote size, and replaces a local file that is larger than the remote one.
TransferDecision decide_transfer(const LocalFileState& local, const RemoteObjectMeta& remote);

struct ReconcileOutcome {
  enum class Status {
    Skipped,
    Transferred,
    Failed
  };

  Status status = Status::Failed;
  TransferDecision decision;
  LocalFileState local;
  RemoteObjectMeta remote;
  TransferResult transfer;
  std::optional<FetchError> error;
  std::string message;
};

class Reconciler {
public:
  Reconciler(RemoteProbe& probe,
             TransferEngine& engine,
             std::filesystem::path target_dir,
             std::shared_ptr<Logger> logger = nullptr);

  // Inspect, probe, decide and transfer one entry. Failures are reported in the
  // outcome, never thrown, so one entry cannot stop the rest of the catalog.
  ReconcileOutcome reconcile(const CatalogEntry& entry, const ProgressCallback& progress = {});

  std::filesystem::path target_path(const CatalogEntry& entry) const;

private:
  RemoteProbe& probe_;
  TransferEngine& engine_;
  std::filesystem::path target_dir_;
  std::shared_ptr<Logger> logger_;
};
