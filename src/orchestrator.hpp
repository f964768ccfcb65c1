#pragma once

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "action.hpp"
#include "folder_ops.hpp"
#include "sync_config.hpp"
#include "transfer_engine.hpp"

class CancellationToken;
class DeviceMonitor;
class KeepAwake;
class Logger;
class Volume;

class Orchestrator {
public:
  static constexpr int kExitSuccess = 0;
  static constexpr int kExitUserError = 1;
  static constexpr int kExitCancelled = 130;

  Orchestrator(SyncConfig config,
               std::shared_ptr<Volume> volume,
               std::shared_ptr<KeepAwake> keep_awake,
               std::shared_ptr<CancellationToken> cancel,
               std::shared_ptr<Logger> logger = nullptr);

  // Holds the keep-awake resource for the whole run and returns the
  // process exit status.
  int run(const SyncAction& action);

  // Defaults to std::cout.
  void set_progress_stream(std::ostream& out) { progress_out_ = &out; }

  const std::optional<TransferReport>& last_report() const { return last_report_; }
  const std::optional<DeleteOutcome>& last_delete_outcome() const { return last_delete_outcome_; }
  const std::vector<std::string>& last_listing() const { return last_listing_; }

private:
  int run_copy(const CopyAction& action);
  int run_delete(const DeleteAction& action);
  int run_list(const ListAction& action);

  SyncConfig config_;
  std::shared_ptr<Volume> volume_;
  std::shared_ptr<KeepAwake> keep_awake_;
  std::shared_ptr<CancellationToken> cancel_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<DeviceMonitor> monitor_;
  std::ostream* progress_out_;

  std::optional<TransferReport> last_report_;
  std::optional<DeleteOutcome> last_delete_outcome_;
  std::vector<std::string> last_listing_;
};
