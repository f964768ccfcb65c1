#include "orchestrator.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>

#include "cancellation.hpp"
#include "device_monitor.hpp"
#include "keep_awake.hpp"
#include "log.hpp"
#include "progress_reporter.hpp"
#include "volume.hpp"

Orchestrator::Orchestrator(SyncConfig config,
                           std::shared_ptr<Volume> volume,
                           std::shared_ptr<KeepAwake> keep_awake,
                           std::shared_ptr<CancellationToken> cancel,
                           std::shared_ptr<Logger> logger)
  : config_(std::move(config)),
    volume_(volume ? std::move(volume) : std::make_shared<LocalVolume>()),
    keep_awake_(std::move(keep_awake)),
    cancel_(cancel ? std::move(cancel) : std::make_shared<CancellationToken>()),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("orchestrator")),
    monitor_(std::make_shared<DeviceMonitor>(config_, volume_, cancel_)),
    progress_out_(&std::cout) {}

int Orchestrator::run(const SyncAction& action) {
  KeepAwakeGuard keep_awake(keep_awake_);
  try {
    return std::visit(overloaded{
      [this](const CopyAction& copy) { return run_copy(copy); },
      [this](const DeleteAction& del) { return run_delete(del); },
      [this](const ListAction& list) { return run_list(list); },
    }, action);
  } catch(const OperationCancelled&) {
    logger_->warn("Interrupted before {} finished.", action_name(action));
    return kExitCancelled;
  }
}

int Orchestrator::run_copy(const CopyAction& action) {
  std::error_code ec;
  if(!std::filesystem::is_directory(action.source_folder, ec)) {
    logger_->print_err("Source folder does not exist: {}", action.source_folder.string());
    return kExitUserError;
  }

  monitor_->wait_until_writable();
  auto task = TransferEngine::build_task(action.source_folder, config_.mount_point);

  TransferEngine engine(config_, volume_, monitor_);
  ProgressReporter progress(*progress_out_, config_.progress_width, config_.show_progress);
  engine.set_progress_callback([&progress](std::size_t completed, std::size_t total){
    progress.update(completed, total);
  });

  auto report = engine.run(task);
  progress.finish();
  last_report_ = report;

  logger_->info("All files copied successfully. ({} copied, {} skipped, {} bytes, {} failed attempts, {} disconnects)",
                report.copied_files, report.skipped_files, report.bytes_copied,
                report.failed_attempts, report.disconnects);
  return kExitSuccess;
}

int Orchestrator::run_delete(const DeleteAction& action) {
  monitor_->wait_until_writable();
  FolderOps folders(config_, volume_, monitor_);
  last_delete_outcome_ = folders.delete_folder(action.folder_name);
  return kExitSuccess;
}

int Orchestrator::run_list(const ListAction&) {
  FolderOps folders(config_, volume_, monitor_);
  last_listing_ = folders.list_folders();
  return kExitSuccess;
}
