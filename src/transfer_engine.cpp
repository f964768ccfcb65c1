#include "transfer_engine.hpp"

#include <stdexcept>
#include <system_error>
#include <unordered_map>

#include "device_monitor.hpp"
#include "file_orderer.hpp"
#include "log.hpp"
#include "utils.hpp"
#include "volume.hpp"

namespace fs = std::filesystem;

const char* to_string(TransferState state) {
  switch(state) {
    case TransferState::AwaitingDevice: return "awaiting-device";
    case TransferState::CreatingDestination: return "creating-destination";
    case TransferState::CopyingFiles: return "copying-files";
    case TransferState::Complete: return "complete";
  }
  return "unknown";
}

TransferEngine::TransferEngine(SyncConfig config,
                               std::shared_ptr<Volume> volume,
                               std::shared_ptr<DeviceMonitor> monitor,
                               std::shared_ptr<Logger> logger)
  : config_(std::move(config)),
    volume_(std::move(volume)),
    monitor_(std::move(monitor)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("transfer")) {
  if(!volume_ || !monitor_) {
    throw std::invalid_argument("TransferEngine requires a volume and a device monitor");
  }
}

TransferTask TransferEngine::build_task(const fs::path& source_folder, const fs::path& mount_point) {
  std::error_code ec;
  auto resolved = fs::canonical(source_folder, ec);
  if(ec) {
    throw std::runtime_error("Unable to resolve source folder " + source_folder.string() + ": " + ec.message());
  }
  if(resolved.filename().empty()) {
    throw std::runtime_error("Source folder has no name to copy into: " + resolved.string());
  }

  auto files = discover_files(resolved, ec);
  if(ec) {
    throw std::runtime_error("Unable to scan " + resolved.string() + ": " + ec.message());
  }

  // Files are flattened to their bare name. A name that occurs more than
  // once keeps its path below the source folder so no copy replaces another.
  std::unordered_map<std::string, std::size_t> name_counts;
  for(const auto& file : files) {
    ++name_counts[file.filename().string()];
  }

  TransferTask task;
  task.destination_root = mount_point / resolved.filename();
  task.items.reserve(files.size());
  for(auto& file : compute_order(files)) {
    TransferItem item;
    item.size = fs::file_size(file, ec);
    if(ec) {
      throw std::runtime_error("Unable to read size of " + file.string() + ": " + ec.message());
    }
    if(name_counts[file.filename().string()] > 1) {
      item.dest_relative = file.lexically_relative(resolved);
    } else {
      item.dest_relative = file.filename();
    }
    item.source = std::move(file);
    task.items.push_back(std::move(item));
  }
  return task;
}

void TransferEngine::set_state(TransferState state) {
  if(state_ == state) return;
  state_ = state;
  logger_->debug("state -> {}", to_string(state));
  if(state_callback_) state_callback_(state);
}

void TransferEngine::await_device(TransferReport* report) {
  const auto resume = state_;
  set_state(TransferState::AwaitingDevice);
  if(report) ++report->disconnects;
  monitor_->wait_until_writable();
  set_state(resume);
}

void TransferEngine::log_plan(const TransferTask& task) const {
  logger_->info("Files will be copied in the following order:");
  for(std::size_t i = 0; i < task.items.size(); ++i) {
    const auto& relative = task.items[i].dest_relative;
    logger_->info("{}. {}", i + 1, relative.string());
    if(relative.has_parent_path()) {
      logger_->warn("{} appears more than once in the source tree; keeping it under {}",
                    relative.filename().string(), relative.parent_path().string());
    }
  }
  logger_->info("Total files to copy: {}", task.items.size());
  logger_->info("---");
}

TransferReport TransferEngine::run(const TransferTask& task) {
  log_plan(task);
  set_state(TransferState::AwaitingDevice);
  monitor_->wait_until_writable();
  ensure_destination(task);
  auto report = copy_all(task);
  set_state(TransferState::Complete);
  return report;
}

void TransferEngine::ensure_destination(const TransferTask& task) {
  set_state(TransferState::CreatingDestination);
  while(true) {
    monitor_->check_cancelled();
    std::error_code ec;
    if(volume_->create_directories(task.destination_root, ec)) {
      logger_->info("Destination folder ready: {}", task.destination_root.string());
      return;
    }
    logger_->warn("Unable to create destination folder {}: {}. Drive may have disconnected. Waiting for reconnection...",
                  task.destination_root.string(), ec.message());
    monitor_->pause();
    await_device(nullptr);
  }
}

bool TransferEngine::checksums_match(const fs::path& source, const fs::path& dest) const {
  std::error_code source_ec;
  std::error_code dest_ec;
  auto source_hash = sha256_file_hex(source, source_ec);
  auto dest_hash = sha256_file_hex(dest, dest_ec);
  if(source_ec || dest_ec) {
    logger_->debug("Checksum unavailable for {}: {}", dest.string(),
                   (source_ec ? source_ec : dest_ec).message());
    return false;
  }
  return source_hash == dest_hash;
}

// Size equality stands in for content equality unless verify_checksum is on.
bool TransferEngine::already_on_device(const TransferItem& item, const fs::path& dest) const {
  auto size = volume_->file_size(dest);
  if(!size || *size != item.size) return false;
  if(config_.verify_checksum && !checksums_match(item.source, dest)) {
    logger_->info("{} matches in size but not in content; copying again", item.dest_relative.string());
    return false;
  }
  return true;
}

TransferReport TransferEngine::copy_all(const TransferTask& task) {
  TransferReport report;
  report.total_files = task.items.size();
  set_state(TransferState::CopyingFiles);

  std::size_t completed = 0;
  for(const auto& item : task.items) {
    const auto dest = task.destination_root / item.dest_relative;
    const auto name = item.dest_relative.string();

    while(true) {
      monitor_->check_cancelled();
      if(!monitor_->writable()) {
        logger_->warn("Drive disconnected. Waiting for reconnection...");
        await_device(&report);
        continue;
      }

      if(already_on_device(item, dest)) {
        logger_->info("Skipping: {} (already exists)", name);
        ++report.skipped_files;
        break;
      }

      logger_->info("Copying: {}", name);
      std::error_code ec;
      const bool parent_ready = !item.dest_relative.has_parent_path() ||
                                volume_->create_directories(dest.parent_path(), ec);
      if(parent_ready && volume_->copy_file(item.source, dest, ec)) {
        if(!config_.verify_checksum || checksums_match(item.source, dest)) {
          ++report.copied_files;
          report.bytes_copied += item.size;
          break;
        }
        ec = std::make_error_code(std::errc::io_error);
        logger_->warn("Checksum mismatch after copying {}", name);
      }

      ++report.failed_attempts;
      logger_->warn("Failed to copy {}: {}. Drive may have disconnected. Retrying...", name, ec.message());
      monitor_->pause();
    }

    ++completed;
    if(progress_callback_) progress_callback_(completed, report.total_files);
  }
  return report;
}
