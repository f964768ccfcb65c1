#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "sync_config.hpp"

class DeviceMonitor;
class Logger;
class Volume;

struct TransferItem {
  std::filesystem::path source;
  std::filesystem::path dest_relative;
  std::uintmax_t size = 0;
};

// Ordered copy plan for one invocation. Built once, never modified.
struct TransferTask {
  std::filesystem::path destination_root;
  std::vector<TransferItem> items;
};

enum class TransferState { AwaitingDevice, CreatingDestination, CopyingFiles, Complete };

const char* to_string(TransferState state);

struct TransferReport {
  std::size_t total_files = 0;
  std::size_t copied_files = 0;
  std::size_t skipped_files = 0;
  std::uintmax_t bytes_copied = 0;
  std::size_t failed_attempts = 0;
  std::size_t disconnects = 0;
};

class TransferEngine {
public:
  using ProgressCallback = std::function<void(std::size_t completed, std::size_t total)>;
  using StateCallback = std::function<void(TransferState state)>;

  TransferEngine(SyncConfig config,
                 std::shared_ptr<Volume> volume,
                 std::shared_ptr<DeviceMonitor> monitor,
                 std::shared_ptr<Logger> logger = nullptr);

  // Discovers and orders the files under source_folder and targets
  // mount_point/<source folder name>. Throws std::runtime_error if the
  // source cannot be read.
  static TransferTask build_task(const std::filesystem::path& source_folder,
                                 const std::filesystem::path& mount_point);

  // AwaitingDevice -> CreatingDestination -> CopyingFiles -> Complete.
  // Only returns once every item is on the device.
  TransferReport run(const TransferTask& task);

  void ensure_destination(const TransferTask& task);
  TransferReport copy_all(const TransferTask& task);

  void set_progress_callback(ProgressCallback callback) { progress_callback_ = std::move(callback); }
  void set_state_callback(StateCallback callback) { state_callback_ = std::move(callback); }

  TransferState state() const { return state_; }

private:
  void set_state(TransferState state);
  void await_device(TransferReport* report);
  bool already_on_device(const TransferItem& item, const std::filesystem::path& dest) const;
  bool checksums_match(const std::filesystem::path& source, const std::filesystem::path& dest) const;
  void log_plan(const TransferTask& task) const;

  SyncConfig config_;
  std::shared_ptr<Volume> volume_;
  std::shared_ptr<DeviceMonitor> monitor_;
  std::shared_ptr<Logger> logger_;
  ProgressCallback progress_callback_;
  StateCallback state_callback_;
  TransferState state_ = TransferState::AwaitingDevice;
};
