#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "sync_config.hpp"

class CancellationToken;
class Logger;
class Volume;

enum class DeviceState { Absent, PresentReadOnly, PresentWritable };

const char* to_string(DeviceState state);

// Probes the mount point fresh on every call; nothing about the device is
// cached between checks.
class DeviceMonitor {
public:
  static constexpr const char* kProbeMarker = ".flashsync_probe";

  DeviceMonitor(SyncConfig config,
                std::shared_ptr<Volume> volume,
                std::shared_ptr<CancellationToken> cancel,
                std::shared_ptr<Logger> logger = nullptr);

  DeviceState probe() const;
  bool writable() const { return probe() == DeviceState::PresentWritable; }

  // Blocks until probe() reports PresentWritable. Never times out; throws
  // OperationCancelled if the token is cancelled while waiting.
  void wait_until_writable();

  // One poll interval of sleep, interruptible by the token.
  void pause() const;
  void check_cancelled() const;

  const SyncConfig& config() const { return config_; }
  const std::filesystem::path& mount_point() const { return config_.mount_point; }

private:
  SyncConfig config_;
  std::shared_ptr<Volume> volume_;
  std::shared_ptr<CancellationToken> cancel_;
  std::shared_ptr<Logger> logger_;
};
