#include "device_monitor.hpp"

#include <chrono>

#include "cancellation.hpp"
#include "log.hpp"
#include "volume.hpp"

namespace {

std::string format_elapsed(std::chrono::milliseconds elapsed) {
  if(elapsed.count() % 1000 == 0) {
    return fmt::format("{} seconds", elapsed.count() / 1000);
  }
  return fmt::format("{:.1f} seconds", static_cast<double>(elapsed.count()) / 1000.0);
}

} // namespace

const char* to_string(DeviceState state) {
  switch(state) {
    case DeviceState::Absent: return "absent";
    case DeviceState::PresentReadOnly: return "read-only";
    case DeviceState::PresentWritable: return "writable";
  }
  return "unknown";
}

DeviceMonitor::DeviceMonitor(SyncConfig config,
                             std::shared_ptr<Volume> volume,
                             std::shared_ptr<CancellationToken> cancel,
                             std::shared_ptr<Logger> logger)
  : config_(std::move(config)),
    volume_(std::move(volume)),
    cancel_(cancel ? std::move(cancel) : std::make_shared<CancellationToken>()),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("device")) {}

DeviceState DeviceMonitor::probe() const {
  const auto& mount = config_.mount_point;
  if(!volume_->is_directory(mount)) {
    return DeviceState::Absent;
  }

  const auto marker = mount / kProbeMarker;
  std::error_code ec;
  if(!volume_->write_marker(marker, ec)) {
    logger_->debug("Probe write to {} failed: {}", marker.string(), ec.message());
    // A half-written marker may still be there if the failure came late.
    std::error_code cleanup_ec;
    volume_->remove(marker, cleanup_ec);
    logger_->info("Drive {} detected but not writable. Treating as disconnected.", config_.device_name);
    return DeviceState::PresentReadOnly;
  }
  if(!volume_->remove(marker, ec)) {
    logger_->debug("Probe cleanup of {} failed: {}", marker.string(), ec.message());
    return DeviceState::PresentReadOnly;
  }
  return DeviceState::PresentWritable;
}

void DeviceMonitor::pause() const {
  cancel_->pause(config_.poll_interval);
}

void DeviceMonitor::check_cancelled() const {
  cancel_->throw_if_cancelled();
}

void DeviceMonitor::wait_until_writable() {
  cancel_->throw_if_cancelled();
  if(writable()) return;

  logger_->info("Waiting for drive {} to be connected and writable...", config_.device_name);
  std::size_t polls = 0;
  do {
    pause();
    ++polls;
    if(polls % config_.wait_log_interval == 0) {
      logger_->info("Still waiting for drive {}... ({})",
                    config_.device_name,
                    format_elapsed(config_.poll_interval * static_cast<std::chrono::milliseconds::rep>(polls)));
    }
  } while(!writable());
  logger_->info("Drive {} connected and writable.", config_.device_name);
}
