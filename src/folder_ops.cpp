#include "folder_ops.hpp"

#include <algorithm>
#include <stdexcept>

#include "device_monitor.hpp"
#include "log.hpp"
#include "volume.hpp"

bool is_plain_folder_name(const std::string& name) {
  if(name.empty() || name == "." || name == "..") return false;
  return name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
}

FolderOps::FolderOps(SyncConfig config,
                     std::shared_ptr<Volume> volume,
                     std::shared_ptr<DeviceMonitor> monitor,
                     std::shared_ptr<Logger> logger)
  : config_(std::move(config)),
    volume_(std::move(volume)),
    monitor_(std::move(monitor)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("folders")) {
  if(!volume_ || !monitor_) {
    throw std::invalid_argument("FolderOps requires a volume and a device monitor");
  }
}

DeleteOutcome FolderOps::delete_folder(const std::string& name) {
  if(!is_plain_folder_name(name)) {
    throw std::invalid_argument("Not a top-level folder name: '" + name + "'");
  }
  const auto target = config_.mount_point / name;

  while(true) {
    monitor_->check_cancelled();
    if(!monitor_->writable()) {
      monitor_->wait_until_writable();
      continue;
    }
    if(!volume_->is_directory(target)) {
      logger_->info("Folder {} does not exist on the drive.", name);
      return DeleteOutcome::NotFound;
    }

    logger_->info("Deleting folder: {}", name);
    std::error_code ec;
    if(volume_->remove_all(target, ec)) {
      logger_->info("Folder deleted successfully.");
      return DeleteOutcome::Deleted;
    }
    logger_->warn("Failed to delete folder {}: {}. Retrying...", name, ec.message());
    monitor_->pause();
  }
}

std::vector<std::string> FolderOps::list_folders() {
  while(true) {
    monitor_->check_cancelled();
    if(!monitor_->writable()) {
      monitor_->wait_until_writable();
      continue;
    }

    std::error_code ec;
    auto names = volume_->list_directories(config_.mount_point, ec);
    if(ec) {
      logger_->warn("Unable to list {}: {}. Retrying...", config_.mount_point.string(), ec.message());
      monitor_->pause();
      continue;
    }

    std::sort(names.begin(), names.end());
    logger_->print("Folders on {}:", config_.device_name);
    if(names.empty()) {
      logger_->print("(none)");
    }
    for(const auto& name : names) {
      logger_->print("- {}", name);
    }
    return names;
  }
}
