#pragma once

#include <memory>
#include <string>
#include <vector>

#include "sync_config.hpp"

class DeviceMonitor;
class Logger;
class Volume;

enum class DeleteOutcome { Deleted, NotFound };

// True for a single, non-special path component ("Album", not "a/b", "..").
bool is_plain_folder_name(const std::string& name);

class FolderOps {
public:
  FolderOps(SyncConfig config,
            std::shared_ptr<Volume> volume,
            std::shared_ptr<DeviceMonitor> monitor,
            std::shared_ptr<Logger> logger = nullptr);

  // Retries until the folder is gone. NotFound is returned without
  // touching the device when the folder never existed.
  DeleteOutcome delete_folder(const std::string& name);

  // Top-level directory names on the device, sorted.
  std::vector<std::string> list_folders();

private:
  SyncConfig config_;
  std::shared_ptr<Volume> volume_;
  std::shared_ptr<DeviceMonitor> monitor_;
  std::shared_ptr<Logger> logger_;
};
