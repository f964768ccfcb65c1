#include "sync_config.hpp"

#include <algorithm>
#include <cstdlib>

#include "settings_manager.hpp"

std::filesystem::path default_mount_point(const std::string& device_name) {
#if defined(__APPLE__)
  return std::filesystem::path("/Volumes") / device_name;
#else
  const char* user = std::getenv("USER");
  if(!user || !*user) user = std::getenv("LOGNAME");
  if(!user || !*user) {
    return std::filesystem::path("/media") / device_name;
  }
  return std::filesystem::path("/media") / user / device_name;
#endif
}

SyncConfig SyncConfig::from_settings(const SettingsManager& settings) {
  SyncConfig config;
  config.device_name = settings.get<std::string>("device_name");

  auto mount = settings.get<std::string>("mount_point");
  config.mount_point = mount.empty()
    ? default_mount_point(config.device_name)
    : std::filesystem::path(mount);

  config.poll_interval = std::chrono::milliseconds(std::max(1, settings.get<int>("poll_interval_ms")));
  config.wait_log_interval = static_cast<std::size_t>(std::max(1, settings.get<int>("wait_log_interval")));
  config.progress_width = static_cast<std::size_t>(std::max(1, settings.get<int>("progress_meter_size")));
  config.show_progress = settings.get<bool>("progress");
  config.verify_checksum = settings.get<bool>("verify_checksum");
  config.keep_awake = settings.get<bool>("keep_awake");
  config.keep_awake_command = settings.get<std::string>("keep_awake_command");
  return config;
}
