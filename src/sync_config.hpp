#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

class SettingsManager;

// Immutable run configuration handed to every component at construction.
struct SyncConfig {
  std::string device_name = "H2OSTREAMDM";
  std::filesystem::path mount_point;
  std::chrono::milliseconds poll_interval{1000};
  std::size_t wait_log_interval = 5;
  std::size_t progress_width = 50;
  bool show_progress = true;
  bool verify_checksum = false;
  bool keep_awake = true;
  std::string keep_awake_command;

  static SyncConfig from_settings(const SettingsManager& settings);
};

// /Volumes/<name> on macOS, /media/<user>/<name> elsewhere.
std::filesystem::path default_mount_point(const std::string& device_name);
