#include "action.hpp"
#include "keep_awake.hpp"
#include "orchestrator.hpp"
#include "settings_manager.hpp"
#include "sync_config.hpp"
#include "volume.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

int main() {
  namespace fs = std::filesystem;

  auto base = fs::temp_directory_path() / "transfer_sample";
  std::error_code ec;
  fs::remove_all(base, ec);
  fs::create_directories(base / "Album" / "Disc2", ec);
  fs::create_directories(base / "SAMPLEDRIVE", ec);

  const char* tracks[] = {"track_03_of_04.mp3", "track_01_of_04.mp3", "Disc2/track_04_of_04.mp3",
                          "track_02_of_04.mp3", "cover.jpg"};
  for(const auto* track : tracks) {
    std::ofstream out(base / "Album" / track, std::ios::binary);
    out << "sample audio for " << track;
  }

  SettingsManager settings;
  settings.set_settings_path(base / ".config" / "settings.json");
  auto configure = [&settings](const std::string& key, const nlohmann::json& value){
    std::string error;
    if(!settings.set_from_json(key, value, error)) {
      throw std::runtime_error("Failed to set setting " + key + ": " + error);
    }
  };
  configure("device_name", "SAMPLEDRIVE");
  configure("mount_point", (base / "SAMPLEDRIVE").string());
  configure("poll_interval_ms", 10);
  configure("keep_awake", false);

  auto config = SyncConfig::from_settings(settings);
  Orchestrator orchestrator(config, std::make_shared<LocalVolume>(), std::make_shared<NoopKeepAwake>(), nullptr);

  int status = orchestrator.run(CopyAction{base / "Album"});
  if(status == Orchestrator::kExitSuccess) {
    // A second pass finds everything in place.
    status = orchestrator.run(CopyAction{base / "Album"});
  }
  if(status == Orchestrator::kExitSuccess) {
    status = orchestrator.run(ListAction{});
  }
  if(status == Orchestrator::kExitSuccess) {
    status = orchestrator.run(DeleteAction{"Album"});
  }

  const auto& report = orchestrator.last_report();
  if(status == Orchestrator::kExitSuccess && report && report->skipped_files != report->total_files) {
    std::cerr << "second pass copied files again\n";
    status = 1;
  }

  fs::remove_all(base, ec);
  return status;
}
