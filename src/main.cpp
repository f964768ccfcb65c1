#include <cpptrace/cpptrace.hpp>

#include <memory>
#include <string>
#include <vector>

#include "action.hpp"
#include "cancellation.hpp"
#include "command_line_parser.hpp"
#include "keep_awake.hpp"
#include "log.hpp"
#include "orchestrator.hpp"
#include "settings_manager.hpp"
#include "shutdown_signals.hpp"
#include "sync_config.hpp"
#include "volume.hpp"

int main(int argc, char** argv){
  try {
    SettingsManager settings;
    settings.load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "flashsync");
    std::vector<std::string> positionals;
    try {
      positionals = parser.parse(argc, argv, settings);
    } catch(const CommandLineError& e) {
      print_err(nullptr, "{}", e.what());
      parser.usage();
      return Orchestrator::kExitUserError;
    }
    if(settings.help_requested()) {
      parser.usage();
      return 0;
    }

    init(settings.get<bool>("verbose"), settings.get<std::string>("log_file"));
    auto logger = std::make_shared<Logger>("flashsync");

    if(settings.save_requested()) {
      if(!settings.save()) {
        logger->error("Unable to persist settings to {}", settings.settings_path().string());
      } else {
        logger->info("Settings saved to {}", settings.settings_path().string());
      }
      if(positionals.empty()) return 0;
    }

    std::string error;
    auto action = decode_action(positionals, error);
    if(!action) {
      print_err(nullptr, "{}", error);
      parser.usage();
      return Orchestrator::kExitUserError;
    }

    const auto config = SyncConfig::from_settings(settings);
    logger->info("flashsync started with action: {}", action_name(*action));
    logger->debug("Device {} expected at {}", config.device_name, config.mount_point.string());

    auto cancel = std::make_shared<CancellationToken>();
    ShutdownSignals signals(cancel);
    signals.start();

    std::shared_ptr<KeepAwake> keep_awake;
    if(config.keep_awake) {
      keep_awake = std::make_shared<ProcessKeepAwake>(config.keep_awake_command);
    } else {
      keep_awake = std::make_shared<NoopKeepAwake>();
    }

    Orchestrator orchestrator(config, std::make_shared<LocalVolume>(), keep_awake, cancel);
    int status = orchestrator.run(*action);
    signals.stop();

    if(status == Orchestrator::kExitSuccess) {
      logger->info("flashsync execution completed.");
    }
    return status;
  } catch(std::exception& e) {
    init(false);
    Logger logger("flashsync-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
