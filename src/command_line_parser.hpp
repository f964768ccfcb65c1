#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "settings_manager.hpp"

class CommandLineError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "flashsync",
                    nlohmann::json settings_spec = SETTINGS_SPECIFICATION);

  // Applies --key value / -alias value options to settings and returns the
  // positional arguments in order. Throws CommandLineError on bad input.
  std::vector<std::string> parse(int argc, char* argv[], SettingsManager& settings) const;
  std::vector<std::string> parse(const std::vector<std::string>& args, SettingsManager& settings) const;
  void usage() const;

private:
  static bool is_option_token(const std::string& candidate);

  std::string process_name_;
  nlohmann::json settings_spec_;
};
