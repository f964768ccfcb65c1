#include "command_line_parser.hpp"

#include <cctype>
#include <sstream>

#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name,
                                     nlohmann::json settings_spec)
  : process_name_(std::move(process_name)),
    settings_spec_(std::move(settings_spec)) {}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return true;
  if(candidate.size() >= 2 && candidate[0] == '-' &&
     (std::isalpha(static_cast<unsigned char>(candidate[1])) || candidate[1] == '?')) {
    return true;
  }
  return false;
}

std::vector<std::string> CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  return parse(args, settings);
}

std::vector<std::string> CommandLineParser::parse(const std::vector<std::string>& args,
                                                  SettingsManager& settings) const {
  std::vector<std::string> positionals;
  bool options_done = false;

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    if(options_done || !is_option_token(token)) {
      positionals.push_back(token);
      continue;
    }
    if(token == "--") {
      options_done = true;
      continue;
    }

    const bool long_form = token.rfind("--", 0) == 0;
    std::string key = token.substr(long_form ? 2 : 1);
    std::string inline_value;
    bool has_inline_value = false;
    if(auto eq = key.find('='); eq != std::string::npos) {
      inline_value = key.substr(eq + 1);
      key = key.substr(0, eq);
      has_inline_value = true;
    }

    auto resolved = settings.resolve_key(key);
    if(!resolved) {
      throw CommandLineError("Unknown option " + token);
    }

    std::string value;
    if(has_inline_value) {
      value = inline_value;
    } else if(settings.is_bool_setting(*resolved)) {
      if(i + 1 < args.size() && !is_option_token(args[i + 1]) &&
         SettingsManager::is_bool_literal(args[i + 1])) {
        value = args[++i];
      } else {
        value = "true";
      }
    } else {
      if(i + 1 >= args.size()) {
        throw CommandLineError("Missing value for option '" + key + "'");
      }
      value = args[++i];
    }

    std::string error;
    if(!settings.set_from_string(*resolved, value, error)) {
      throw CommandLineError("Invalid value for option '" + key + "': " + error);
    }
  }
  return positionals;
}

void CommandLineParser::usage() const {
  print_out(nullptr, "{} - resilient copy to a removable drive", process_name_);
  print_out(nullptr, "Usage:");
  print_out(nullptr, "  {} [options] copy <folder_path>   copy files from a local folder to the drive", process_name_);
  print_out(nullptr, "  {} [options] delete <folder_name> delete a top-level folder from the drive", process_name_);
  print_out(nullptr, "  {} [options] list                 list the top-level folders on the drive", process_name_);
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& entry : settings_spec_) {
    auto key = entry.at("key").get<std::string>();
    auto type = entry.at("type").get<std::string>();
    std::string argument_hint = (type == "bool") ? "[true|false]" : "<" + type + ">";
    std::ostringstream aliases;
    if(entry.contains("aliases")) {
      const auto alias_list = entry.at("aliases").get<std::vector<std::string>>();
      if(!alias_list.empty()) {
        aliases << " (alias: ";
        for(std::size_t i = 0; i < alias_list.size(); ++i) {
          if(i > 0) aliases << ", ";
          aliases << "-" << alias_list[i];
        }
        aliases << ")";
      }
    }
    auto description = entry.value("description", "");
    auto default_value = entry.at("default");
    std::string default_str;
    if(type == "bool") {
      default_str = default_value.get<bool>() ? "true" : "false";
    } else if(default_value.is_string()) {
      default_str = default_value.get<std::string>();
    } else {
      default_str = default_value.dump();
    }
    print_out(nullptr, "  --{} {:<12} {}{} (default: {})",
              key,
              argument_hint,
              description,
              aliases.str(),
              default_str);
  }
  print_out(nullptr, "");
}
