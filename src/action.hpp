#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

struct CopyAction {
  std::filesystem::path source_folder;
};

struct DeleteAction {
  std::string folder_name;
};

struct ListAction {};

using SyncAction = std::variant<CopyAction, DeleteAction, ListAction>;

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// Decodes "copy <folder>", "delete <name>" or "list". On failure returns
// nullopt and fills error with a message for the user.
std::optional<SyncAction> decode_action(const std::vector<std::string>& args, std::string& error);

const char* action_name(const SyncAction& action);
