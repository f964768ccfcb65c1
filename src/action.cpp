#include "action.hpp"

#include "folder_ops.hpp"

std::optional<SyncAction> decode_action(const std::vector<std::string>& args, std::string& error) {
  error.clear();
  if(args.empty()) {
    error = "No action given.";
    return std::nullopt;
  }

  const auto& verb = args.front();
  auto expect_argument = [&](const char* what) -> std::optional<std::string> {
    if(args.size() < 2 || args[1].empty()) {
      error = std::string("Please specify the ") + what + ".";
      return std::nullopt;
    }
    if(args.size() > 2) {
      error = "Unexpected argument '" + args[2] + "'.";
      return std::nullopt;
    }
    return args[1];
  };

  if(verb == "copy") {
    auto source = expect_argument("source folder path for copying");
    if(!source) return std::nullopt;
    return SyncAction{CopyAction{*source}};
  }
  if(verb == "delete") {
    auto name = expect_argument("folder name to delete");
    if(!name) return std::nullopt;
    // Shell completion appends a separator to directory names.
    if(name->size() > 1 && (name->back() == '/' || name->back() == '\\')) {
      name->pop_back();
    }
    if(!is_plain_folder_name(*name)) {
      error = "Folder name must be a single top-level folder on the drive: '" + *name + "'.";
      return std::nullopt;
    }
    return SyncAction{DeleteAction{*name}};
  }
  if(verb == "list") {
    if(args.size() > 1) {
      error = "Unexpected argument '" + args[1] + "'.";
      return std::nullopt;
    }
    return SyncAction{ListAction{}};
  }

  error = "Invalid action '" + verb + "'. Use 'copy', 'delete', or 'list'.";
  return std::nullopt;
}

const char* action_name(const SyncAction& action) {
  return std::visit(overloaded{
    [](const CopyAction&) { return "copy"; },
    [](const DeleteAction&) { return "delete"; },
    [](const ListAction&) { return "list"; },
  }, action);
}
