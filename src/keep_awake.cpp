#include "keep_awake.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

#if defined(__linux__)
#include <sys/prctl.h>
#endif

#include "log.hpp"

std::vector<std::string> split_command_line(const std::string& command) {
  std::vector<std::string> parts;
  std::istringstream in(command);
  std::string token;
  while(in >> token) parts.push_back(token);
  return parts;
}

std::vector<std::string> helper_arguments(const std::vector<std::string>& argv, pid_t owner) {
  std::vector<std::string> args = argv;
  if(args.empty()) return args;
  // caffeinate -w <pid> exits on its own once the owner is gone.
  if(std::filesystem::path(args.front()).filename().string() == "caffeinate" &&
     std::find(args.begin() + 1, args.end(), "-w") == args.end()) {
    args.push_back("-w");
    args.push_back(std::to_string(owner));
  }
  return args;
}

ProcessKeepAwake::ProcessKeepAwake(std::string command, std::shared_ptr<Logger> logger)
  : argv_(split_command_line(command)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("keep-awake")) {}

ProcessKeepAwake::~ProcessKeepAwake() {
  release();
}

bool ProcessKeepAwake::acquire() {
  if(pid_ > 0) return true;
  if(argv_.empty()) {
    logger_->warn("No keep-awake command configured; the system may sleep during the transfer");
    return false;
  }

  // Build argv before forking; the child only calls async-signal-safe functions.
  auto command = helper_arguments(argv_, getpid());
  std::vector<char*> args;
  args.reserve(command.size() + 1);
  for(auto& arg : command) args.push_back(const_cast<char*>(arg.c_str()));
  args.push_back(nullptr);

  pid_t pid = fork();
  if(pid < 0) {
    logger_->warn("Unable to start {}: {}", argv_.front(), std::strerror(errno));
    return false;
  }
  if(pid == 0) {
#if defined(__linux__)
    prctl(PR_SET_PDEATHSIG, SIGTERM);
#endif
    execvp(args[0], args.data());
    _exit(127);
  }

  pid_ = pid;
  logger_->debug("Started {} (pid {})", argv_.front(), pid_);
  return true;
}

void ProcessKeepAwake::release() {
  if(pid_ <= 0) return;
  const pid_t pid = pid_;
  pid_ = -1;

  int status = 0;
  if(waitpid(pid, &status, WNOHANG) == pid) {
    // Already gone; 127 means exec failed.
    if(WIFEXITED(status) && WEXITSTATUS(status) == 127) {
      logger_->warn("Keep-awake helper {} could not be started", argv_.front());
    }
    return;
  }
  if(kill(pid, SIGTERM) != 0 && errno != ESRCH) {
    logger_->warn("Unable to stop keep-awake helper (pid {}): {}", pid, std::strerror(errno));
  }
  while(waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
}

KeepAwakeGuard::KeepAwakeGuard(std::shared_ptr<KeepAwake> resource, std::shared_ptr<Logger> logger)
  : resource_(resource ? std::move(resource) : std::make_shared<NoopKeepAwake>()),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("keep-awake")) {
  held_ = true;
  if(resource_->acquire()) {
    logger_->info("System sleep prevented. The machine will stay awake until flashsync completes.");
  }
}

KeepAwakeGuard::~KeepAwakeGuard() {
  release();
}

void KeepAwakeGuard::release() {
  if(!held_) return;
  held_ = false;
  resource_->release();
  logger_->info("System can now enter sleep mode if idle.");
}
