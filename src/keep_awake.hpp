#pragma once

#include <memory>
#include <string>
#include <sys/types.h>
#include <vector>

class Logger;

// OS-level request that keeps the host from sleeping while held.
class KeepAwake {
public:
  virtual ~KeepAwake() = default;
  virtual bool acquire() = 0;
  virtual void release() = 0;
};

class NoopKeepAwake : public KeepAwake {
public:
  bool acquire() override { return true; }
  void release() override {}
};

// Holds a helper process (caffeinate, systemd-inhibit, ...) for as long as
// the resource is acquired.
class ProcessKeepAwake : public KeepAwake {
public:
  explicit ProcessKeepAwake(std::string command, std::shared_ptr<Logger> logger = nullptr);
  ~ProcessKeepAwake() override;

  ProcessKeepAwake(const ProcessKeepAwake&) = delete;
  ProcessKeepAwake& operator=(const ProcessKeepAwake&) = delete;

  bool acquire() override;
  void release() override;

  pid_t helper_pid() const { return pid_; }

private:
  std::vector<std::string> argv_;
  std::shared_ptr<Logger> logger_;
  pid_t pid_ = -1;
};

// Acquires on construction and releases exactly once, on release() or
// destruction, whichever comes first.
class KeepAwakeGuard {
public:
  explicit KeepAwakeGuard(std::shared_ptr<KeepAwake> resource,
                          std::shared_ptr<Logger> logger = nullptr);
  ~KeepAwakeGuard();

  KeepAwakeGuard(const KeepAwakeGuard&) = delete;
  KeepAwakeGuard& operator=(const KeepAwakeGuard&) = delete;

  void release();
  bool held() const { return held_; }

private:
  std::shared_ptr<KeepAwake> resource_;
  std::shared_ptr<Logger> logger_;
  bool held_ = false;
};

std::vector<std::string> split_command_line(const std::string& command);

// Helper argv as executed for a process owned by `owner`. caffeinate gets
// "-w <owner>" so it cannot outlive flashsync even after SIGKILL.
std::vector<std::string> helper_arguments(const std::vector<std::string>& argv, pid_t owner);
