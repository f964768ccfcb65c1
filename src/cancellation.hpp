#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>

class OperationCancelled : public std::runtime_error {
public:
  OperationCancelled() : std::runtime_error("operation cancelled") {}
};

// Shared stop flag for the polling loops. Every pause in the engine goes
// through wait_for so a cancel() wakes it immediately.
class CancellationToken {
public:
  void cancel();
  bool cancelled() const;

  // Sleeps for the given duration. Returns false if cancelled before or
  // during the wait.
  bool wait_for(std::chrono::milliseconds duration);

  // wait_for that throws OperationCancelled instead of returning false.
  void pause(std::chrono::milliseconds duration);
  void throw_if_cancelled() const;

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool cancelled_ = false;
};
