#pragma once

#include <asio.hpp>

#include <atomic>
#include <memory>
#include <thread>

class CancellationToken;
class Logger;

// Turns SIGINT/SIGTERM/SIGHUP into a cancellation of the shared token so the
// polling loops unwind and scoped resources are released.
class ShutdownSignals {
public:
  ShutdownSignals(std::shared_ptr<CancellationToken> token,
                  std::shared_ptr<Logger> logger = nullptr);
  ~ShutdownSignals();

  ShutdownSignals(const ShutdownSignals&) = delete;
  ShutdownSignals& operator=(const ShutdownSignals&) = delete;

  void start();
  void stop();

  int received_signal() const { return received_signal_.load(); }

private:
  void arm();

  std::shared_ptr<CancellationToken> token_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  asio::signal_set signals_;
  std::thread io_thread_;
  std::atomic<int> received_signal_{0};
  bool started_ = false;
};
