#include "shutdown_signals.hpp"

#include <csignal>
#include <cstring>

#include "cancellation.hpp"
#include "log.hpp"

ShutdownSignals::ShutdownSignals(std::shared_ptr<CancellationToken> token, std::shared_ptr<Logger> logger)
  : token_(std::move(token)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("signals")),
    signals_(io_) {}

ShutdownSignals::~ShutdownSignals() {
  stop();
}

void ShutdownSignals::start() {
  if(started_) return;
  started_ = true;

  signals_.add(SIGINT);
  signals_.add(SIGTERM);
#if defined(SIGHUP)
  signals_.add(SIGHUP);
#endif
  arm();
  io_thread_ = std::thread([this](){
    io_.run();
  });
}

void ShutdownSignals::arm() {
  signals_.async_wait([this](const std::error_code& ec, int signal_number){
    if(ec) return;
    int expected = 0;
    if(received_signal_.compare_exchange_strong(expected, signal_number)) {
      logger_->warn("Received {}; stopping after the current step", strsignal(signal_number));
      if(token_) token_->cancel();
    } else {
      logger_->warn("Already shutting down (received {})", strsignal(signal_number));
    }
    arm();
  });
}

void ShutdownSignals::stop() {
  if(!started_) return;
  started_ = false;

  std::error_code ec;
  signals_.cancel(ec);
  signals_.clear(ec);
  io_.stop();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  io_.restart();
}
