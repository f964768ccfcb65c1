#include "log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <cstring>
#include <mutex>
#include <vector>

namespace {

constexpr const char* kTimestampPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
constexpr const char* kFilePattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

std::shared_ptr<spdlog::logger> g_info_logger;
std::shared_ptr<spdlog::logger> g_error_logger;
std::shared_ptr<spdlog::logger> g_print_logger;
std::shared_ptr<spdlog::logger> g_print_err_logger;
std::shared_ptr<spdlog::sinks::basic_file_sink_mt> g_file_sink;
std::mutex g_setup_mutex;
std::atomic<bool> g_log_passthrough{true};

std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            spdlog::sink_ptr sink,
                                            spdlog::level::level_enum flush_level) {
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->flush_on(flush_level);
  spdlog::register_logger(logger);
  return logger;
}

void create_loggers_locked() {
  if(g_info_logger) return;

  auto info_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  info_sink->set_pattern(kTimestampPattern);

  auto error_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  error_sink->set_pattern(kTimestampPattern);

  auto plain_out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  plain_out_sink->set_pattern("%v");

  auto plain_err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  plain_err_sink->set_pattern("%v");

  g_info_logger = make_logger("flashsync.info", std::move(info_sink), spdlog::level::warn);
  g_error_logger = make_logger("flashsync.error", std::move(error_sink), spdlog::level::err);
  g_print_logger = make_logger("flashsync.print", std::move(plain_out_sink), spdlog::level::info);
  g_print_err_logger = make_logger("flashsync.print_err", std::move(plain_err_sink), spdlog::level::err);
}

void attach_file_sink_locked(const std::string& log_file) {
  if(log_file.empty() || g_file_sink) return;
  try {
    g_file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  } catch(const spdlog::spdlog_ex& e) {
    g_print_err_logger->error("Unable to open log file {}: {}", log_file, e.what());
    return;
  }
  g_file_sink->set_pattern(kFilePattern);
  for(auto* logger : {g_info_logger.get(), g_error_logger.get(),
                      g_print_logger.get(), g_print_err_logger.get()}) {
    logger->sinks().push_back(g_file_sink);
  }
}

void ensure_loggers() {
  std::lock_guard<std::mutex> lock(g_setup_mutex);
  create_loggers_locked();
}

} // namespace

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

Logger::Logger(std::string name) : name_(std::move(name)) {}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<ListenerBinding> listeners_snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listeners_snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      listeners_snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& binding : listeners_snapshot) {
    try {
      if(binding.callback && binding.callback(binding.user_data, channel, level, message)) {
        handled = true;
      }
    } catch(const std::exception& e) {
      detail::emit_to_default("error", "log", spdlog::level::err,
                              fmt::format("log listener failed: {}", e.what()));
    }
  }
  return handled;
}

void Logger::fallback(const char* base_channel,
                      const std::string& channel_name,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  detail::emit_to_default(base_channel, channel_name, level, message);
}

void init(bool verbose, const std::string& log_file) {
  std::lock_guard<std::mutex> lock(g_setup_mutex);
  create_loggers_locked();
  attach_file_sink_locked(log_file);

  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_info_logger->set_level(level);
  g_error_logger->set_level(spdlog::level::info);
  g_print_logger->set_level(spdlog::level::info);
  g_print_err_logger->set_level(spdlog::level::info);

  spdlog::set_default_logger(g_info_logger);
  spdlog::set_level(level);
}

namespace detail {

void emit_to_default(const char* base_channel,
                     const std::string& channel_name,
                     spdlog::level::level_enum level,
                     const std::string& message) {
  ensure_loggers();
  if(!log_passthrough()) return;

  // print channels are user-facing output and never carry the channel prefix.
  if(std::strcmp(base_channel, "print") == 0) {
    g_print_logger->log(level, message);
    return;
  }
  if(std::strcmp(base_channel, "print_err") == 0) {
    g_print_err_logger->log(level, message);
    return;
  }

  spdlog::logger* sink = nullptr;
  if(std::strcmp(base_channel, "error") == 0 || std::strcmp(base_channel, "warn") == 0) {
    sink = g_error_logger.get();
  } else {
    sink = g_info_logger.get();
  }

  if(!sink) return;
  if(!channel_name.empty() && channel_name != base_channel) {
    sink->log(level, fmt::format("[{}] {}", channel_name, message));
  } else {
    sink->log(level, message);
  }
}

} // namespace detail
