#include "log.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <mutex>
#include <vector>

namespace {
std::shared_ptr<spdlog::logger> g_out_logger;
std::shared_ptr<spdlog::logger> g_err_logger;
std::once_flag g_create_once;
std::atomic<bool> g_log_passthrough{true};

void create_loggers() {
  auto out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  out_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [t%t] %v");

  auto err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  err_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [t%t] %v");

  g_out_logger = std::make_shared<spdlog::logger>("usenetsync.out", std::move(out_sink));
  g_err_logger = std::make_shared<spdlog::logger>("usenetsync.err", std::move(err_sink));

  spdlog::register_logger(g_out_logger);
  spdlog::register_logger(g_err_logger);

  g_out_logger->set_level(spdlog::level::info);
  g_err_logger->set_level(spdlog::level::err);
  g_out_logger->flush_on(spdlog::level::warn);
  g_err_logger->flush_on(spdlog::level::err);
}

void ensure_loggers() {
  std::call_once(g_create_once, create_loggers);
}

} // namespace

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

void init(bool verbose) {
  ensure_loggers();
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_out_logger->set_level(level);
  spdlog::set_default_logger(g_out_logger);
  spdlog::set_level(level);
}

bool add_log_file(const std::filesystem::path& path, std::size_t max_bytes, std::size_t max_files) {
  ensure_loggers();
  std::error_code ec;
  if(path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
  try {
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path.string(), max_bytes, max_files);
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [t%t] %v");
    g_out_logger->sinks().push_back(file_sink);
    g_err_logger->sinks().push_back(file_sink);
  } catch(const spdlog::spdlog_ex& e) {
    detail::emit_to_default("log", spdlog::level::err,
                            fmt::format("cannot open log file {}: {}", path.string(), e.what()));
    return false;
  }
  return true;
}

Logger::Logger() = default;
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

void Logger::clear_listeners() {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.clear();
}

bool Logger::dispatch(spdlog::level::level_enum level, const std::string& message) {
  std::vector<ListenerBinding> listeners_snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    if(listeners_.empty()) return false;
    listeners_snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      listeners_snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& binding : listeners_snapshot) {
    try {
      if(binding.callback && binding.callback(binding.user_data, name_, level, message)) {
        handled = true;
      }
    } catch(const std::exception& e) {
      detail::emit_to_default(name_, spdlog::level::warn,
                              fmt::format("log listener threw: {}", e.what()));
    }
  }
  return handled;
}

void Logger::detail_emit(spdlog::level::level_enum level, const std::string& message) {
  detail::emit_to_default(name_, level, message);
}

namespace detail {

void emit_to_default(const std::string& channel,
                     spdlog::level::level_enum level,
                     const std::string& message) {
  ensure_loggers();
  if(!log_passthrough()) return;

  spdlog::logger* sink = (level >= spdlog::level::err) ? g_err_logger.get() : g_out_logger.get();
  if(!sink) return;
  if(!channel.empty()) {
    sink->log(level, fmt::format("[{}] {}", channel, message));
  } else {
    sink->log(level, message);
  }
}

} // namespace detail
