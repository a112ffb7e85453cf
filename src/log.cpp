#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace {

struct DefaultSinks {
  std::shared_ptr<spdlog::logger> info;
  std::shared_ptr<spdlog::logger> error;
  std::shared_ptr<spdlog::logger> print;
  std::shared_ptr<spdlog::logger> print_err;
};

std::once_flag g_sinks_once;
DefaultSinks g_sinks;
std::atomic<bool> g_log_passthrough{true};

std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            spdlog::sink_ptr sink,
                                            const char* pattern,
                                            spdlog::level::level_enum flush_level) {
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->flush_on(flush_level);
  spdlog::register_logger(logger);
  return logger;
}

const DefaultSinks& sinks() {
  std::call_once(g_sinks_once, [](){
    const char* stamped = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
    g_sinks.info = make_logger("modsync.info",
                               std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
                               stamped, spdlog::level::warn);
    g_sinks.error = make_logger("modsync.error",
                                std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                                stamped, spdlog::level::err);
    g_sinks.print = make_logger("modsync.print",
                                std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
                                "%v", spdlog::level::info);
    g_sinks.print_err = make_logger("modsync.print_err",
                                    std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                                    "%v", spdlog::level::err);
  });
  return g_sinks;
}

} // namespace

void init(bool verbose) {
  const auto& s = sinks();
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  s.info->set_level(level);
  s.error->set_level(spdlog::level::info);
  s.print->set_level(spdlog::level::info);
  s.print_err->set_level(spdlog::level::info);

  spdlog::set_default_logger(s.info);
  spdlog::set_level(level);
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

Logger::Logger() = default;
Logger::Logger(std::string name) : name_(std::move(name)) {}

void Logger::set_name(std::string name) {
  name_ = std::move(name);
}

LogListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, std::move(listener));
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
  std::vector<Listener> snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    if(listeners_.empty()) return false;
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& listener : snapshot) {
    try {
      if(listener(name_, level, message)) {
        handled = true;
      }
    } catch(const std::exception& e) {
      detail::emit_to_default(Channel::Error, name_, spdlog::level::err,
                              fmt::format("log listener failed: {}", e.what()));
    }
  }
  return handled;
}

void Logger::emit(Channel channel,
                  spdlog::level::level_enum level,
                  const std::string& message) const {
  detail::emit_to_default(channel, name_, level, message);
}

namespace detail {

void emit_to_default(Logger::Channel channel,
                     const std::string& prefix,
                     spdlog::level::level_enum level,
                     const std::string& message) {
  const auto& s = sinks();
  if(!log_passthrough()) return;

  switch(channel) {
    case Logger::Channel::Print:
      s.print->log(level, message);
      return;
    case Logger::Channel::PrintErr:
      s.print_err->log(level, message);
      return;
    case Logger::Channel::Error:
    case Logger::Channel::Info: {
      auto& sink = (channel == Logger::Channel::Error) ? s.error : s.info;
      if(prefix.empty()) {
        sink->log(level, message);
      } else {
        sink->log(level, fmt::format("[{}] {}", prefix, message));
      }
      return;
    }
  }
}

} // namespace detail
