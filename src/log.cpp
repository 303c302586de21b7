#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <atomic>
#include <mutex>
#include <vector>

namespace {

constexpr const char* kStampedPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
constexpr const char* kPlainPattern = "%v";

std::array<std::shared_ptr<spdlog::logger>, 4> g_route_loggers;
std::once_flag g_create_once;
std::atomic<bool> g_log_passthrough{true};

std::size_t route_index(LogRoute route) {
  return static_cast<std::size_t>(route);
}

template<typename Sink>
std::shared_ptr<spdlog::logger> make_route_logger(const char* name, const char* pattern) {
  auto sink = std::make_shared<Sink>();
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  spdlog::register_logger(logger);
  return logger;
}

void create_loggers() {
  std::call_once(g_create_once, [](){
    auto& info = g_route_loggers[route_index(LogRoute::Info)];
    auto& error = g_route_loggers[route_index(LogRoute::Error)];
    auto& print = g_route_loggers[route_index(LogRoute::Print)];
    auto& print_err = g_route_loggers[route_index(LogRoute::PrintErr)];

    info = make_route_logger<spdlog::sinks::stdout_color_sink_mt>("rfetch.info", kStampedPattern);
    error = make_route_logger<spdlog::sinks::stderr_color_sink_mt>("rfetch.error", kStampedPattern);
    print = make_route_logger<spdlog::sinks::stdout_color_sink_mt>("rfetch.print", kPlainPattern);
    print_err = make_route_logger<spdlog::sinks::stderr_color_sink_mt>("rfetch.print_err", kPlainPattern);

    info->flush_on(spdlog::level::warn);
    error->flush_on(spdlog::level::err);
    print->flush_on(spdlog::level::info);
    print_err->flush_on(spdlog::level::err);
  });
}

} // namespace

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

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<ListenerBinding> snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& binding : snapshot) {
    try {
      if(binding.callback && binding.callback(binding.user_data, channel, level, message)) {
        handled = true;
      }
    } catch(const std::exception& e) {
      detail::emit_to_route(LogRoute::Error, name_, spdlog::level::err,
                            fmt::format("log listener threw: {}", e.what()));
    }
  }
  return handled;
}

void Logger::emit(LogRoute route,
                  const std::string& /*channel_name*/,
                  spdlog::level::level_enum level,
                  const std::string& message) {
  detail::emit_to_route(route, name_, level, message);
}

void init(bool verbose) {
  create_loggers();
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_route_loggers[route_index(LogRoute::Info)]->set_level(level);
  g_route_loggers[route_index(LogRoute::Error)]->set_level(spdlog::level::info);
  g_route_loggers[route_index(LogRoute::Print)]->set_level(spdlog::level::info);
  g_route_loggers[route_index(LogRoute::PrintErr)]->set_level(spdlog::level::info);

  spdlog::set_default_logger(g_route_loggers[route_index(LogRoute::Info)]);
  spdlog::set_level(level);
}

namespace detail {

void emit_to_route(LogRoute route,
                   const std::string& prefix,
                   spdlog::level::level_enum level,
                   const std::string& message) {
  create_loggers();
  if(!log_passthrough()) return;

  auto& sink = g_route_loggers[route_index(route)];
  if(!sink) return;
  // operator-facing text stays unprefixed
  const bool plain = route == LogRoute::Print || route == LogRoute::PrintErr;
  if(!plain && !prefix.empty()) {
    sink->log(level, fmt::format("[{}] {}", prefix, message));
  } else {
    sink->log(level, message);
  }
}

} // namespace detail
