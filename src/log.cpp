#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace {

struct DefaultSinks {
  std::shared_ptr<spdlog::logger> diagnostics;
  std::shared_ptr<spdlog::logger> errors;
  std::shared_ptr<spdlog::logger> plain_out;
  std::shared_ptr<spdlog::logger> plain_err;
};

std::once_flag g_sinks_once;
DefaultSinks g_sinks;
std::atomic<bool> g_log_passthrough{true};

constexpr const char* kStampedPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

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

DefaultSinks& sinks() {
  std::call_once(g_sinks_once, [](){
    g_sinks.diagnostics = make_logger("share.log",
      std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
      kStampedPattern, spdlog::level::warn);
    g_sinks.errors = make_logger("share.error",
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
      kStampedPattern, spdlog::level::err);
    g_sinks.plain_out = make_logger("share.print",
      std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
      "%v", spdlog::level::info);
    g_sinks.plain_err = make_logger("share.print_err",
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
      "%v", spdlog::level::err);
  });
  return g_sinks;
}

spdlog::logger* sink_for(LogChannel channel) {
  auto& s = sinks();
  switch(channel) {
    case LogChannel::Print:    return s.plain_out.get();
    case LogChannel::PrintErr: return s.plain_err.get();
    case LogChannel::Error:    return s.errors.get();
    default:                   return s.diagnostics.get();
  }
}

} // namespace

void init_logging(bool verbose) {
  auto& s = sinks();
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  s.diagnostics->set_level(level);
  s.errors->set_level(spdlog::level::info);
  s.plain_out->set_level(spdlog::level::info);
  s.plain_err->set_level(spdlog::level::info);
  spdlog::set_default_logger(s.diagnostics);
  spdlog::set_level(level);
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

const char* log_channel_name(LogChannel channel) {
  switch(channel) {
    case LogChannel::Info:     return "info";
    case LogChannel::Warn:     return "warn";
    case LogChannel::Error:    return "error";
    case LogChannel::Debug:    return "debug";
    case LogChannel::Print:    return "print";
    case LogChannel::PrintErr: return "print_err";
  }
  return "info";
}

Logger::Logger(std::string name) : name_(std::move(name)) {}

void Logger::set_name(std::string name) {
  std::lock_guard<std::mutex> lock(mutex_);
  name_ = std::move(name);
}

std::string Logger::name() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return name_;
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.erase(handle);
}

void Logger::clear_listeners() {
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.clear();
}

void Logger::write(LogChannel channel, const std::string& message) {
  const char* base = log_channel_name(channel);
  std::string prefix = name();
  std::string channel_name = prefix.empty() ? std::string(base) : prefix + ":" + base;
  if(dispatch(channel_name, detail::level_for(channel), message)) return;
  detail::emit_to_default(channel, channel_name, message);
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<ListenerBinding> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
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
      detail::emit_to_default(LogChannel::Error, "log",
                              fmt::format("log listener threw: {}", e.what()));
    }
  }
  return handled;
}

namespace detail {

spdlog::level::level_enum level_for(LogChannel channel) {
  switch(channel) {
    case LogChannel::Warn:     return spdlog::level::warn;
    case LogChannel::Error:
    case LogChannel::PrintErr: return spdlog::level::err;
    case LogChannel::Debug:    return spdlog::level::debug;
    default:                   return spdlog::level::info;
  }
}

void emit_to_default(LogChannel channel,
                     const std::string& channel_name,
                     const std::string& message) {
  if(!log_passthrough()) return;
  auto* sink = sink_for(channel);
  if(!sink) return;
  const auto level = level_for(channel);
  const bool plain = channel == LogChannel::Print || channel == LogChannel::PrintErr;
  if(!plain && channel_name != log_channel_name(channel)) {
    sink->log(level, fmt::format("[{}] {}", channel_name, message));
  } else {
    sink->log(level, message);
  }
}

} // namespace detail
