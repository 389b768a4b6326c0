#include "log.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <vector>

namespace {

enum SinkSlot { kConsoleOut, kConsoleErr, kPlainOut, kPlainErr, kSinkSlots };

struct SinkSpec {
  const char* name;
  bool to_stderr;
  const char* pattern;
  spdlog::level::level_enum flush_level;
};

constexpr const char* kTimestampPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
constexpr const char* kFilePattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";
constexpr std::size_t kLogFileMaxBytes = 5 * 1024 * 1024;
constexpr std::size_t kLogFileCount = 3;

const std::array<SinkSpec, kSinkSlots> kSinkSpecs = {{
  {"libreconnect.out", false, kTimestampPattern, spdlog::level::warn},
  {"libreconnect.err", true, kTimestampPattern, spdlog::level::err},
  {"libreconnect.print", false, "%v", spdlog::level::info},
  {"libreconnect.print_err", true, "%v", spdlog::level::err},
}};

std::mutex g_sinks_mutex;
std::array<std::shared_ptr<spdlog::logger>, kSinkSlots> g_sinks;
std::string g_log_file;
std::atomic<bool> g_passthrough{true};
std::atomic<bool> g_verbose{false};

// Caller holds g_sinks_mutex.
void build_sinks_locked() {
  if(g_sinks[kConsoleOut]) return;
  for(std::size_t slot = 0; slot < kSinkSlots; ++slot) {
    const auto& spec = kSinkSpecs[slot];
    spdlog::sink_ptr sink;
    if(spec.to_stderr) {
      sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    } else {
      sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    }
    sink->set_pattern(spec.pattern);
    auto logger = std::make_shared<spdlog::logger>(spec.name, std::move(sink));
    logger->flush_on(spec.flush_level);
    spdlog::drop(spec.name);
    spdlog::register_logger(logger);
    g_sinks[slot] = std::move(logger);
  }
}

SinkSlot slot_for(LogChannel channel) {
  switch(channel) {
    case LogChannel::Error:    return kConsoleErr;
    case LogChannel::Print:    return kPlainOut;
    case LogChannel::PrintErr: return kPlainErr;
    default:                   return kConsoleOut;
  }
}

} // namespace

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

spdlog::level::level_enum log_channel_level(LogChannel channel) {
  switch(channel) {
    case LogChannel::Warn:     return spdlog::level::warn;
    case LogChannel::Error:
    case LogChannel::PrintErr: return spdlog::level::err;
    case LogChannel::Debug:    return spdlog::level::debug;
    default:                   return spdlog::level::info;
  }
}

void set_log_passthrough(bool enabled) {
  g_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_passthrough.load(std::memory_order_acquire);
}

bool verbose_enabled() {
  return g_verbose.load(std::memory_order_acquire);
}

void init(bool verbose, const std::string& log_file) {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  build_sinks_locked();
  g_verbose.store(verbose, std::memory_order_release);

  if(!log_file.empty() && log_file != g_log_file) {
    // Throws spdlog::spdlog_ex when the file cannot be opened.
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      log_file, kLogFileMaxBytes, kLogFileCount);
    file_sink->set_pattern(kFilePattern);
    g_sinks[kConsoleOut]->sinks().push_back(file_sink);
    g_sinks[kConsoleErr]->sinks().push_back(file_sink);
    g_log_file = log_file;
  }

  const auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_sinks[kConsoleOut]->set_level(level);
  for(auto slot : {kConsoleErr, kPlainOut, kPlainErr}) {
    g_sinks[slot]->set_level(spdlog::level::info);
  }
  spdlog::set_default_logger(g_sinks[kConsoleOut]);
  spdlog::set_level(level);
}

void write_to_sinks(LogChannel channel, const std::string& label, const std::string& message) {
  if(!log_passthrough()) return;
  std::shared_ptr<spdlog::logger> sink;
  {
    std::lock_guard<std::mutex> lock(g_sinks_mutex);
    build_sinks_locked();
    sink = g_sinks[slot_for(channel)];
  }
  if(label.empty()) {
    sink->log(log_channel_level(channel), message);
  } else {
    sink->log(log_channel_level(channel), fmt::format("[{}] {}", label, message));
  }
}

Logger::Logger(std::string name, std::shared_ptr<Logger> parent)
  : name_(std::move(name)), parent_(std::move(parent)) {}

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

bool Logger::has_listeners() const {
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    if(!listeners_.empty()) return true;
  }
  return parent_ && parent_->has_listeners();
}

void Logger::publish(LogChannel channel, const std::string& message) {
  const char* channel_name = log_channel_name(channel);
  const std::string label = name_.empty() ? std::string(channel_name) : name_ + ":" + channel_name;
  if(notify(label, log_channel_level(channel), message)) return;
  write_to_sinks(channel, name_.empty() ? std::string() : label, message);
}

bool Logger::notify(const std::string& label, spdlog::level::level_enum level, const std::string& message) {
  std::vector<ListenerBinding> snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) snapshot.push_back(entry.second);
  }

  bool claimed = false;
  for(auto& binding : snapshot) {
    try {
      if(binding.callback(binding.user_data, label, level, message)) claimed = true;
    } catch(const std::exception& e) {
      write_to_sinks(LogChannel::Error, "log", fmt::format("log listener threw: {}", e.what()));
    }
  }

  if(parent_ && parent_->notify(label, level, message)) claimed = true;
  return claimed;
}

std::shared_ptr<Logger> make_child_logger(const std::shared_ptr<Logger>& parent,
                                          const std::string& name) {
  return std::make_shared<Logger>(name, parent);
}
