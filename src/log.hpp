#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

enum class LogChannel { Info, Warn, Error, Debug, Print, PrintErr };

const char* log_channel_name(LogChannel channel);
spdlog::level::level_enum log_channel_level(LogChannel channel);

// Console sinks are created on first use. A non-empty log_file adds a
// rotating file behind the timestamped channels.
void init(bool verbose = false, const std::string& log_file = std::string());
void set_log_passthrough(bool enabled);
bool log_passthrough();
bool verbose_enabled();

// Writes one line to the process sinks, ignoring loggers and listeners.
// label, when set, is printed in brackets before the message.
void write_to_sinks(LogChannel channel, const std::string& label, const std::string& message);

using LogListenerHandle = std::size_t;

// Named logger. Listeners see every line logged through this logger and
// through any child created from it; a listener returning true suppresses
// the process sinks for that line.
class Logger {
public:
  using Listener = std::function<bool(void* user_data,
                                      const std::string& label,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  Logger() = default;
  explicit Logger(std::string name, std::shared_ptr<Logger> parent = nullptr);

  void set_name(std::string name);
  const std::string& name() const { return name_; }
  const std::shared_ptr<Logger>& parent() const { return parent_; }

  LogListenerHandle add_listener(Listener listener, void* user_data = nullptr);
  void remove_listener(LogListenerHandle handle);
  void clear_listeners();

  template<typename... Args>
  void write(LogChannel channel, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    if(channel == LogChannel::Debug && !verbose_enabled() && !has_listeners()) return;
    publish(channel, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Info, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Warn, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Error, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Debug, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Print, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::PrintErr, fmt, std::forward<Args>(args)...);
  }

  // Listeners first (this logger, then its parents), then the process sinks
  // unless a listener claimed the line.
  void publish(LogChannel channel, const std::string& message);

private:
  bool has_listeners() const;
  bool notify(const std::string& label, spdlog::level::level_enum level, const std::string& message);

  struct ListenerBinding {
    void* user_data = nullptr;
    Listener callback;
  };

  std::string name_;
  std::shared_ptr<Logger> parent_;
  mutable std::mutex listener_mutex_;
  std::unordered_map<LogListenerHandle, ListenerBinding> listeners_;
  std::atomic<LogListenerHandle> next_listener_id_{1};
};

// Component logger whose lines are also delivered to the parent's listeners.
std::shared_ptr<Logger> make_child_logger(const std::shared_ptr<Logger>& parent,
                                          const std::string& name);

// Logs through logger when there is one, straight to the sinks otherwise.
template<typename... Args>
void log_to(Logger* logger, LogChannel channel,
            spdlog::format_string_t<Args...> fmt, Args&&... args) {
  if(logger) {
    logger->write(channel, fmt, std::forward<Args>(args)...);
    return;
  }
  if(channel == LogChannel::Debug && !verbose_enabled()) return;
  write_to_sinks(channel, std::string(), fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
inline void log_info(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Info, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_warn(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Warn, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_error(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Error, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_debug(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Debug, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_out(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Print, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_err(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::PrintErr, fmt, std::forward<Args>(args)...);
}
