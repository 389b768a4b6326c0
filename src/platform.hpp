#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "log.hpp"
#include "protocol.hpp"

// Host integrations used by the capability handlers. Implementations report
// failures by throwing.

class ClipboardBackend {
public:
  virtual ~ClipboardBackend() = default;
  virtual std::string get_text() = 0;
  virtual void set_text(const std::string& text) = 0;
};

class InputInjector {
public:
  virtual ~InputInjector() = default;
  virtual void key(KeyAction action, const KeyCode& code) = 0;
  virtual void move_to(int32_t x, int32_t y) = 0;
  virtual void move_by(float dx, float dy) = 0;
  virtual void button(const MouseButton& button, bool pressed) = 0;
  virtual void scroll(float dx, float dy) = 0;

  // Press and release.
  void tap(Key key);
  void click(MouseButtonKind kind);
};

class NotificationSink {
public:
  virtual ~NotificationSink() = default;
  virtual void show(const std::string& title, const std::string& body,
                    const std::string& app_name) = 0;
};

class MediaController {
public:
  virtual ~MediaController() = default;
  virtual void apply(MediaAction action) = 0;
};

struct CommandResult {
  int exit_code = -1;
  std::string output;
};

class CommandRunner {
public:
  virtual ~CommandRunner() = default;
  virtual CommandResult run(const std::string& command, const std::vector<std::string>& args) = 0;
};

// ---- portable defaults ----------------------------------------------------

class InMemoryClipboard : public ClipboardBackend {
public:
  std::string get_text() override;
  void set_text(const std::string& text) override;

private:
  std::mutex m_;
  std::string text_;
};

class LoggingInputInjector : public InputInjector {
public:
  explicit LoggingInputInjector(std::shared_ptr<Logger> logger = nullptr);
  void key(KeyAction action, const KeyCode& code) override;
  void move_to(int32_t x, int32_t y) override;
  void move_by(float dx, float dy) override;
  void button(const MouseButton& button, bool pressed) override;
  void scroll(float dx, float dy) override;

private:
  std::shared_ptr<Logger> logger_;
};

class LoggingNotificationSink : public NotificationSink {
public:
  explicit LoggingNotificationSink(std::shared_ptr<Logger> logger = nullptr);
  void show(const std::string& title, const std::string& body,
            const std::string& app_name) override;

private:
  std::shared_ptr<Logger> logger_;
};

class LoggingMediaController : public MediaController {
public:
  explicit LoggingMediaController(std::shared_ptr<Logger> logger = nullptr);
  void apply(MediaAction action) override;

private:
  std::shared_ptr<Logger> logger_;
};

// fork/execvp with stdout and stderr captured through a pipe. Output beyond
// max_output bytes is discarded; the child is killed after `timeout`.
class ProcessCommandRunner : public CommandRunner {
public:
  explicit ProcessCommandRunner(std::chrono::milliseconds timeout = std::chrono::seconds(10),
                                std::size_t max_output = 64 * 1024);
  CommandResult run(const std::string& command, const std::vector<std::string>& args) override;

private:
  std::chrono::milliseconds timeout_;
  std::size_t max_output_;
};

std::string to_string(const MouseButton& button);
std::string to_string(const KeyCode& code);
