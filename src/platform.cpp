#include "platform.hpp"
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <system_error>

void InputInjector::tap(Key key){
  KeyCode code{key, 0};
  this->key(KeyAction::Press, code);
  this->key(KeyAction::Release, code);
}

void InputInjector::click(MouseButtonKind kind){
  MouseButton b{kind, 0};
  button(b, true);
  button(b, false);
}

std::string to_string(const MouseButton& button){
  if(button.kind == MouseButtonKind::Other) return "Other(" + std::to_string(button.other) + ")";
  return to_string(button.kind);
}

std::string to_string(const KeyCode& code){
  if(code.key == Key::Unknown) return "Unknown(" + std::to_string(code.raw) + ")";
  return to_string(code.key);
}

std::string InMemoryClipboard::get_text(){
  std::lock_guard lg(m_);
  return text_;
}

void InMemoryClipboard::set_text(const std::string& text){
  std::lock_guard lg(m_);
  text_ = text;
}

LoggingInputInjector::LoggingInputInjector(std::shared_ptr<Logger> logger)
  : logger_(std::move(logger)) {}

void LoggingInputInjector::key(KeyAction action, const KeyCode& code){
  log_info(logger_.get(), "key {} {}", to_string(action), to_string(code));
}

void LoggingInputInjector::move_to(int32_t x, int32_t y){
  log_debug(logger_.get(), "pointer to {},{}", x, y);
}

void LoggingInputInjector::move_by(float dx, float dy){
  log_debug(logger_.get(), "pointer by {:.2f},{:.2f}", dx, dy);
}

void LoggingInputInjector::button(const MouseButton& button, bool pressed){
  log_info(logger_.get(), "button {} {}", to_string(button), pressed ? "down" : "up");
}

void LoggingInputInjector::scroll(float dx, float dy){
  log_debug(logger_.get(), "scroll {:.2f},{:.2f}", dx, dy);
}

LoggingNotificationSink::LoggingNotificationSink(std::shared_ptr<Logger> logger)
  : logger_(std::move(logger)) {}

void LoggingNotificationSink::show(const std::string& title, const std::string& body,
                                   const std::string& app_name){
  if(app_name.empty()){
    log_info(logger_.get(), "Notification: {}: {}", title, body);
  } else {
    log_info(logger_.get(), "Notification [{}]: {}: {}", app_name, title, body);
  }
}

LoggingMediaController::LoggingMediaController(std::shared_ptr<Logger> logger)
  : logger_(std::move(logger)) {}

void LoggingMediaController::apply(MediaAction action){
  log_info(logger_.get(), "Media control: {}", to_string(action));
}

ProcessCommandRunner::ProcessCommandRunner(std::chrono::milliseconds timeout, std::size_t max_output)
  : timeout_(timeout), max_output_(max_output) {}

CommandResult ProcessCommandRunner::run(const std::string& command, const std::vector<std::string>& args){
  int fds[2];
  if(pipe(fds) != 0){
    throw std::system_error(errno, std::generic_category(), "pipe");
  }

  std::vector<std::string> storage;
  storage.reserve(args.size() + 1);
  storage.push_back(command);
  storage.insert(storage.end(), args.begin(), args.end());
  std::vector<char*> argv;
  for(auto& s : storage) argv.push_back(s.data());
  argv.push_back(nullptr);

  pid_t pid = fork();
  if(pid < 0){
    int err = errno;
    close(fds[0]);
    close(fds[1]);
    throw std::system_error(err, std::generic_category(), "fork");
  }
  if(pid == 0){
    dup2(fds[1], STDOUT_FILENO);
    dup2(fds[1], STDERR_FILENO);
    close(fds[0]);
    close(fds[1]);
    execvp(argv[0], argv.data());
    _exit(127);
  }
  close(fds[1]);

  CommandResult result;
  const auto deadline = std::chrono::steady_clock::now() + timeout_;
  bool timed_out = false;
  char buf[4096];
  for(;;){
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
    if(remaining.count() <= 0){
      timed_out = true;
      break;
    }
    pollfd pfd{fds[0], POLLIN, 0};
    int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
    if(ready < 0){
      if(errno == EINTR) continue;
      break;
    }
    if(ready == 0){
      timed_out = true;
      break;
    }
    ssize_t n = read(fds[0], buf, sizeof(buf));
    if(n < 0 && errno == EINTR) continue;
    if(n <= 0) break;
    if(result.output.size() < max_output_){
      result.output.append(buf, std::min<std::size_t>(static_cast<std::size_t>(n),
                                                      max_output_ - result.output.size()));
    }
  }
  close(fds[0]);

  if(timed_out) kill(pid, SIGKILL);
  int status = 0;
  while(waitpid(pid, &status, 0) < 0){
    if(errno != EINTR){
      throw std::system_error(errno, std::generic_category(), "waitpid");
    }
  }
  if(timed_out){
    throw std::runtime_error("command '" + command + "' timed out");
  }
  if(WIFEXITED(status)) result.exit_code = WEXITSTATUS(status);
  else if(WIFSIGNALED(status)) result.exit_code = 128 + WTERMSIG(status);
  return result;
}
