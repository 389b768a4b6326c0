#include "capabilities.hpp"
#include "file_transfer.hpp"

PingHandler::PingHandler(std::shared_ptr<Logger> logger)
  : logger_(std::move(logger)) {}

std::optional<Message> PingHandler::handle(const Message& message, const DeviceId& sender){
  if(std::holds_alternative<Ping>(message)){
    log_debug(logger_.get(), "Ping from {}", sender);
    return Pong{};
  }
  if(std::holds_alternative<Pong>(message)){
    log_debug(logger_.get(), "Pong from {}", sender);
  }
  return std::nullopt;
}

ClipboardHandler::ClipboardHandler(std::shared_ptr<ClipboardBackend> clipboard, std::shared_ptr<Logger> logger)
  : clipboard_(std::move(clipboard)), logger_(std::move(logger)) {}

std::optional<Message> ClipboardHandler::handle(const Message& message, const DeviceId& sender){
  if(auto* sync = std::get_if<ClipboardSync>(&message)){
    log_info(logger_.get(), "Clipboard update from {} ({} bytes)", sender, sync->text.size());
    clipboard_->set_text(sync->text);
    return std::nullopt;
  }
  if(std::holds_alternative<RequestClipboard>(message)){
    // A failing backend still answers, with an empty clipboard.
    try {
      return ClipboardSync{clipboard_->get_text()};
    } catch(const std::exception& e){
      log_warn(logger_.get(), "Clipboard read failed for {}: {}", sender, e.what());
      return ClipboardSync{std::string()};
    }
  }
  return std::nullopt;
}

InputShareHandler::InputShareHandler(std::shared_ptr<InputInjector> injector, std::shared_ptr<Logger> logger)
  : injector_(std::move(injector)), logger_(std::move(logger)) {}

std::optional<Message> InputShareHandler::handle(const Message& message, const DeviceId& sender){
  if(auto* key = std::get_if<KeyEvent>(&message)){
    log_debug(logger_.get(), "Key event from {}: {} {}", sender, to_string(key->action), to_string(key->code));
    injector_->key(key->action, key->code);
    return std::nullopt;
  }
  auto* mouse = std::get_if<MouseEvent>(&message);
  if(!mouse) return std::nullopt;

  log_debug(logger_.get(), "Mouse event from {}: {} at {},{}", sender, to_string(mouse->action), mouse->x, mouse->y);
  switch(mouse->action){
    case MouseAction::Move:
      injector_->move_to(mouse->x, mouse->y);
      break;
    case MouseAction::Press:
    case MouseAction::Release:
      if(mouse->button) injector_->button(*mouse->button, mouse->action == MouseAction::Press);
      break;
    case MouseAction::Scroll:
      if(mouse->scroll_delta) injector_->scroll(0.0f, *mouse->scroll_delta);
      break;
  }
  return std::nullopt;
}

NotificationHandler::NotificationHandler(std::shared_ptr<NotificationSink> sink, std::shared_ptr<Logger> logger)
  : sink_(std::move(sink)), logger_(std::move(logger)) {}

std::optional<Message> NotificationHandler::handle(const Message& message, const DeviceId& sender){
  auto* note = std::get_if<Notification>(&message);
  if(!note) return std::nullopt;
  log_debug(logger_.get(), "Notification from {}: {}", sender, note->title);
  sink_->show(note->title, note->body, note->app_name.value_or(std::string()));
  return std::nullopt;
}

MediaControlHandler::MediaControlHandler(std::shared_ptr<MediaController> controller, std::shared_ptr<Logger> logger)
  : controller_(std::move(controller)), logger_(std::move(logger)) {}

std::optional<Message> MediaControlHandler::handle(const Message& message, const DeviceId& sender){
  auto* media = std::get_if<MediaControl>(&message);
  if(!media) return std::nullopt;
  log_debug(logger_.get(), "Media control from {}: {}", sender, to_string(media->action));
  controller_->apply(media->action);
  return std::nullopt;
}

BatteryStatusHandler::BatteryStatusHandler(std::shared_ptr<Logger> logger)
  : logger_(std::move(logger)) {}

std::optional<Message> BatteryStatusHandler::handle(const Message& message, const DeviceId& sender){
  auto* status = std::get_if<BatteryStatus>(&message);
  if(!status) return std::nullopt;
  log_info(logger_.get(), "Battery of {}: {:.0f}%{}", sender, status->charge, status->is_charging ? " (charging)" : "");
  std::lock_guard lg(m_);
  statuses_[sender] = *status;
  return std::nullopt;
}

void BatteryStatusHandler::forget(const DeviceId& sender){
  std::lock_guard lg(m_);
  statuses_.erase(sender);
}

std::size_t BatteryStatusHandler::tracked() const {
  std::lock_guard lg(m_);
  return statuses_.size();
}

std::optional<BatteryStatus> BatteryStatusHandler::last_status(const DeviceId& sender) const {
  std::lock_guard lg(m_);
  auto it = statuses_.find(sender);
  if(it == statuses_.end()) return std::nullopt;
  return it->second;
}

RemoteCommandHandler::RemoteCommandHandler(std::shared_ptr<CommandRunner> runner, std::shared_ptr<Logger> logger)
  : runner_(std::move(runner)), logger_(std::move(logger)) {}

const std::set<std::string>& RemoteCommandHandler::whitelist(){
  static const std::set<std::string> commands = {
    "echo", "date", "whoami", "pwd", "ls", "df", "uptime", "uname"
  };
  return commands;
}

bool RemoteCommandHandler::is_allowed(const std::string& command){
  return whitelist().count(command) > 0;
}

std::optional<Message> RemoteCommandHandler::handle(const Message& message, const DeviceId& sender){
  auto* remote = std::get_if<RemoteCommand>(&message);
  if(!remote) return std::nullopt;

  if(!is_allowed(remote->command)){
    log_warn(logger_.get(), "Refused remote command '{}' from {}", remote->command, sender);
    return std::nullopt;
  }

  log_info(logger_.get(), "Running '{}' for {} with {} argument(s)", remote->command, sender, remote->args.size());
  auto result = runner_->run(remote->command, remote->args);
  if(result.exit_code == 0){
    log_info(logger_.get(), "'{}' output:\n{}", remote->command, result.output);
  } else {
    log_warn(logger_.get(), "'{}' exited with {}:\n{}", remote->command, result.exit_code, result.output);
  }
  return std::nullopt;
}

TouchpadHandler::TouchpadHandler(std::shared_ptr<InputInjector> injector, std::shared_ptr<Logger> logger)
  : injector_(std::move(injector)), logger_(std::move(logger)) {}

std::optional<Message> TouchpadHandler::handle(const Message& message, const DeviceId& sender){
  auto* touch = std::get_if<TouchpadEvent>(&message);
  if(!touch) return std::nullopt;

  log_debug(logger_.get(), "Touchpad from {}: d={:.1f},{:.1f}", sender, touch->dx, touch->dy);
  if(touch->dx != 0.0f || touch->dy != 0.0f) injector_->move_by(touch->dx, touch->dy);
  if(touch->scroll_delta_x != 0.0f || touch->scroll_delta_y != 0.0f){
    injector_->scroll(touch->scroll_delta_x, touch->scroll_delta_y);
  }
  if(touch->is_left_click) injector_->click(MouseButtonKind::Left);
  if(touch->is_right_click) injector_->click(MouseButtonKind::Right);
  return std::nullopt;
}

SlideControlHandler::SlideControlHandler(std::shared_ptr<InputInjector> injector, std::shared_ptr<Logger> logger)
  : injector_(std::move(injector)), logger_(std::move(logger)) {}

Key SlideControlHandler::key_for(SlideAction action){
  switch(action){
    case SlideAction::NextSlide:         return Key::ArrowRight;
    case SlideAction::PreviousSlide:     return Key::ArrowLeft;
    case SlideAction::StartPresentation: return Key::F5;
    case SlideAction::EndPresentation:   return Key::Escape;
  }
  return Key::Unknown;
}

std::optional<Message> SlideControlHandler::handle(const Message& message, const DeviceId& sender){
  auto* slide = std::get_if<SlideControl>(&message);
  if(!slide) return std::nullopt;
  log_info(logger_.get(), "Slide control from {}: {}", sender, to_string(slide->action));
  injector_->tap(key_for(slide->action));
  return std::nullopt;
}

PlatformServices PlatformServices::defaults(const std::shared_ptr<Logger>& logger){
  PlatformServices services;
  services.clipboard = std::make_shared<InMemoryClipboard>();
  services.input = std::make_shared<LoggingInputInjector>(logger);
  services.notifications = std::make_shared<LoggingNotificationSink>(logger);
  services.media = std::make_shared<LoggingMediaController>(logger);
  services.commands = std::make_shared<ProcessCommandRunner>();
  return services;
}

void register_default_capabilities(CapabilityDispatcher& dispatcher,
                                   const PlatformServices& services,
                                   const std::filesystem::path& download_dir,
                                   const std::shared_ptr<Logger>& logger){
  dispatcher.add(std::make_unique<PingHandler>(make_child_logger(logger, "ping")));
  dispatcher.add(std::make_unique<ClipboardHandler>(services.clipboard, make_child_logger(logger, "clipboard")));
  dispatcher.add(std::make_unique<FileTransferHandler>(download_dir, make_child_logger(logger, "file-transfer")));
  dispatcher.add(std::make_unique<InputShareHandler>(services.input, make_child_logger(logger, "input")));
  dispatcher.add(std::make_unique<NotificationHandler>(services.notifications, make_child_logger(logger, "notification")));
  dispatcher.add(std::make_unique<MediaControlHandler>(services.media, make_child_logger(logger, "media")));
  dispatcher.add(std::make_unique<BatteryStatusHandler>(make_child_logger(logger, "battery")));
  dispatcher.add(std::make_unique<RemoteCommandHandler>(services.commands, make_child_logger(logger, "remote")));
  dispatcher.add(std::make_unique<TouchpadHandler>(services.input, make_child_logger(logger, "touchpad")));
  dispatcher.add(std::make_unique<SlideControlHandler>(services.input, make_child_logger(logger, "slide")));
}
