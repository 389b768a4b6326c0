#pragma once
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include "capability.hpp"
#include "platform.hpp"

class PingHandler : public CapabilityHandler {
public:
  explicit PingHandler(std::shared_ptr<Logger> logger = nullptr);
  std::string name() const override { return "ping"; }
  std::optional<Message> handle(const Message& message, const DeviceId& sender) override;

private:
  std::shared_ptr<Logger> logger_;
};

class ClipboardHandler : public CapabilityHandler {
public:
  ClipboardHandler(std::shared_ptr<ClipboardBackend> clipboard, std::shared_ptr<Logger> logger = nullptr);
  std::string name() const override { return "clipboard-sync"; }
  std::optional<Message> handle(const Message& message, const DeviceId& sender) override;

private:
  std::shared_ptr<ClipboardBackend> clipboard_;
  std::shared_ptr<Logger> logger_;
};

class InputShareHandler : public CapabilityHandler {
public:
  InputShareHandler(std::shared_ptr<InputInjector> injector, std::shared_ptr<Logger> logger = nullptr);
  std::string name() const override { return "input-share"; }
  std::optional<Message> handle(const Message& message, const DeviceId& sender) override;

private:
  std::shared_ptr<InputInjector> injector_;
  std::shared_ptr<Logger> logger_;
};

class NotificationHandler : public CapabilityHandler {
public:
  NotificationHandler(std::shared_ptr<NotificationSink> sink, std::shared_ptr<Logger> logger = nullptr);
  std::string name() const override { return "notification-sync"; }
  std::optional<Message> handle(const Message& message, const DeviceId& sender) override;

private:
  std::shared_ptr<NotificationSink> sink_;
  std::shared_ptr<Logger> logger_;
};

class MediaControlHandler : public CapabilityHandler {
public:
  MediaControlHandler(std::shared_ptr<MediaController> controller, std::shared_ptr<Logger> logger = nullptr);
  std::string name() const override { return "media-control"; }
  std::optional<Message> handle(const Message& message, const DeviceId& sender) override;

private:
  std::shared_ptr<MediaController> controller_;
  std::shared_ptr<Logger> logger_;
};

// Keeps the last status each device reported.
class BatteryStatusHandler : public CapabilityHandler {
public:
  explicit BatteryStatusHandler(std::shared_ptr<Logger> logger = nullptr);
  std::string name() const override { return "battery-status"; }
  std::optional<Message> handle(const Message& message, const DeviceId& sender) override;

  void forget(const DeviceId& sender) override;

  std::optional<BatteryStatus> last_status(const DeviceId& sender) const;
  std::size_t tracked() const;

private:
  std::shared_ptr<Logger> logger_;
  mutable std::mutex m_;
  std::map<DeviceId, BatteryStatus> statuses_;
};

class RemoteCommandHandler : public CapabilityHandler {
public:
  RemoteCommandHandler(std::shared_ptr<CommandRunner> runner, std::shared_ptr<Logger> logger = nullptr);
  std::string name() const override { return "remote-commands"; }
  std::optional<Message> handle(const Message& message, const DeviceId& sender) override;

  static const std::set<std::string>& whitelist();
  static bool is_allowed(const std::string& command);

private:
  std::shared_ptr<CommandRunner> runner_;
  std::shared_ptr<Logger> logger_;
};

class TouchpadHandler : public CapabilityHandler {
public:
  TouchpadHandler(std::shared_ptr<InputInjector> injector, std::shared_ptr<Logger> logger = nullptr);
  std::string name() const override { return "touchpad-mode"; }
  std::optional<Message> handle(const Message& message, const DeviceId& sender) override;

private:
  std::shared_ptr<InputInjector> injector_;
  std::shared_ptr<Logger> logger_;
};

class SlideControlHandler : public CapabilityHandler {
public:
  SlideControlHandler(std::shared_ptr<InputInjector> injector, std::shared_ptr<Logger> logger = nullptr);
  std::string name() const override { return "slide-control"; }
  std::optional<Message> handle(const Message& message, const DeviceId& sender) override;

  static Key key_for(SlideAction action);

private:
  std::shared_ptr<InputInjector> injector_;
  std::shared_ptr<Logger> logger_;
};

// Host integrations handed to the default handler set.
struct PlatformServices {
  std::shared_ptr<ClipboardBackend> clipboard;
  std::shared_ptr<InputInjector> input;
  std::shared_ptr<NotificationSink> notifications;
  std::shared_ptr<MediaController> media;
  std::shared_ptr<CommandRunner> commands;

  // In-memory clipboard, logging injectors and sinks, process runner.
  static PlatformServices defaults(const std::shared_ptr<Logger>& logger);
};

// Registers ping, clipboard-sync, file-transfer, input-share,
// notification-sync, media-control, battery-status, remote-commands,
// touchpad-mode and slide-control, in that order.
void register_default_capabilities(CapabilityDispatcher& dispatcher,
                                   const PlatformServices& services,
                                   const std::filesystem::path& download_dir,
                                   const std::shared_ptr<Logger>& logger);
