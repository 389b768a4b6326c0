#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "capabilities.hpp"
#include "capability.hpp"
#include "connection.hpp"
#include "device_registry.hpp"
#include "discovery.hpp"
#include "log.hpp"
#include "message_router.hpp"
#include "pairing_authority.hpp"
#include "protocol.hpp"

class SettingsManager;

class Daemon {
public:
  struct Options {
    std::string listen_ip = "0.0.0.0";
    uint16_t port = kDefaultPort;
    std::string device_name;
    std::filesystem::path config_dir;
    std::filesystem::path download_dir;
    std::chrono::milliseconds read_timeout = std::chrono::seconds(120);
    std::chrono::milliseconds write_timeout = std::chrono::seconds(120);
    std::size_t max_message_size = kMaxMessageSize;
    std::size_t worker_threads = 4;
    bool discovery = true;
    bool discovery_required = false;
    std::string discovery_group = "239.255.17.16";
    uint16_t discovery_port = kDefaultPort;
    std::chrono::milliseconds discovery_interval = std::chrono::seconds(5);
    bool allow_legacy_pairing = true;

    // Resolves empty device_name/config_dir/download_dir to host defaults.
    // Throws DaemonError(Configuration) for out-of-range values.
    static Options from_settings(const SettingsManager& settings);
  };

  Daemon(Options options,
         PlatformServices services = PlatformServices(),
         std::shared_ptr<Logger> logger = nullptr);
  ~Daemon();

  Daemon(const Daemon&) = delete;
  Daemon& operator=(const Daemon&) = delete;

  // Replaces the multicast backend; call before start().
  void set_discovery_backend(std::unique_ptr<DiscoveryBackend> backend);

  // Loads the registry, registers the capability handlers, binds the
  // listener and starts discovery. Throws DaemonError(ListenerBind).
  void start();

  // Runs the I/O threads and blocks until stop is requested, the listener
  // ends, or discovery fails while discovery_required is set.
  void run();

  // Runs the I/O threads without blocking; pair with stop().
  void start_background();

  // Safe from any thread, including handlers.
  void request_stop(const std::string& reason = "stop requested");

  // Joins the I/O threads; never call from a handler.
  void stop();

  asio::io_context& io() { return io_; }
  uint16_t listen_port() const { return listen_port_; }
  const DeviceInfo& local_device() const { return local_device_; }
  const Options& options() const { return options_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

  std::shared_ptr<DeviceRegistry> registry() const { return registry_; }
  std::shared_ptr<PairingAuthority> pairing() const { return pairing_; }
  std::shared_ptr<const CapabilityDispatcher> dispatcher() const { return dispatcher_; }
  std::vector<std::string> handler_names() const { return dispatcher_->handler_names(); }

  bool discovery_running() const;
  std::size_t active_connections() const;
  std::string stop_reason() const;

private:
  using tcp = asio::ip::tcp;

  void bind_listener();
  void start_accept();
  void start_discovery();
  void launch_threads();
  void on_connection_closed(const std::string& peer);

  Options options_;
  PlatformServices services_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::vector<std::thread> threads_;
  std::unique_ptr<tcp::acceptor> acceptor_;
  std::unique_ptr<asio::steady_timer> accept_retry_timer_;

  DeviceInfo local_device_;
  std::shared_ptr<DeviceRegistry> registry_;
  std::shared_ptr<PairingAuthority> pairing_;
  std::shared_ptr<CapabilityDispatcher> dispatcher_;
  std::shared_ptr<MessageRouter> router_;
  std::unique_ptr<DiscoveryBackend> pending_backend_;
  std::unique_ptr<DiscoveryBridge> discovery_;

  mutable std::mutex connections_mutex_;
  std::vector<std::weak_ptr<Connection>> connections_;

  mutable std::mutex state_mutex_;
  std::condition_variable state_cv_;
  bool stop_requested_ = false;
  std::string stop_reason_;

  std::atomic<bool> started_{false};
  std::atomic<bool> stopping_{false};
  uint16_t listen_port_ = 0;
};
