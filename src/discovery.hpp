#pragma once
#include <asio.hpp>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "device_registry.hpp"
#include "log.hpp"
#include "protocol.hpp"

// What this host registers on the local network.
struct ServiceAdvertisement {
  std::string service_type = kServiceType;
  std::string instance_name;
  std::string host_name;
  uint16_t port = kDefaultPort;
  std::map<std::string, std::string> properties;

  // "<instance>.<service_type>"
  std::string fullname() const;
};

struct DiscoveryEvent {
  enum class Kind { Found, Resolved, Removed, Failed };
  Kind kind = Kind::Found;
  std::string fullname;
  std::string host;
  uint16_t port = 0;
  std::map<std::string, std::string> properties;
  // Set for Failed.
  std::string error;
};

const char* to_string(DiscoveryEvent::Kind kind);

// Local-network service discovery. register_service() and browse() throw
// DaemonError (DiscoveryRegister / DiscoveryBrowse); later failures arrive
// as a Failed event.
class DiscoveryBackend {
public:
  using EventHandler = std::function<void(const DiscoveryEvent&)>;

  virtual ~DiscoveryBackend() = default;
  virtual void register_service(const ServiceAdvertisement& advertisement) = 0;
  virtual void browse(const std::string& service_type, EventHandler handler) = 0;
  // Withdraws the advertisement and stops browsing.
  virtual void shutdown() = 0;
};

// JSON beacons over UDP multicast:
//   {"kind":"announce"|"goodbye","service_type":..,"instance":..,"host":..,
//    "port":..,"properties":{..}}
// A peer is Resolved on its first announce or when its beacon changes and
// Removed on goodbye or after three silent intervals.
class MulticastDiscoveryBackend : public DiscoveryBackend {
public:
  static constexpr std::size_t kMaxBeaconSize = 4096;

  struct Options {
    std::string group = "239.255.17.16";
    uint16_t port = 1716;
    std::chrono::milliseconds interval = std::chrono::seconds(5);
  };

  // Throws DaemonError(DiscoveryInit) for an unusable group address.
  MulticastDiscoveryBackend(asio::io_context& io, Options options,
                            std::shared_ptr<Logger> logger = nullptr);
  ~MulticastDiscoveryBackend() override;

  void register_service(const ServiceAdvertisement& advertisement) override;
  void browse(const std::string& service_type, EventHandler handler) override;
  void shutdown() override;

  // Sets the service filter and event handler without opening a socket.
  // browse() calls this first.
  void watch(const std::string& service_type, EventHandler handler);

  static std::string encode_beacon(const ServiceAdvertisement& advertisement, bool goodbye);

  // Feeds one received datagram; `from` fills in a missing host.
  void process_datagram(const std::string& payload, const std::string& from,
                        std::chrono::steady_clock::time_point now);
  // Emits Removed for every peer silent for longer than three intervals.
  void sweep(std::chrono::steady_clock::time_point now);

  std::size_t known_peers() const;

private:
  struct Peer {
    DiscoveryEvent resolved;
    std::chrono::steady_clock::time_point last_seen;
  };

  void schedule_announce();
  void send_beacon(bool goodbye);
  void start_receive();
  void emit(const DiscoveryEvent& event);

  Options options_;
  std::shared_ptr<Logger> logger_;
  asio::strand<asio::io_context::executor_type> strand_;
  asio::ip::udp::endpoint group_endpoint_;
  asio::ip::udp::socket send_socket_;
  asio::ip::udp::socket receive_socket_;
  asio::steady_timer announce_timer_;
  asio::ip::udp::endpoint sender_;
  std::array<char, kMaxBeaconSize> receive_buf_{};

  mutable std::mutex m_;
  std::optional<ServiceAdvertisement> advertisement_;
  std::string browse_type_;
  EventHandler handler_;
  std::map<std::string, Peer> peers_;
  int receive_errors_ = 0;
  std::atomic<bool> running_{false};
};

// Advertises this daemon and mirrors browse results into the registry's
// discovered set. Failures end the bridge only; on_failure tells the owner.
class DiscoveryBridge {
public:
  using FailureHandler = std::function<void(const std::string& reason)>;

  DiscoveryBridge(std::unique_ptr<DiscoveryBackend> backend,
                  std::shared_ptr<DeviceRegistry> registry,
                  ServiceAdvertisement advertisement,
                  std::shared_ptr<Logger> logger = nullptr,
                  FailureHandler on_failure = nullptr);
  ~DiscoveryBridge();

  // Returns false (after logging and reporting) when registration or
  // browsing could not be started.
  bool start();
  void stop();
  bool running() const { return running_.load(); }

  const ServiceAdvertisement& advertisement() const { return advertisement_; }

  // Entry point for backend events.
  void on_event(const DiscoveryEvent& event);

  // DeviceInfo recorded for a Resolved event.
  static DeviceInfo device_from_event(const DiscoveryEvent& event);

private:
  void fail(const std::string& reason);

  std::unique_ptr<DiscoveryBackend> backend_;
  std::shared_ptr<DeviceRegistry> registry_;
  ServiceAdvertisement advertisement_;
  std::shared_ptr<Logger> logger_;
  FailureHandler on_failure_;
  std::atomic<bool> running_{false};
};
