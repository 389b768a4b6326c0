#include "client.hpp"
#include "daemon.hpp"
#include "errors.hpp"
#include "test_runner_utils.hpp"

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

using libreconnect::test::RecordingNotificationSink;
using libreconnect::test::TestCase;
using libreconnect::test::TestContext;
using libreconnect::test::expect;
using libreconnect::test::expect_eq;
using namespace std::chrono_literals;

constexpr auto kTimeout = std::chrono::milliseconds(3000);

class StaticBackend : public DiscoveryBackend {
public:
  explicit StaticBackend(bool fail, std::vector<ServiceAdvertisement>* registered = nullptr)
    : fail_(fail), registered_(registered) {}

  void register_service(const ServiceAdvertisement& advertisement) override {
    if(fail_) throw DaemonError(ErrorKind::DiscoveryRegister, "no responder on this host");
    if(registered_) registered_->push_back(advertisement);
  }
  void browse(const std::string&, EventHandler) override {}
  void shutdown() override {}

private:
  bool fail_;
  std::vector<ServiceAdvertisement>* registered_;
};

Daemon::Options loopback_options(const std::string& name) {
  auto root = libreconnect::test::prepare_workspace(name);
  Daemon::Options options;
  options.listen_ip = "127.0.0.1";
  options.port = 0;
  options.device_name = "test-" + name;
  options.config_dir = root / "config";
  options.download_dir = root / "downloads";
  options.worker_threads = 2;
  options.discovery = false;
  return options;
}

// Daemon on an ephemeral loopback port, running on background threads.
class RunningDaemon {
public:
  RunningDaemon(TestContext& ctx, Daemon::Options options, PlatformServices services = PlatformServices())
    : daemon_(std::move(options), std::move(services), ctx.logger) {
    daemon_.start();
    daemon_.start_background();
  }

  ~RunningDaemon() {
    daemon_.stop();
  }

  Daemon& daemon() { return daemon_; }
  uint16_t port() const { return daemon_.listen_port(); }

private:
  Daemon daemon_;
};

struct Connected {
  asio::io_context io;
  Client client;

  Connected(RunningDaemon& running, const std::shared_ptr<Logger>& logger) : client(io, logger) {
    client.connect("127.0.0.1", running.port(), kTimeout);
  }
};

bool closed_by_daemon(Client& client) {
  try {
    auto message = client.receive(kTimeout);
    return !message.has_value();
  } catch(const DaemonError& e) {
    return e.kind() == ErrorKind::Network;
  }
}

bool is_pong(const std::optional<Message>& reply) {
  return reply && std::holds_alternative<Pong>(*reply);
}

RequestPairingWithKey pairing_request(const std::string& id, const std::string& key) {
  RequestPairingWithKey request;
  request.id = id;
  request.name = "Phone";
  request.device_type = "Mobile";
  request.capabilities = {"ClipboardSync", "FileTransfer"};
  request.pairing_key = key;
  return request;
}

bool test_ping_pong(TestContext& ctx) {
  RunningDaemon running(ctx, loopback_options("daemon_ping"));
  if(!expect(running.port() != 0, "ephemeral port bound")) return false;
  Connected conn(running, ctx.logger);
  if(!expect(is_pong(conn.client.request(Ping{}, kTimeout)), "Ping answered")) return false;
  return expect(is_pong(conn.client.request(Ping{}, kTimeout)), "connection stays open for more requests");
}

bool test_keyed_pairing_over_tcp(TestContext& ctx) {
  auto options = loopback_options("daemon_pairing");
  const auto config_dir = options.config_dir;
  RunningDaemon running(ctx, options);
  Connected conn(running, ctx.logger);

  const auto code = running.daemon().pairing()->current_code();
  auto reply = conn.client.request(pairing_request("phone-1", code), kTimeout);
  auto* accepted = reply ? std::get_if<PairingAccepted>(&*reply) : nullptr;
  if(!expect(accepted && accepted->device_id == "phone-1", "pairing accepted")) return false;

  reply = conn.client.request(pairing_request("phone-2", code), kTimeout);
  auto* rejected = reply ? std::get_if<PairingRejected>(&*reply) : nullptr;
  if(!expect(rejected != nullptr, "used code rejected")) return false;
  if(!expect_eq(rejected->reason, std::string("Invalid pairing key"), "rejection reason")) return false;

  DeviceRegistry reloaded(config_dir);
  if(!expect_eq(reloaded.load(), std::size_t(1), "paired device persisted")) return false;
  return expect(reloaded.is_paired("phone-1"), "persisted device is the accepted one");
}

bool test_legacy_pairing_disabled(TestContext& ctx) {
  auto options = loopback_options("daemon_legacy");
  options.allow_legacy_pairing = false;
  RunningDaemon running(ctx, options);
  Connected conn(running, ctx.logger);

  DeviceInfo info;
  info.id = "old-phone";
  info.name = "Old";
  auto reply = conn.client.request(RequestPairing{info}, kTimeout);
  auto* rejected = reply ? std::get_if<PairingRejected>(&*reply) : nullptr;
  if(!expect(rejected != nullptr, "legacy pairing rejected")) return false;
  return expect(!running.daemon().registry()->is_paired("old-phone"), "nothing stored");
}

bool test_split_and_batched_frames(TestContext& ctx) {
  RunningDaemon running(ctx, loopback_options("daemon_framing"));
  Connected conn(running, ctx.logger);

  conn.client.send_raw("\"Pi", kTimeout);
  std::this_thread::sleep_for(50ms);
  conn.client.send_raw("ng\"\n", kTimeout);
  if(!expect(is_pong(conn.client.receive(kTimeout)), "message split across writes")) return false;

  conn.client.send_raw("\n\r\n\"Ping\"\n\"Ping\"\r\n", kTimeout);
  if(!expect(is_pong(conn.client.receive(kTimeout)), "first batched message")) return false;
  return expect(is_pong(conn.client.receive(kTimeout)), "second batched message");
}

bool test_slow_sender_within_idle_timeout(TestContext& ctx) {
  auto options = loopback_options("daemon_slow_sender");
  options.read_timeout = 1s;
  RunningDaemon running(ctx, options);
  Connected conn(running, ctx.logger);

  // The whole line takes about two seconds; no gap reaches the timeout.
  for(const char* piece : {"\"", "Pi", "ng", "\"\n"}) {
    conn.client.send_raw(piece, kTimeout);
    std::this_thread::sleep_for(500ms);
  }
  if(!expect(is_pong(conn.client.receive(kTimeout)), "trickled Ping answered")) return false;

  if(!expect(closed_by_daemon(conn.client), "silent connection closed after the timeout")) return false;
  return expect(ctx.logs.wait_for_substring("ms idle", kTimeout), "idle timeout logged");
}

bool test_oversized_message_closes_connection(TestContext& ctx) {
  auto options = loopback_options("daemon_oversize");
  options.max_message_size = 1024;
  RunningDaemon running(ctx, options);

  {
    Connected conn(running, ctx.logger);
    conn.client.send_raw(std::string(4096, 'a'), kTimeout);
    if(!expect(closed_by_daemon(conn.client), "connection closed")) return false;
  }
  if(!expect(ctx.logs.wait_for_substring("message too large", kTimeout), "oversize logged")) return false;

  Connected next(running, ctx.logger);
  return expect(is_pong(next.client.request(Ping{}, kTimeout)), "daemon keeps accepting");
}

bool test_undecodable_message_closes_connection(TestContext& ctx) {
  RunningDaemon running(ctx, loopback_options("daemon_decode"));
  Connected conn(running, ctx.logger);
  conn.client.send_raw("{\"Teleport\":{}}\n", kTimeout);
  if(!expect(closed_by_daemon(conn.client), "connection closed")) return false;
  return expect(ctx.logs.wait_for_substring("message decode failed", kTimeout), "decode failure logged");
}

bool test_clipboard_between_clients(TestContext& ctx) {
  RunningDaemon running(ctx, loopback_options("daemon_clipboard"));
  {
    Connected writer(running, ctx.logger);
    writer.client.send(ClipboardSync{"shared text"}, kTimeout);
    // A round trip guarantees the sync was handled before the reader asks.
    if(!expect(is_pong(writer.client.request(Ping{}, kTimeout)), "writer round trip")) return false;
  }
  Connected reader(running, ctx.logger);
  auto reply = reader.client.request(RequestClipboard{}, kTimeout);
  auto* sync = reply ? std::get_if<ClipboardSync>(&*reply) : nullptr;
  return expect(sync && sync->text == "shared text", "clipboard read by another client");
}

bool test_send_file(TestContext& ctx) {
  auto options = loopback_options("daemon_send_file");
  const auto download_dir = options.download_dir;
  RunningDaemon running(ctx, options);

  auto source_dir = libreconnect::test::prepare_workspace("daemon_send_file_source");
  std::string content(kMaxChunkSize * 3 + 17, '\0');
  for(std::size_t i = 0; i < content.size(); ++i) content[i] = static_cast<char>(i % 253);
  libreconnect::test::write_file(source_dir / "photo.jpg", content);

  Connected conn(running, ctx.logger);
  auto sent = conn.client.send_file(source_dir / "photo.jpg", kTimeout);
  if(!expect_eq(sent, static_cast<uint64_t>(content.size()), "bytes sent")) return false;
  if(!expect(is_pong(conn.client.request(Ping{}, kTimeout)), "transfer handled before the ping")) return false;
  return expect(libreconnect::test::read_file(download_dir / "photo.jpg") == content, "received file matches");
}

bool test_failing_handler_keeps_connection(TestContext& ctx) {
  auto notifications = std::make_shared<RecordingNotificationSink>();
  notifications->set_failing(true);
  PlatformServices services;
  services.notifications = notifications;
  RunningDaemon running(ctx, loopback_options("daemon_failing_handler"), services);

  Connected conn(running, ctx.logger);
  conn.client.send(Notification{"Title", "Body", std::nullopt}, kTimeout);
  if(!expect(is_pong(conn.client.request(Ping{}, kTimeout)), "connection survives the failure")) return false;
  return expect(ctx.logs.contains("notification service unavailable"), "handler failure logged");
}

bool test_closed_connection_state_dropped(TestContext& ctx) {
  RunningDaemon running(ctx, loopback_options("daemon_battery"));
  auto* battery = running.daemon().dispatcher()->find<BatteryStatusHandler>();
  if(!expect(battery != nullptr, "battery handler registered")) return false;

  for(int i = 0; i < 3; ++i) {
    Connected conn(running, ctx.logger);
    conn.client.send(BatteryStatus{0.5f, false}, kTimeout);
    if(!expect(is_pong(conn.client.request(Ping{}, kTimeout)), "status delivered")) return false;
    if(!expect(battery->tracked() >= 1, "status kept while connected")) return false;
  }
  return expect(libreconnect::test::wait_for_condition([&]{ return battery->tracked() == 0; }, kTimeout),
                "statuses dropped once the connections close");
}

bool test_concurrent_clients(TestContext& ctx) {
  RunningDaemon running(ctx, loopback_options("daemon_concurrent"));
  std::atomic<int> pongs{0};
  std::vector<std::thread> threads;
  for(int i = 0; i < 4; ++i) {
    threads.emplace_back([&](){
      try {
        Connected conn(running, ctx.logger);
        for(int n = 0; n < 10; ++n) {
          if(is_pong(conn.client.request(Ping{}, kTimeout))) ++pongs;
        }
      } catch(const std::exception& e) {
        ctx.logger->error("client failed: {}", e.what());
      }
    });
  }
  for(auto& thread : threads) thread.join();
  return expect_eq(pongs.load(), 40, "every ping answered");
}

bool test_stop_closes_connections(TestContext& ctx) {
  auto running = std::make_unique<RunningDaemon>(ctx, loopback_options("daemon_stop"));
  Connected conn(*running, ctx.logger);
  if(!expect(is_pong(conn.client.request(Ping{}, kTimeout)), "connected")) return false;
  if(!expect(libreconnect::test::wait_for_condition([&]{ return running->daemon().active_connections() == 1; }, kTimeout),
             "connection tracked")) return false;
  running->daemon().stop();
  if(!expect(closed_by_daemon(conn.client), "client sees the close")) return false;
  return expect(ctx.logs.contains("Daemon stopped"), "stop logged");
}

bool test_listener_bind_failure(TestContext& ctx) {
  RunningDaemon first(ctx, loopback_options("daemon_bind_a"));
  auto options = loopback_options("daemon_bind_b");
  options.port = first.port();
  Daemon second(options, PlatformServices(), ctx.logger);
  try {
    second.start();
  } catch(const DaemonError& e) {
    return expect(e.kind() == ErrorKind::ListenerBind, "bind failure kind");
  }
  return expect(false, "second daemon on the same port fails to start");
}

bool test_required_discovery_failure_stops(TestContext& ctx) {
  auto options = loopback_options("daemon_discovery_required");
  options.discovery = true;
  options.discovery_required = true;
  Daemon daemon(options, PlatformServices(), ctx.logger);
  daemon.set_discovery_backend(std::make_unique<StaticBackend>(true));
  daemon.start();
  daemon.run();
  return expect(daemon.stop_reason().find("no responder") != std::string::npos, "run ends with the discovery failure");
}

bool test_optional_discovery_failure_continues(TestContext& ctx) {
  auto options = loopback_options("daemon_discovery_optional");
  options.discovery = true;
  Daemon daemon(options, PlatformServices(), ctx.logger);
  daemon.set_discovery_backend(std::make_unique<StaticBackend>(true));
  daemon.start();
  daemon.start_background();
  if(!expect(!daemon.discovery_running(), "discovery off after failure")) return false;

  asio::io_context io;
  Client client(io, ctx.logger);
  client.connect("127.0.0.1", daemon.listen_port(), kTimeout);
  bool answered = is_pong(client.request(Ping{}, kTimeout));
  daemon.stop();
  return expect(answered, "daemon still serves requests");
}

bool test_discovery_advertises_listener(TestContext& ctx) {
  auto options = loopback_options("daemon_discovery_advertise");
  options.discovery = true;
  std::vector<ServiceAdvertisement> registered;
  Daemon daemon(options, PlatformServices(), ctx.logger);
  daemon.set_discovery_backend(std::make_unique<StaticBackend>(false, &registered));
  daemon.start();
  bool ok = expect(daemon.discovery_running(), "discovery running")
    && expect_eq(registered.size(), std::size_t(1), "registered once")
    && expect_eq(registered.front().port, daemon.listen_port(), "advertised port is the listener's")
    && expect_eq(registered.front().properties.at("plugins"), std::to_string(daemon.handler_names().size()), "plugin count")
    && expect(registered.front().instance_name.rfind(options.device_name + "-", 0) == 0, "instance named after the device");
  daemon.stop();
  return ok;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"ping_pong", test_ping_pong},
    {"keyed_pairing_over_tcp", test_keyed_pairing_over_tcp},
    {"legacy_pairing_disabled", test_legacy_pairing_disabled},
    {"split_and_batched_frames", test_split_and_batched_frames},
    {"slow_sender_within_idle_timeout", test_slow_sender_within_idle_timeout},
    {"oversized_message_closes_connection", test_oversized_message_closes_connection},
    {"undecodable_message_closes_connection", test_undecodable_message_closes_connection},
    {"clipboard_between_clients", test_clipboard_between_clients},
    {"send_file", test_send_file},
    {"failing_handler_keeps_connection", test_failing_handler_keeps_connection},
    {"closed_connection_state_dropped", test_closed_connection_state_dropped},
    {"concurrent_clients", test_concurrent_clients},
    {"stop_closes_connections", test_stop_closes_connections},
    {"listener_bind_failure", test_listener_bind_failure},
    {"required_discovery_failure_stops", test_required_discovery_failure_stops},
    {"optional_discovery_failure_continues", test_optional_discovery_failure_continues},
    {"discovery_advertises_listener", test_discovery_advertises_listener}
  };
  return libreconnect::test::run_suite("daemon", tests, argc, argv);
}
