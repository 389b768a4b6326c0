#include "daemon.hpp"

#include <algorithm>
#include <stdexcept>

#include "errors.hpp"
#include "settings_manager.hpp"
#include "utils.hpp"

namespace {

constexpr std::chrono::milliseconds kAcceptRetryDelay{100};

uint16_t port_setting(const SettingsManager& settings, const std::string& key, int min_value) {
  auto value = settings.get<long long>(key);
  if(value < min_value || value > 65535) {
    throw DaemonError(ErrorKind::Configuration, key + " out of range: " + std::to_string(value));
  }
  return static_cast<uint16_t>(value);
}

long long positive_setting(const SettingsManager& settings, const std::string& key) {
  auto value = settings.get<long long>(key);
  if(value <= 0) {
    throw DaemonError(ErrorKind::Configuration, key + " must be positive");
  }
  return value;
}

} // namespace

Daemon::Options Daemon::Options::from_settings(const SettingsManager& settings) {
  Options options;
  options.listen_ip = settings.get<std::string>("listen_ip");
  options.port = port_setting(settings, "port", 0);
  options.device_name = settings.get<std::string>("device_name");
  if(options.device_name.empty()) options.device_name = local_hostname();
  options.config_dir = settings.get<std::string>("config_dir");
  if(options.config_dir.empty()) options.config_dir = default_config_dir();
  options.download_dir = settings.get<std::string>("download_dir");
  if(options.download_dir.empty()) options.download_dir = default_download_dir();
  options.read_timeout = std::chrono::seconds(positive_setting(settings, "read_timeout_secs"));
  options.write_timeout = std::chrono::seconds(positive_setting(settings, "write_timeout_secs"));
  options.max_message_size = static_cast<std::size_t>(positive_setting(settings, "max_message_size"));
  options.worker_threads = static_cast<std::size_t>(positive_setting(settings, "worker_threads"));
  options.discovery = settings.get<bool>("discovery");
  options.discovery_required = settings.get<bool>("discovery_required");
  options.discovery_group = settings.get<std::string>("discovery_group");
  options.discovery_port = port_setting(settings, "discovery_port", 1);
  options.discovery_interval = std::chrono::seconds(positive_setting(settings, "discovery_interval_secs"));
  options.allow_legacy_pairing = settings.get<bool>("allow_legacy_pairing");
  return options;
}

Daemon::Daemon(Options options, PlatformServices services, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    services_(std::move(services)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("daemon")) {
  if(options_.device_name.empty()) options_.device_name = local_hostname();
  if(options_.config_dir.empty()) options_.config_dir = default_config_dir();
  if(options_.download_dir.empty()) options_.download_dir = default_download_dir();
  if(options_.worker_threads == 0) options_.worker_threads = 1;

  auto defaults = PlatformServices::defaults(logger_);
  if(!services_.clipboard) services_.clipboard = defaults.clipboard;
  if(!services_.input) services_.input = defaults.input;
  if(!services_.notifications) services_.notifications = defaults.notifications;
  if(!services_.media) services_.media = defaults.media;
  if(!services_.commands) services_.commands = defaults.commands;

  local_device_.id = local_device_id(options_.device_name);
  local_device_.name = options_.device_name;
  local_device_.device_type = DeviceType::Desktop;
  for(auto cap : all_capabilities()) local_device_.capabilities.insert(cap);

  registry_ = std::make_shared<DeviceRegistry>(options_.config_dir, make_child_logger(logger_, "registry"));
  pairing_ = std::make_shared<PairingAuthority>(registry_, make_child_logger(logger_, "pairing"));
  pairing_->set_allow_legacy(options_.allow_legacy_pairing);
  dispatcher_ = std::make_shared<CapabilityDispatcher>(make_child_logger(logger_, "dispatch"));
}

Daemon::~Daemon() {
  stop();
}

void Daemon::set_discovery_backend(std::unique_ptr<DiscoveryBackend> backend) {
  if(started_) {
    throw std::logic_error("discovery backend replaced after start");
  }
  pending_backend_ = std::move(backend);
}

void Daemon::start() {
  if(started_.exchange(true)) return;

  registry_->load();

  register_default_capabilities(*dispatcher_, services_, options_.download_dir,
                                make_child_logger(logger_, "dispatch"));
  dispatcher_->freeze();
  router_ = std::make_shared<MessageRouter>(pairing_, dispatcher_, make_child_logger(logger_, "router"));

  bind_listener();
  start_accept();

  logger_->info("{} listening on {}:{} ({} handlers, {} worker threads)",
                local_device_.name, options_.listen_ip, listen_port_,
                dispatcher_->size(), options_.worker_threads);

  if(options_.discovery) {
    start_discovery();
  }
}

void Daemon::bind_listener() {
  const std::string where = options_.listen_ip + ":" + std::to_string(options_.port);
  std::error_code ec;
  auto address = asio::ip::make_address(options_.listen_ip, ec);
  if(ec) {
    throw DaemonError(ErrorKind::ListenerBind, "invalid listen address '" + options_.listen_ip + "'");
  }

  tcp::endpoint endpoint(address, options_.port);
  acceptor_ = std::make_unique<tcp::acceptor>(io_);
  acceptor_->open(endpoint.protocol(), ec);
  if(!ec) acceptor_->set_option(tcp::acceptor::reuse_address(true), ec);
  if(!ec) acceptor_->bind(endpoint, ec);
  if(!ec) acceptor_->listen(asio::socket_base::max_listen_connections, ec);
  if(ec) {
    acceptor_.reset();
    throw DaemonError(ErrorKind::ListenerBind, where + ": " + ec.message());
  }
  listen_port_ = acceptor_->local_endpoint().port();
  accept_retry_timer_ = std::make_unique<asio::steady_timer>(io_);
}

void Daemon::start_accept() {
  if(!acceptor_ || stopping_) return;
  acceptor_->async_accept(asio::make_strand(io_),
    [this](std::error_code ec, tcp::socket socket){
      if(stopping_) return;
      if(ec == asio::error::operation_aborted || ec == asio::error::bad_descriptor) {
        request_stop("listener closed");
        return;
      }
      if(ec) {
        logger_->error("{}: accept failed: {}", error_kind_name(ErrorKind::Network), ec.message());
        accept_retry_timer_->expires_after(kAcceptRetryDelay);
        accept_retry_timer_->async_wait([this](const std::error_code& wait_ec){
          if(!wait_ec) start_accept();
        });
        return;
      }

      Connection::Limits limits;
      limits.read_timeout = options_.read_timeout;
      limits.write_timeout = options_.write_timeout;
      limits.max_message_size = options_.max_message_size;
      auto connection = Connection::create(std::move(socket), router_, limits,
                                           make_child_logger(logger_, "connection"),
                                           [this](const std::string& peer){ on_connection_closed(peer); });
      {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_.erase(std::remove_if(connections_.begin(), connections_.end(),
                                          [](const std::weak_ptr<Connection>& c){ return c.expired(); }),
                           connections_.end());
        connections_.push_back(connection);
      }
      connection->start();
      start_accept();
    });
}

void Daemon::on_connection_closed(const std::string& peer) {
  logger_->debug("Connection {} closed", peer);
  router_->disconnected(peer);
}

void Daemon::start_discovery() {
  std::unique_ptr<DiscoveryBackend> backend = std::move(pending_backend_);
  auto discovery_logger = make_child_logger(logger_, "discovery");
  if(!backend) {
    MulticastDiscoveryBackend::Options backend_options;
    backend_options.group = options_.discovery_group;
    backend_options.port = options_.discovery_port;
    backend_options.interval = options_.discovery_interval;
    try {
      backend = std::make_unique<MulticastDiscoveryBackend>(io_, backend_options, discovery_logger);
    } catch(const DaemonError& e) {
      logger_->error("Discovery unavailable: {}", e.what());
      if(options_.discovery_required) request_stop(e.what());
      return;
    }
  }

  ServiceAdvertisement advertisement;
  advertisement.instance_name = options_.device_name + "-" + hex_from_bytes(random_bytes(3));
  advertisement.host_name = local_hostname();
  advertisement.port = listen_port_;
  advertisement.properties["version"] = kProtocolVersion;
  advertisement.properties["device_type"] = "desktop";
  advertisement.properties["plugins"] = std::to_string(dispatcher_->size());

  discovery_ = std::make_unique<DiscoveryBridge>(
    std::move(backend), registry_, std::move(advertisement), discovery_logger,
    [this](const std::string& reason){
      if(options_.discovery_required) {
        request_stop("discovery failed: " + reason);
      } else {
        logger_->warn("Continuing without discovery");
      }
    });
  discovery_->start();
}

void Daemon::launch_threads() {
  if(!threads_.empty()) return;
  work_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(io_.get_executor());
  for(std::size_t i = 0; i < options_.worker_threads; ++i) {
    threads_.emplace_back([this](){
      try {
        io_.run();
      } catch(const std::exception& e) {
        logger_->error("I/O thread failed: {}", e.what());
        request_stop(std::string("I/O thread failed: ") + e.what());
      }
    });
  }
}

void Daemon::run() {
  if(!started_) start();
  launch_threads();
  {
    std::unique_lock<std::mutex> lock(state_mutex_);
    state_cv_.wait(lock, [this](){ return stop_requested_; });
  }
  stop();
}

void Daemon::start_background() {
  if(!started_) start();
  launch_threads();
}

void Daemon::request_stop(const std::string& reason) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if(stop_requested_) return;
    stop_requested_ = true;
    stop_reason_ = reason;
  }
  logger_->info("Shutting down: {}", reason);
  state_cv_.notify_all();
}

std::string Daemon::stop_reason() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return stop_reason_;
}

void Daemon::stop() {
  if(!started_ || stopping_.exchange(true)) return;
  request_stop("daemon stopped");

  work_.reset();
  io_.stop();
  for(auto& thread : threads_) {
    if(thread.joinable()) thread.join();
  }
  threads_.clear();

  // No I/O threads from here on: tear down on this thread and drain the
  // resulting completions.
  io_.restart();
  if(discovery_) discovery_->stop();
  if(accept_retry_timer_) accept_retry_timer_->cancel();
  if(acceptor_) {
    std::error_code ec;
    acceptor_->close(ec);
  }
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for(auto& weak : connections_) {
      if(auto connection = weak.lock()) connection->stop();
    }
    connections_.clear();
  }
  while(io_.poll() > 0) {}
  logger_->info("Daemon stopped");
}

bool Daemon::discovery_running() const {
  return discovery_ && discovery_->running();
}

std::size_t Daemon::active_connections() const {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  std::size_t live = 0;
  for(const auto& weak : connections_) {
    if(!weak.expired()) ++live;
  }
  return live;
}
