#include "discovery.hpp"
#include <cctype>
#include "errors.hpp"

namespace {

constexpr int kSilentIntervals = 3;
constexpr int kMaxReceiveErrors = 10;

std::string lower(std::string value){
  for(auto& ch : value) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  return value;
}

bool same_peer(const DiscoveryEvent& a, const DiscoveryEvent& b){
  return a.host == b.host && a.port == b.port && a.properties == b.properties;
}

} // namespace

std::string ServiceAdvertisement::fullname() const {
  return instance_name + "." + service_type;
}

const char* to_string(DiscoveryEvent::Kind kind){
  switch(kind){
    case DiscoveryEvent::Kind::Found:    return "found";
    case DiscoveryEvent::Kind::Resolved: return "resolved";
    case DiscoveryEvent::Kind::Removed:  return "removed";
    case DiscoveryEvent::Kind::Failed:   return "failed";
  }
  return "unknown";
}

// ---- MulticastDiscoveryBackend -------------------------------------------

MulticastDiscoveryBackend::MulticastDiscoveryBackend(asio::io_context& io, Options options,
                                                     std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(std::move(logger)),
    strand_(asio::make_strand(io)),
    send_socket_(strand_),
    receive_socket_(strand_),
    announce_timer_(strand_)
{
  std::error_code ec;
  auto group = asio::ip::make_address(options_.group, ec);
  if(ec){
    throw DaemonError(ErrorKind::DiscoveryInit, "invalid multicast group '" + options_.group + "': " + ec.message());
  }
  if(!group.is_multicast()){
    throw DaemonError(ErrorKind::DiscoveryInit, options_.group + " is not a multicast address");
  }
  if(options_.interval.count() <= 0){
    throw DaemonError(ErrorKind::DiscoveryInit, "announce interval must be positive");
  }
  group_endpoint_ = asio::ip::udp::endpoint(group, options_.port);
}

MulticastDiscoveryBackend::~MulticastDiscoveryBackend(){
  shutdown();
}

std::string MulticastDiscoveryBackend::encode_beacon(const ServiceAdvertisement& advertisement, bool goodbye){
  json props = json::object();
  for(const auto& [key, value] : advertisement.properties) props[key] = value;
  json beacon = {
    {"kind", goodbye ? "goodbye" : "announce"},
    {"service_type", advertisement.service_type},
    {"instance", advertisement.instance_name},
    {"host", advertisement.host_name},
    {"port", advertisement.port},
    {"properties", props}
  };
  return beacon.dump();
}

void MulticastDiscoveryBackend::register_service(const ServiceAdvertisement& advertisement){
  std::error_code ec;
  send_socket_.open(group_endpoint_.protocol(), ec);
  if(!ec) send_socket_.set_option(asio::ip::multicast::hops(1), ec);
  if(!ec) send_socket_.set_option(asio::ip::multicast::enable_loopback(true), ec);
  if(ec){
    throw DaemonError(ErrorKind::DiscoveryRegister, "unable to open multicast sender: " + ec.message());
  }
  {
    std::lock_guard lg(m_);
    advertisement_ = advertisement;
  }
  running_ = true;
  log_info(logger_.get(), "Advertising {} on port {} via {}:{}",
           advertisement.fullname(), advertisement.port, options_.group, options_.port);
  asio::post(strand_, [this](){ send_beacon(false); });
  schedule_announce();
}

void MulticastDiscoveryBackend::watch(const std::string& service_type, EventHandler handler){
  std::lock_guard lg(m_);
  browse_type_ = service_type;
  handler_ = std::move(handler);
}

void MulticastDiscoveryBackend::browse(const std::string& service_type, EventHandler handler){
  watch(service_type, std::move(handler));

  std::error_code ec;
  asio::ip::udp::endpoint listen(group_endpoint_.address().is_v6() ? asio::ip::address(asio::ip::address_v6::any())
                                                                   : asio::ip::address(asio::ip::address_v4::any()),
                                 options_.port);
  receive_socket_.open(listen.protocol(), ec);
  if(!ec) receive_socket_.set_option(asio::ip::udp::socket::reuse_address(true), ec);
  if(!ec) receive_socket_.bind(listen, ec);
  if(!ec) receive_socket_.set_option(asio::ip::multicast::join_group(group_endpoint_.address()), ec);
  if(ec){
    throw DaemonError(ErrorKind::DiscoveryBrowse,
                      "unable to join " + options_.group + ":" + std::to_string(options_.port) + ": " + ec.message());
  }
  running_ = true;
  log_info(logger_.get(), "Browsing for {}", service_type);
  asio::post(strand_, [this](){ start_receive(); });
}

void MulticastDiscoveryBackend::shutdown(){
  bool was_running = running_.exchange(false);
  std::error_code ec;
  announce_timer_.cancel();
  if(was_running && send_socket_.is_open()){
    bool advertised = false;
    {
      std::lock_guard lg(m_);
      advertised = advertisement_.has_value();
    }
    if(advertised) send_beacon(true);
  }
  send_socket_.close(ec);
  receive_socket_.close(ec);
}

void MulticastDiscoveryBackend::schedule_announce(){
  announce_timer_.expires_after(options_.interval);
  announce_timer_.async_wait([this](const std::error_code& ec){
    if(ec || !running_) return;
    send_beacon(false);
    sweep(std::chrono::steady_clock::now());
    schedule_announce();
  });
}

void MulticastDiscoveryBackend::send_beacon(bool goodbye){
  std::string payload;
  {
    std::lock_guard lg(m_);
    if(!advertisement_) return;
    payload = encode_beacon(*advertisement_, goodbye);
  }
  std::error_code ec;
  send_socket_.send_to(asio::buffer(payload), group_endpoint_, 0, ec);
  if(ec){
    log_debug(logger_.get(), "Beacon send failed: {}", ec.message());
  }
}

void MulticastDiscoveryBackend::start_receive(){
  if(!running_ || !receive_socket_.is_open()) return;
  receive_socket_.async_receive_from(asio::buffer(receive_buf_), sender_,
    [this](std::error_code ec, std::size_t n){
      if(ec == asio::error::operation_aborted || !running_) return;
      if(ec){
        log_warn(logger_.get(), "Discovery receive error: {}", ec.message());
        if(++receive_errors_ >= kMaxReceiveErrors){
          DiscoveryEvent failed;
          failed.kind = DiscoveryEvent::Kind::Failed;
          failed.error = std::string(error_kind_name(ErrorKind::DiscoveryBrowse)) + ": " + ec.message();
          emit(failed);
          return;
        }
        start_receive();
        return;
      }
      receive_errors_ = 0;
      process_datagram(std::string(receive_buf_.data(), n), sender_.address().to_string(),
                       std::chrono::steady_clock::now());
      start_receive();
    });
}

void MulticastDiscoveryBackend::process_datagram(const std::string& payload, const std::string& from,
                                                 std::chrono::steady_clock::time_point now){
  if(payload.size() > kMaxBeaconSize) return;

  json beacon;
  try {
    beacon = json::parse(payload);
  } catch(const json::parse_error& e){
    log_debug(logger_.get(), "Ignoring malformed beacon from {}: {}", from, e.what());
    return;
  }
  if(!beacon.is_object()) return;

  auto text = [&](const char* key) -> std::string {
    auto it = beacon.find(key);
    return (it != beacon.end() && it->is_string()) ? it->get<std::string>() : std::string();
  };

  const std::string kind = text("kind");
  const std::string service_type = text("service_type");
  const std::string instance = text("instance");
  if(instance.empty() || (kind != "announce" && kind != "goodbye")) return;

  DiscoveryEvent event;
  event.fullname = instance + "." + service_type;
  event.host = text("host");
  if(event.host.empty()) event.host = from;
  auto port = beacon.find("port");
  if(port != beacon.end() && port->is_number_unsigned() && port->get<uint64_t>() <= 65535){
    event.port = static_cast<uint16_t>(port->get<uint64_t>());
  }
  auto props = beacon.find("properties");
  if(props != beacon.end() && props->is_object()){
    for(const auto& item : props->items()){
      event.properties[item.key()] = item.value().is_string() ? item.value().get<std::string>() : item.value().dump();
    }
  }

  std::vector<DiscoveryEvent> out;
  {
    std::lock_guard lg(m_);
    if(!browse_type_.empty() && service_type != browse_type_) return;
    if(advertisement_ && advertisement_->fullname() == event.fullname) return;

    auto it = peers_.find(event.fullname);
    if(kind == "goodbye"){
      if(it == peers_.end()) return;
      peers_.erase(it);
      DiscoveryEvent removed;
      removed.kind = DiscoveryEvent::Kind::Removed;
      removed.fullname = event.fullname;
      out.push_back(std::move(removed));
    } else {
      event.kind = DiscoveryEvent::Kind::Resolved;
      if(it == peers_.end()){
        DiscoveryEvent found;
        found.kind = DiscoveryEvent::Kind::Found;
        found.fullname = event.fullname;
        out.push_back(std::move(found));
        out.push_back(event);
        peers_[event.fullname] = Peer{event, now};
      } else {
        if(!same_peer(it->second.resolved, event)){
          out.push_back(event);
          it->second.resolved = event;
        }
        it->second.last_seen = now;
      }
    }
  }
  for(const auto& e : out) emit(e);
}

void MulticastDiscoveryBackend::sweep(std::chrono::steady_clock::time_point now){
  const auto limit = options_.interval * kSilentIntervals;
  std::vector<DiscoveryEvent> out;
  {
    std::lock_guard lg(m_);
    for(auto it = peers_.begin(); it != peers_.end();){
      if(now - it->second.last_seen > limit){
        DiscoveryEvent removed;
        removed.kind = DiscoveryEvent::Kind::Removed;
        removed.fullname = it->first;
        out.push_back(std::move(removed));
        it = peers_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for(const auto& e : out) emit(e);
}

std::size_t MulticastDiscoveryBackend::known_peers() const {
  std::lock_guard lg(m_);
  return peers_.size();
}

void MulticastDiscoveryBackend::emit(const DiscoveryEvent& event){
  EventHandler handler;
  {
    std::lock_guard lg(m_);
    handler = handler_;
  }
  if(handler) handler(event);
}

// ---- DiscoveryBridge -------------------------------------------------------

DiscoveryBridge::DiscoveryBridge(std::unique_ptr<DiscoveryBackend> backend,
                                 std::shared_ptr<DeviceRegistry> registry,
                                 ServiceAdvertisement advertisement,
                                 std::shared_ptr<Logger> logger,
                                 FailureHandler on_failure)
  : backend_(std::move(backend)),
    registry_(std::move(registry)),
    advertisement_(std::move(advertisement)),
    logger_(std::move(logger)),
    on_failure_(std::move(on_failure)) {}

DiscoveryBridge::~DiscoveryBridge(){
  stop();
}

bool DiscoveryBridge::start(){
  if(!backend_){
    fail(std::string(error_kind_name(ErrorKind::DiscoveryInit)) + ": no backend");
    return false;
  }
  try {
    backend_->register_service(advertisement_);
    running_ = true;
    backend_->browse(advertisement_.service_type,
                     [this](const DiscoveryEvent& event){ on_event(event); });
  } catch(const DaemonError& e){
    fail(e.what());
    return false;
  } catch(const std::system_error& e){
    fail(std::string(error_kind_name(ErrorKind::DiscoveryInit)) + ": " + e.what());
    return false;
  }
  log_info(logger_.get(), "Discovery started as {}", advertisement_.fullname());
  return true;
}

void DiscoveryBridge::stop(){
  running_ = false;
  if(backend_) backend_->shutdown();
}

DeviceInfo DiscoveryBridge::device_from_event(const DiscoveryEvent& event){
  DeviceInfo info;
  info.id = event.fullname;
  info.name = event.fullname;
  auto it = event.properties.find("device_type");
  info.device_type = (it != event.properties.end() && lower(it->second) == "mobile")
    ? DeviceType::Mobile
    : DeviceType::Desktop;
  return info;
}

void DiscoveryBridge::on_event(const DiscoveryEvent& event){
  switch(event.kind){
    case DiscoveryEvent::Kind::Found:
      log_debug(logger_.get(), "Found {}", event.fullname);
      break;
    case DiscoveryEvent::Kind::Resolved:
      if(event.fullname == advertisement_.fullname()) return;
      log_debug(logger_.get(), "Resolved {} at {}:{}", event.fullname, event.host, event.port);
      registry_->upsert_discovered(device_from_event(event));
      break;
    case DiscoveryEvent::Kind::Removed:
      registry_->remove_discovered(event.fullname);
      break;
    case DiscoveryEvent::Kind::Failed:
      fail(event.error);
      break;
  }
}

void DiscoveryBridge::fail(const std::string& reason){
  running_ = false;
  // No beacons or sweeps once discovery has stopped.
  if(backend_) backend_->shutdown();
  log_error(logger_.get(), "Discovery stopped: {}", reason);
  if(on_failure_) on_failure_(reason);
}
