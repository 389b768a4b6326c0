#include "connection.hpp"
#include "errors.hpp"

namespace {

std::string endpoint_name(const asio::ip::tcp::socket& socket){
    std::error_code ec;
    auto ep = socket.remote_endpoint(ec);
    if(ec) return "unknown";
    return ep.address().to_string() + ":" + std::to_string(ep.port());
}

} // namespace

std::shared_ptr<Connection> Connection::create(asio::ip::tcp::socket sock,
                                               std::shared_ptr<const MessageRouter> router,
                                               Limits limits,
                                               std::shared_ptr<Logger> logger,
                                               ClosedHandler on_closed)
{
    return std::shared_ptr<Connection>(new Connection(std::move(sock), std::move(router), limits,
                                                      std::move(logger), std::move(on_closed)));
}

Connection::Connection(asio::ip::tcp::socket sock,
                       std::shared_ptr<const MessageRouter> router,
                       Limits limits,
                       std::shared_ptr<Logger> logger,
                       ClosedHandler on_closed)
: socket_(std::move(sock)),
  router_(std::move(router)),
  limits_(limits),
  logger_(std::move(logger)),
  on_closed_(std::move(on_closed)),
  read_timer_(socket_.get_executor()),
  write_timer_(socket_.get_executor()),
  peer_(endpoint_name(socket_))
{
}

Connection::~Connection(){
    std::error_code ec;
    socket_.close(ec);
}

void Connection::start(){
    log_info(logger_.get(), "Connection from {}", peer_);
    auto self = shared_from_this();
    asio::dispatch(socket_.get_executor(), [this, self](){ do_read(); });
}

void Connection::stop(){
    auto self = shared_from_this();
    asio::post(socket_.get_executor(), [this, self](){ close("daemon stopping"); });
}

void Connection::do_read(){
    if(closed_) return;

    // Serve lines already buffered before touching the socket.
    for(;;){
        const auto pos = pending_.find(kMessageDelimiter);
        if(pos == std::string::npos) break;
        if(pos > limits_.max_message_size){
            log_warn(logger_.get(), "{} from {}: {} bytes before the delimiter",
                     error_kind_name(ErrorKind::MessageTooLarge), peer_, pos);
            close("message too large");
            return;
        }
        std::string line = pending_.substr(0, pos);
        pending_.erase(0, pos + 1);
        if(!line.empty() && line.back() == '\r') line.pop_back();
        if(line.empty()) continue;
        handle_line(std::move(line));
        return;
    }

    if(pending_.size() > limits_.max_message_size){
        log_warn(logger_.get(), "{} from {}: more than {} bytes without a delimiter",
                 error_kind_name(ErrorKind::MessageTooLarge), peer_, limits_.max_message_size);
        close("message too large");
        return;
    }
    read_more();
}

void Connection::read_more(){
    auto self = shared_from_this();

    // A completion that races an expiry bumps the generation, so a stale
    // timer handler cannot close a healthy connection.
    const auto generation = ++read_generation_;
    read_timer_.expires_after(limits_.read_timeout);
    read_timer_.async_wait([this, self, generation](const std::error_code& ec){
        if(ec || closed_ || generation != read_generation_) return;
        log_info(logger_.get(), "{} on {} after {} ms idle",
                 error_kind_name(ErrorKind::Timeout), peer_, limits_.read_timeout.count());
        close("read timeout");
    });

    socket_.async_read_some(asio::buffer(read_chunk_),
        [this, self](std::error_code ec, std::size_t bytes){
            ++read_generation_;
            read_timer_.cancel();
            on_read(ec, bytes);
        });
}

void Connection::on_read(std::error_code ec, std::size_t bytes){
    if(closed_) return;
    if(ec == asio::error::eof){
        if(!pending_.empty()){
            log_debug(logger_.get(), "{} left {} unterminated bytes", peer_, pending_.size());
        }
        log_info(logger_.get(), "{} disconnected", peer_);
        close("");
        return;
    }
    if(ec){
        if(ec != asio::error::operation_aborted){
            log_warn(logger_.get(), "{} reading from {}: {}", error_kind_name(ErrorKind::Network), peer_, ec.message());
        }
        close("read error");
        return;
    }

    pending_.append(read_chunk_.data(), bytes);
    do_read();
}

void Connection::handle_line(std::string line){
    Message message;
    try {
        message = decode_message(line);
    } catch(const DecodeError& e){
        log_warn(logger_.get(), "{} from {}: {}", error_kind_name(ErrorKind::MessageDecode), peer_, e.what());
        close("undecodable message");
        return;
    }

    std::optional<Message> reply;
    try {
        reply = router_->route(message, peer_);
    } catch(const std::system_error& e){
        log_error(logger_.get(), "{} while handling {} from {}: {}",
                  error_kind_name(ErrorKind::RegistryLock), message_type_name(message), peer_, e.what());
    } catch(const std::exception& e){
        log_error(logger_.get(), "Handling {} from {} failed: {}", message_type_name(message), peer_, e.what());
    }

    if(reply){
        do_write(frame_message(*reply));
    } else {
        // Posted so a long batch of reply-less messages does not nest.
        auto self = shared_from_this();
        asio::post(socket_.get_executor(), [this, self](){ do_read(); });
    }
}

void Connection::do_write(std::string frame){
    if(closed_) return;
    write_buf_ = std::move(frame);
    auto self = shared_from_this();

    const auto generation = ++write_generation_;
    write_timer_.expires_after(limits_.write_timeout);
    write_timer_.async_wait([this, self, generation](const std::error_code& ec){
        if(ec || closed_ || generation != write_generation_) return;
        log_warn(logger_.get(), "{} writing to {}", error_kind_name(ErrorKind::Timeout), peer_);
        close("write timeout");
    });

    asio::async_write(socket_, asio::buffer(write_buf_),
        [this, self](std::error_code ec, std::size_t){
            ++write_generation_;
            write_timer_.cancel();
            if(closed_) return;
            if(ec){
                log_warn(logger_.get(), "{} writing to {}: {}", error_kind_name(ErrorKind::Network), peer_, ec.message());
                close("write error");
                return;
            }
            do_read();
        });
}

void Connection::close(const std::string& reason){
    if(closed_) return;
    closed_ = true;
    if(!reason.empty()){
        log_debug(logger_.get(), "Closing {}: {}", peer_, reason);
    }
    std::error_code ec;
    read_timer_.cancel();
    write_timer_.cancel();
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    if(on_closed_) on_closed_(peer_);
}
