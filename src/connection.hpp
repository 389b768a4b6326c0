#pragma once
#include <asio.hpp>
#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include "log.hpp"
#include "message_router.hpp"
#include "protocol.hpp"

// One accepted TCP connection. Reads newline-framed messages, hands each to
// the router and writes the reply (if any) before reading the next one. All
// handlers run on the socket's strand. The read timeout is an idle timeout:
// every read that delivers bytes restarts it.
class Connection : public std::enable_shared_from_this<Connection> {
public:
    struct Limits {
        std::chrono::milliseconds read_timeout = std::chrono::seconds(120);
        std::chrono::milliseconds write_timeout = std::chrono::seconds(120);
        std::size_t max_message_size = kMaxMessageSize;
    };

    using ClosedHandler = std::function<void(const std::string& peer)>;

    // `sock` must be bound to a strand executor.
    static std::shared_ptr<Connection> create(asio::ip::tcp::socket sock,
                                              std::shared_ptr<const MessageRouter> router,
                                              Limits limits,
                                              std::shared_ptr<Logger> logger = nullptr,
                                              ClosedHandler on_closed = nullptr);

    ~Connection();

    void start();
    // Closes the socket from the connection's own executor.
    void stop();

    const std::string& peer() const { return peer_; }

private:
    Connection(asio::ip::tcp::socket sock,
               std::shared_ptr<const MessageRouter> router,
               Limits limits,
               std::shared_ptr<Logger> logger,
               ClosedHandler on_closed);

    void do_read();
    void read_more();
    void on_read(std::error_code ec, std::size_t bytes);
    void handle_line(std::string line);
    void do_write(std::string frame);
    void close(const std::string& reason);

    asio::ip::tcp::socket socket_;
    std::shared_ptr<const MessageRouter> router_;
    Limits limits_;
    std::shared_ptr<Logger> logger_;
    ClosedHandler on_closed_;
    std::array<char, 8192> read_chunk_{};
    std::string pending_;
    asio::steady_timer read_timer_;
    asio::steady_timer write_timer_;
    std::string write_buf_;
    std::string peer_;
    uint64_t read_generation_ = 0;
    uint64_t write_generation_ = 0;
    bool closed_ = false;
};
