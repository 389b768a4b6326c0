#pragma once
#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include "log.hpp"
#include "protocol.hpp"

// Blocking client for the daemon's line protocol. Every call is bounded by
// a timeout; failures throw DaemonError (Network, Timeout, MessageDecode).
class Client {
public:
    explicit Client(asio::io_context& io, std::shared_ptr<Logger> logger = nullptr);
    ~Client();

    void connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout);
    void close();
    bool connected() const { return socket_.is_open(); }

    void send(const Message& message, std::chrono::milliseconds timeout);
    // Writes bytes as they are, without framing.
    void send_raw(const std::string& bytes, std::chrono::milliseconds timeout);

    // Next message, or nullopt once the daemon has closed the connection.
    std::optional<Message> receive(std::chrono::milliseconds timeout);

    // send() followed by receive().
    std::optional<Message> request(const Message& message, std::chrono::milliseconds timeout);

    // FileTransferRequest, the file in chunks, then FileTransferEnd. Returns
    // the number of bytes sent.
    uint64_t send_file(const std::filesystem::path& path,
                       std::chrono::milliseconds timeout,
                       std::size_t chunk_size = kMaxChunkSize);

private:
    void run(std::chrono::milliseconds timeout, const char* what);

    asio::io_context& io_;
    std::shared_ptr<Logger> logger_;
    asio::ip::tcp::socket socket_;
    asio::streambuf read_buf_;
};
