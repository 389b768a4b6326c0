#include "client.hpp"
#include <fstream>
#include <stdexcept>
#include <vector>
#include "errors.hpp"

Client::Client(asio::io_context& io, std::shared_ptr<Logger> logger)
    : io_(io), logger_(std::move(logger)), socket_(io) {}

Client::~Client(){
    close();
}

void Client::run(std::chrono::milliseconds timeout, const char* what){
    io_.restart();
    io_.run_for(timeout);
    if(!io_.stopped()){
        // Closing the socket aborts the outstanding operation; let it finish.
        std::error_code ec;
        socket_.close(ec);
        io_.run();
        throw DaemonError(ErrorKind::Timeout, std::string(what) + " timed out");
    }
}

void Client::connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout){
    close();
    asio::ip::tcp::resolver resolver(io_);
    std::error_code ec;
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if(ec){
        throw DaemonError(ErrorKind::Network, "resolve " + host + ": " + ec.message());
    }

    std::error_code result = asio::error::would_block;
    asio::async_connect(socket_, endpoints,
        [&result](std::error_code connect_ec, const asio::ip::tcp::endpoint&){ result = connect_ec; });
    run(timeout, "connect");
    if(result){
        close();
        throw DaemonError(ErrorKind::Network,
                          "connect " + host + ":" + std::to_string(port) + ": " + result.message());
    }
    log_debug(logger_.get(), "Connected to {}:{}", host, port);
}

void Client::close(){
    std::error_code ec;
    if(socket_.is_open()){
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }
    read_buf_.consume(read_buf_.size());
}

void Client::send(const Message& message, std::chrono::milliseconds timeout){
    log_debug(logger_.get(), "Sending {}", message_type_name(message));
    send_raw(frame_message(message), timeout);
}

void Client::send_raw(const std::string& bytes, std::chrono::milliseconds timeout){
    if(!socket_.is_open()){
        throw DaemonError(ErrorKind::Network, "not connected");
    }
    std::error_code result = asio::error::would_block;
    asio::async_write(socket_, asio::buffer(bytes),
        [&result](std::error_code write_ec, std::size_t){ result = write_ec; });
    run(timeout, "write");
    if(result){
        throw DaemonError(ErrorKind::Network, "write: " + result.message());
    }
}

std::optional<Message> Client::receive(std::chrono::milliseconds timeout){
    if(!socket_.is_open()){
        throw DaemonError(ErrorKind::Network, "not connected");
    }
    std::error_code result = asio::error::would_block;
    std::size_t bytes = 0;
    asio::async_read_until(socket_, read_buf_, kMessageDelimiter,
        [&result, &bytes](std::error_code read_ec, std::size_t n){ result = read_ec; bytes = n; });
    run(timeout, "read");
    if(result == asio::error::eof){
        return std::nullopt;
    }
    if(result){
        throw DaemonError(ErrorKind::Network, "read: " + result.message());
    }

    auto begin = asio::buffers_begin(read_buf_.data());
    std::string line(begin, begin + static_cast<std::ptrdiff_t>(bytes));
    read_buf_.consume(bytes);
    try {
        return decode_message(line);
    } catch(const DecodeError& e){
        throw DaemonError(ErrorKind::MessageDecode, e.what());
    }
}

std::optional<Message> Client::request(const Message& message, std::chrono::milliseconds timeout){
    send(message, timeout);
    return receive(timeout);
}

uint64_t Client::send_file(const std::filesystem::path& path,
                           std::chrono::milliseconds timeout,
                           std::size_t chunk_size){
    std::ifstream in(path, std::ios::binary);
    if(!in){
        throw std::runtime_error("Failed to open file " + path.string());
    }
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if(ec){
        throw std::runtime_error("Failed to stat " + path.string() + ": " + ec.message());
    }
    if(size == 0){
        throw std::runtime_error("Cannot send empty file");
    }
    auto name = path.filename().string();
    if(chunk_size == 0) chunk_size = kMaxChunkSize;

    send(FileTransferRequest{name, size}, timeout);

    uint64_t offset = 0;
    std::vector<char> buf(chunk_size);
    while(in){
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        auto got = static_cast<std::size_t>(in.gcount());
        if(got == 0) break;
        FileTransferChunk chunk;
        chunk.file_name = name;
        chunk.offset = offset;
        chunk.chunk.assign(buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(got));
        send(chunk, timeout);
        offset += got;
        log_debug(logger_.get(), "Sent {}/{} bytes of {}", offset, size, name);
    }

    send(FileTransferEnd{name}, timeout);
    return offset;
}
