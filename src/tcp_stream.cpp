/**
 * @file tcp_stream.cpp
 * @brief Implementation of the asio TCP stream
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lanshare/tcp_stream.hpp"
#include "lanshare/errors.hpp"
#include <algorithm>

namespace lanshare {

namespace {

/// Longest single wait on the shared io_context before rechecking completion
constexpr auto RUN_SLICE = std::chrono::milliseconds(20);

} // namespace

// ============================================================================
// Constructor / Destructor
// ============================================================================

TcpStream::TcpStream()
    : io_context_()
    , work_guard_(asio::make_work_guard(io_context_))
    , socket_(io_context_)
    , closed_(false)
{
}

TcpStream::~TcpStream() {
    closed_.store(true);
    close_socket();
    work_guard_.reset();
}

std::shared_ptr<TcpStream> TcpStream::connect(
    const std::string& host,
    uint16_t port,
    std::chrono::milliseconds timeout
) {
    auto stream = std::make_shared<TcpStream>();

    asio::error_code ec;
    auto address = asio::ip::make_address(host, ec);
    if (ec) {
        throw NetworkError("TcpStream: invalid address " + host);
    }
    asio::ip::tcp::endpoint endpoint(address, port);

    std::lock_guard<std::mutex> lock(stream->write_mutex_);

    asio::error_code result;
    std::atomic<bool> done(false);
    stream->socket_.async_connect(endpoint, [&](const asio::error_code& error) {
        result = error;
        done.store(true);
    });
    stream->run_until_complete(timeout, done);

    if (result) {
        throw NetworkError("TcpStream: connect to " + host + ":" + std::to_string(port) +
                           " failed: " + result.message());
    }

    stream->socket_.set_option(asio::ip::tcp::no_delay(true), ec);
    stream->remote_address_ = host;
    return stream;
}

void TcpStream::adopt(asio::ip::tcp::socket&& socket) {
    asio::error_code ec;
    auto endpoint = socket.remote_endpoint(ec);
    if (!ec) {
        remote_address_ = endpoint.address().to_string();
    }

    auto protocol = endpoint.protocol();
    auto handle = socket.release(ec);
    if (ec) {
        throw NetworkError("TcpStream: cannot take over accepted socket: " + ec.message());
    }
    socket_.assign(protocol, handle, ec);
    if (ec) {
        throw NetworkError("TcpStream: cannot take over accepted socket: " + ec.message());
    }
    socket_.set_option(asio::ip::tcp::no_delay(true), ec);
}

// ============================================================================
// ByteStream
// ============================================================================

void TcpStream::read_exact(uint8_t* data, size_t size, std::chrono::milliseconds timeout) {
    if (size == 0) {
        return;
    }

    std::lock_guard<std::mutex> lock(read_mutex_);
    if (closed_.load()) {
        throw NetworkError("TcpStream: stream closed");
    }

    asio::error_code result;
    std::atomic<bool> done(false);
    asio::async_read(socket_, asio::buffer(data, size),
        [&](const asio::error_code& error, size_t) {
            result = error;
            done.store(true);
        });
    run_until_complete(timeout, done);

    if (result) {
        if (result == asio::error::eof) {
            throw NetworkError("TcpStream: connection closed by peer");
        }
        throw NetworkError("TcpStream: read failed: " + result.message());
    }
}

void TcpStream::write_all(const uint8_t* data, size_t size, std::chrono::milliseconds timeout) {
    if (size == 0) {
        return;
    }

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (closed_.load()) {
        throw NetworkError("TcpStream: stream closed");
    }

    asio::error_code result;
    std::atomic<bool> done(false);
    asio::async_write(socket_, asio::buffer(data, size),
        [&](const asio::error_code& error, size_t) {
            result = error;
            done.store(true);
        });
    run_until_complete(timeout, done);

    if (result) {
        throw NetworkError("TcpStream: write failed: " + result.message());
    }
}

size_t TcpStream::available() {
    if (closed_.load()) {
        return 0;
    }
    asio::error_code ec;
    size_t bytes = socket_.available(ec);
    return ec ? 0 : bytes;
}

void TcpStream::close() {
    if (closed_.exchange(true)) {
        return;
    }

    // Idle stream: close directly. Otherwise let a thread running the
    // io_context close the socket, which aborts every pending operation.
    std::unique_lock<std::mutex> read_lock(read_mutex_, std::try_to_lock);
    std::unique_lock<std::mutex> write_lock(write_mutex_, std::try_to_lock);
    if (read_lock.owns_lock() && write_lock.owns_lock()) {
        close_socket();
    } else {
        asio::post(io_context_, [this]() { close_socket(); });
    }
}

bool TcpStream::is_open() const {
    return !closed_.load();
}

std::string TcpStream::remote_address() const {
    return remote_address_;
}

// ============================================================================
// Private Methods
// ============================================================================

void TcpStream::run_until_complete(std::chrono::milliseconds timeout, const std::atomic<bool>& done) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!done.load()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        io_context_.run_one_until(std::min(deadline, now + RUN_SLICE));
    }

    if (!done.load()) {
        // The handler references this frame; wait for it to be cancelled
        asio::error_code ec;
        socket_.cancel(ec);
        while (!done.load()) {
            io_context_.run_one_for(RUN_SLICE);
        }
        throw NetworkError("TcpStream: operation timed out");
    }

    if (closed_.load()) {
        throw NetworkError("TcpStream: stream closed");
    }
}

void TcpStream::close_socket() {
    if (!socket_.is_open()) {
        return;
    }
    asio::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

} // namespace lanshare
