/**
 * @file tcp_stream.hpp
 * @brief ByteStream over an asio TCP socket with per-operation timeouts
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#pragma once

#include "lanshare/stream.hpp"
#include <asio.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace lanshare {

/**
 * @brief TcpStream - Blocking TCP stream for one connection
 *
 * Each stream drives its own io_context so that a transfer thread can
 * block on it with a deadline while the node's shared io_context keeps
 * serving discovery and accepts. One read and one write may be in flight
 * at the same time, each on its own calling thread.
 */
class TcpStream : public ByteStream {
public:
    TcpStream();
    ~TcpStream() override;

    // Disable copy and move
    TcpStream(const TcpStream&) = delete;
    TcpStream& operator=(const TcpStream&) = delete;
    TcpStream(TcpStream&&) = delete;
    TcpStream& operator=(TcpStream&&) = delete;

    /**
     * @brief Connect to a remote endpoint
     * @throws NetworkError if the connection is refused or times out
     */
    static std::shared_ptr<TcpStream> connect(
        const std::string& host,
        uint16_t port,
        std::chrono::milliseconds timeout
    );

    /**
     * @brief Take ownership of a socket accepted on another io_context
     * @throws NetworkError if the native handle cannot be transferred
     */
    void adopt(asio::ip::tcp::socket&& socket);

    void read_exact(uint8_t* data, size_t size, std::chrono::milliseconds timeout) override;
    void write_all(const uint8_t* data, size_t size, std::chrono::milliseconds timeout) override;
    size_t available() override;
    void close() override;
    bool is_open() const override;
    std::string remote_address() const override;

private:
    asio::io_context io_context_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    asio::ip::tcp::socket socket_;
    std::atomic<bool> closed_;
    std::string remote_address_;
    std::mutex read_mutex_;   ///< Serializes readers
    std::mutex write_mutex_;  ///< Serializes writers and connect

    /**
     * @brief Run the io_context until done is set or the timeout expires
     *
     * The other direction's thread may run this operation's handler, so
     * the wait is sliced and rechecks done between slices.
     */
    void run_until_complete(std::chrono::milliseconds timeout, const std::atomic<bool>& done);

    void close_socket();
};

} // namespace lanshare
