/**
 * @file transfer_listener.hpp
 * @brief TCP acceptor for the transfer port
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#pragma once

#include "lanshare/tcp_stream.hpp"
#include "lanshare/thread_pool.hpp"
#include <asio.hpp>
#include <atomic>
#include <functional>
#include <memory>

namespace lanshare {

/**
 * @brief Handles one accepted connection on a pool thread
 */
using ConnectionHandler = std::function<void(std::shared_ptr<TcpStream> stream)>;

/**
 * @brief TransferListener - Accepts inbound probe and transfer connections
 *
 * Accepting runs on the node's io_context; each accepted socket moves to
 * its own TcpStream and the handler runs on a bounded worker pool, so a
 * slow handshake never stalls the accept loop.
 */
class TransferListener {
public:
    /**
     * @param io_context io_context driving the acceptor
     * @param port TCP port (0 = ephemeral)
     * @param handler Connection handler
     * @param handler_threads Worker threads for handlers
     * @throws std::invalid_argument if handler is null
     */
    TransferListener(
        asio::io_context& io_context,
        uint16_t port,
        ConnectionHandler handler,
        size_t handler_threads
    );

    ~TransferListener();

    // Disable copy and move
    TransferListener(const TransferListener&) = delete;
    TransferListener& operator=(const TransferListener&) = delete;
    TransferListener(TransferListener&&) = delete;
    TransferListener& operator=(TransferListener&&) = delete;

    /**
     * @brief Bind and start accepting
     * @return false if the port could not be bound
     */
    bool start();

    /**
     * @brief Stop accepting and wait for running handlers (not restartable)
     */
    void stop();

    bool is_running() const;

    /**
     * @brief Bound port (valid after start)
     */
    uint16_t local_port() const;

    uint64_t get_connections_accepted() const;

private:
    asio::io_context& io_context_;
    asio::ip::tcp::acceptor acceptor_;
    uint16_t requested_port_;
    ConnectionHandler handler_;
    ThreadPool pool_;

    std::atomic<bool> running_;
    std::atomic<uint16_t> local_port_;
    std::atomic<uint64_t> connections_accepted_;

    void start_accept();
    void handle_accept(const asio::error_code& error, std::shared_ptr<asio::ip::tcp::socket> socket);
    void close_acceptor();
};

} // namespace lanshare
