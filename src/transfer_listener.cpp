/**
 * @file transfer_listener.cpp
 * @brief Implementation of the transfer port acceptor
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lanshare/transfer_listener.hpp"
#include "lanshare/errors.hpp"
#include "lanshare/utilities.hpp"
#include <future>
#include <stdexcept>

namespace lanshare {

TransferListener::TransferListener(
    asio::io_context& io_context,
    uint16_t port,
    ConnectionHandler handler,
    size_t handler_threads
)
    : io_context_(io_context)
    , acceptor_(io_context)
    , requested_port_(port)
    , handler_(std::move(handler))
    , pool_(handler_threads == 0 ? 1 : handler_threads)
    , running_(false)
    , local_port_(0)
    , connections_accepted_(0)
{
    if (!handler_) {
        throw std::invalid_argument("TransferListener: handler cannot be null");
    }
}

TransferListener::~TransferListener() {
    stop();
}

bool TransferListener::start() {
    if (running_.load()) {
        return true;  // Already running
    }

    try {
        asio::ip::tcp::endpoint endpoint(asio::ip::tcp::v4(), requested_port_);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
        local_port_.store(acceptor_.local_endpoint().port());

        running_.store(true);
        start_accept();

        utilities::log_info("Listener: Accepting on TCP port " + std::to_string(local_port_.load()));
        return true;

    } catch (const std::exception& e) {
        utilities::log_error("Listener: Failed to bind port " + std::to_string(requested_port_) +
                             ": " + std::string(e.what()));
        asio::error_code ec;
        acceptor_.close(ec);
        return false;
    }
}

void TransferListener::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    if (io_context_.stopped()) {
        close_acceptor();
    } else {
        auto closed = std::make_shared<std::promise<void>>();
        auto future = closed->get_future();
        asio::post(io_context_, [this, closed]() {
            close_acceptor();
            closed->set_value();
        });
        if (future.wait_for(std::chrono::seconds(2)) != std::future_status::ready) {
            utilities::log_warn("Listener: io_context did not process shutdown, closing directly");
            close_acceptor();
        }
    }

    // Queued handshakes still run to completion
    pool_.shutdown();
    pool_.wait_for_completion();
    utilities::log_info("Listener: Stopped");
}

bool TransferListener::is_running() const {
    return running_.load();
}

uint16_t TransferListener::local_port() const {
    return local_port_.load();
}

uint64_t TransferListener::get_connections_accepted() const {
    return connections_accepted_.load();
}

// ============================================================================
// Private Methods
// ============================================================================

void TransferListener::start_accept() {
    auto socket = std::make_shared<asio::ip::tcp::socket>(io_context_);

    acceptor_.async_accept(
        *socket,
        [this, socket](const asio::error_code& error) {
            handle_accept(error, socket);
        }
    );
}

void TransferListener::handle_accept(const asio::error_code& error, std::shared_ptr<asio::ip::tcp::socket> socket) {
    if (error == asio::error::operation_aborted || !running_.load()) {
        return;
    }

    if (error) {
        utilities::log_warn("Listener: Accept failed: " + error.message());
    } else {
        connections_accepted_++;
        try {
            auto stream = std::make_shared<TcpStream>();
            stream->adopt(std::move(*socket));

            ConnectionHandler& handler = handler_;
            pool_.enqueue([&handler, stream]() {
                try {
                    handler(stream);
                } catch (const std::exception& e) {
                    utilities::log_error("Listener: Connection handler failed: " + std::string(e.what()));
                    stream->close();
                }
            });
        } catch (const std::exception& e) {
            utilities::log_error("Listener: Cannot dispatch connection: " + std::string(e.what()));
        }
    }

    start_accept();
}

void TransferListener::close_acceptor() {
    asio::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        utilities::log_warn("Listener: Error closing acceptor: " + ec.message());
    }
}

} // namespace lanshare
