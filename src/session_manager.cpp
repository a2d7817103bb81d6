/**
 * @file session_manager.cpp
 * @brief Implementation of the transfer session registry
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lanshare/session_manager.hpp"
#include "lanshare/errors.hpp"
#include "lanshare/security_config.hpp"
#include "lanshare/utilities.hpp"
#include <system_error>

namespace lanshare {

// ============================================================================
// Constructor / Destructor
// ============================================================================

SessionManager::SessionManager(
    DeviceRegistry& registry,
    ChannelFactory channel_factory,
    TransferOptions options,
    EventBus& events,
    uint32_t max_per_peer
)
    : registry_(registry)
    , channel_factory_(std::move(channel_factory))
    , options_(std::move(options))
    , events_(events)
    , max_per_peer_(max_per_peer == 0 ? 1 : max_per_peer)
    , shut_down_(false)
{
    if (!channel_factory_) {
        throw std::invalid_argument("SessionManager: channel factory cannot be null");
    }
}

SessionManager::~SessionManager() {
    shutdown();
}

// ============================================================================
// Starting Sessions
// ============================================================================

std::string SessionManager::start_send(const std::string& peer_id, const std::filesystem::path& file_path) {
    if (shut_down_.load()) {
        throw ResourceError("session manager is shut down");
    }
    reap();

    Device device = require_online(peer_id);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(file_path, ec)) {
        throw ResourceError("not a readable file: " + file_path.string());
    }
    uint64_t file_size = std::filesystem::file_size(file_path, ec);
    if (ec) {
        throw ResourceError("cannot stat " + file_path.string() + ": " + ec.message());
    }

    auto entry = std::make_shared<ActiveSession>();
    entry->session_id = utilities::generate_uuid();
    entry->peer_id = peer_id;
    entry->pending.session_id = entry->session_id;
    entry->pending.direction = TransferDirection::Send;
    entry->pending.peer_id = peer_id;
    entry->pending.file_name = file_path.filename().string();
    entry->pending.file_size = file_size;
    entry->pending.chunk_size = options_.chunk_size;
    entry->pending.local_path = file_path;
    entry->pending.started_at = Clock::now();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_count_locked(peer_id) >= max_per_peer_) {
            throw ResourceError("too many concurrent transfers with " + peer_id);
        }
        active_[entry->session_id] = entry;
        // Published before the worker exists so it precedes every engine event
        events_.publish_transfer(StatusEventType::TransferStarted, entry->pending);
        // Started under the lock so finish() always sees the handle
        entry->worker = std::thread(&SessionManager::run_send, this, entry, device, file_path);
    }

    utilities::log_info("Sessions: Started send " + entry->session_id + " of " +
                        file_path.string() + " to " + peer_id);
    return entry->session_id;
}

std::string SessionManager::accept_incoming(
    std::unique_ptr<SecureChannel> channel,
    AcceptCallback accept_callback,
    std::optional<HeaderMessage> offer
) {
    if (!channel) {
        throw std::invalid_argument("SessionManager: channel cannot be null");
    }
    if (shut_down_.load()) {
        channel->close();
        throw ResourceError("session manager is shut down");
    }
    reap();

    auto entry = std::make_shared<ActiveSession>();
    entry->session_id = utilities::generate_uuid();
    entry->peer_id = channel->peer().device_id;

    // Decided under the same lock that inserts the session; the engine
    // consults the flag only once its worker runs
    auto over_limit = std::make_shared<std::atomic<bool>>(false);
    AcceptCallback gated = [over_limit, callback = std::move(accept_callback)](
                               const std::string& peer_id, const HeaderMessage& header) {
        if (over_limit->load()) {
            return false;
        }
        return !callback || callback(peer_id, header);
    };

    std::shared_ptr<TransferEngine> engine = TransferEngine::create_receiver(
        entry->session_id, std::move(channel), options_, std::move(gated), std::move(offer));
    entry->pending = engine->snapshot();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_count_locked(entry->peer_id) >= max_per_peer_) {
            utilities::log_warn("Sessions: Declining offer from " + entry->peer_id +
                                ", concurrent transfer limit reached");
            over_limit->store(true);
        }
        active_[entry->session_id] = entry;
        events_.publish_transfer(StatusEventType::TransferStarted, entry->pending);
        attach(entry, engine);
        entry->worker = std::thread(&SessionManager::run_receive, this, entry);
    }

    utilities::log_info("Sessions: Accepted connection " + entry->session_id + " from " + entry->peer_id);
    return entry->session_id;
}

std::string SessionManager::start_download(const std::string& peer_id, const std::string& remote_path) {
    if (shut_down_.load()) {
        throw ResourceError("session manager is shut down");
    }
    reap();

    Device device = require_online(peer_id);

    auto entry = std::make_shared<ActiveSession>();
    entry->session_id = utilities::generate_uuid();
    entry->peer_id = peer_id;
    entry->pending.session_id = entry->session_id;
    entry->pending.direction = TransferDirection::Receive;
    entry->pending.peer_id = peer_id;
    entry->pending.file_name = security::sanitize_filename(remote_path);
    entry->pending.started_at = Clock::now();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_count_locked(peer_id) >= max_per_peer_) {
            throw ResourceError("too many concurrent transfers with " + peer_id);
        }
        active_[entry->session_id] = entry;
        events_.publish_transfer(StatusEventType::TransferStarted, entry->pending);
        entry->worker = std::thread(&SessionManager::run_download, this, entry, device, remote_path);
    }

    utilities::log_info("Sessions: Started download " + entry->session_id + " of " +
                        remote_path + " from " + peer_id);
    return entry->session_id;
}

std::string SessionManager::serve_download(std::unique_ptr<SecureChannel> channel, const std::filesystem::path& file_path) {
    if (!channel) {
        throw std::invalid_argument("SessionManager: channel cannot be null");
    }
    if (shut_down_.load()) {
        channel->close();
        throw ResourceError("session manager is shut down");
    }
    reap();

    std::error_code ec;
    uint64_t file_size = std::filesystem::file_size(file_path, ec);

    auto entry = std::make_shared<ActiveSession>();
    entry->session_id = utilities::generate_uuid();
    entry->peer_id = channel->peer().device_id;
    entry->pending.session_id = entry->session_id;
    entry->pending.direction = TransferDirection::Send;
    entry->pending.peer_id = entry->peer_id;
    entry->pending.file_name = file_path.filename().string();
    entry->pending.file_size = ec ? 0 : file_size;
    entry->pending.chunk_size = options_.chunk_size;
    entry->pending.local_path = file_path;
    entry->pending.started_at = Clock::now();

    bool over_limit = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_count_locked(entry->peer_id) >= max_per_peer_) {
            over_limit = true;
        } else {
            active_[entry->session_id] = entry;
            events_.publish_transfer(StatusEventType::TransferStarted, entry->pending);
            entry->worker = std::thread(&SessionManager::run_serve, this, entry, std::move(channel), file_path);
        }
    }

    if (over_limit) {
        utilities::log_warn("Sessions: Refusing download by " + entry->peer_id +
                            ", concurrent transfer limit reached");
        try {
            channel->send(ErrorMessage{codec::ERROR_RESOURCE}, options_.io_timeout);
        } catch (const LanshareError& e) {
            utilities::log_debug("Sessions: Refusal not delivered: " + std::string(e.what()));
        }
        channel->close();
        throw ResourceError("too many concurrent transfers with " + entry->peer_id);
    }

    utilities::log_info("Sessions: Serving " + file_path.string() + " to " + entry->peer_id +
                        " as " + entry->session_id);
    return entry->session_id;
}

// ============================================================================
// Control and Status
// ============================================================================

bool SessionManager::cancel(const std::string& session_id) {
    std::shared_ptr<TransferEngine> engine;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(session_id);
        if (it == active_.end()) {
            return false;
        }
        it->second->cancel_requested = true;
        engine = it->second->engine;
    }

    // Without an engine the session is still dialing; attach() cancels it
    if (engine) {
        engine->cancel();
    }
    utilities::log_info("Sessions: Cancel requested for " + session_id);
    return true;
}

std::optional<TransferSession> SessionManager::status(const std::string& session_id) const {
    std::shared_ptr<TransferEngine> engine;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(session_id);
        if (it != active_.end()) {
            if (!it->second->engine) {
                return it->second->pending;
            }
            engine = it->second->engine;
        } else {
            for (auto record = history_.rbegin(); record != history_.rend(); ++record) {
                if (record->session_id == session_id) {
                    return *record;
                }
            }
            return std::nullopt;
        }
    }
    return engine->snapshot();
}

std::vector<TransferSession> SessionManager::list_active() const {
    std::vector<std::shared_ptr<ActiveSession>> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, entry] : active_) {
            entries.push_back(entry);
        }
    }

    std::vector<TransferSession> sessions;
    for (const auto& entry : entries) {
        std::shared_ptr<TransferEngine> engine;
        TransferSession record;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            engine = entry->engine;
            record = entry->pending;
        }
        if (engine) {
            record = engine->snapshot();
        }
        if (!is_terminal(record.state)) {
            sessions.push_back(std::move(record));
        }
    }
    return sessions;
}

std::vector<TransferSession> SessionManager::list_history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<TransferSession>(history_.begin(), history_.end());
}

size_t SessionManager::active_count(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_count_locked(peer_id);
}

void SessionManager::shutdown() {
    if (shut_down_.exchange(true)) {
        reap();
        return;
    }

    std::vector<std::shared_ptr<TransferEngine>> engines;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, entry] : active_) {
            entry->cancel_requested = true;
            if (entry->engine) {
                engines.push_back(entry->engine);
            }
        }
    }
    for (const auto& engine : engines) {
        engine->cancel();
    }

    {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_cv_.wait(lock, [this]() { return active_.empty(); });
    }
    reap();

    utilities::log_info("Sessions: Shut down");
}

// ============================================================================
// Session Threads
// ============================================================================

void SessionManager::run_send(std::shared_ptr<ActiveSession> entry, Device device, std::filesystem::path file_path) {
    std::unique_ptr<SecureChannel> channel = dial(entry, device);
    if (!channel) {
        return;
    }
    run_engine(entry, TransferEngine::create_sender(entry->session_id, std::move(channel), file_path, options_));
}

void SessionManager::run_receive(std::shared_ptr<ActiveSession> entry) {
    std::shared_ptr<TransferEngine> engine;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        engine = entry->engine;
    }

    TransferSession result = engine->run();
    finish(entry, result, false);
}

void SessionManager::run_download(std::shared_ptr<ActiveSession> entry, Device device, std::string remote_path) {
    std::unique_ptr<SecureChannel> channel = dial(entry, device);
    if (!channel) {
        return;
    }

    try {
        channel->send(DownloadMessage{remote_path}, options_.io_timeout);
    } catch (const LanshareError& e) {
        channel->close();
        fail(entry, e.kind(), e.what());
        return;
    }

    run_engine(entry, TransferEngine::create_receiver(entry->session_id, std::move(channel), options_, nullptr));
}

void SessionManager::run_serve(std::shared_ptr<ActiveSession> entry, std::unique_ptr<SecureChannel> channel,
                               std::filesystem::path file_path) {
    run_engine(entry, TransferEngine::create_sender(entry->session_id, std::move(channel), file_path, options_));
}

// ============================================================================
// Private Methods
// ============================================================================

Device SessionManager::require_online(const std::string& peer_id) const {
    // Fail fast instead of dialing a device that is known to be away
    auto device = registry_.get(peer_id);
    if (!device) {
        throw NetworkError("unknown device " + peer_id);
    }
    if (device->status != DeviceStatus::Online) {
        throw NetworkError("device " + peer_id + " is " + to_string(device->status));
    }
    return *device;
}

std::unique_ptr<SecureChannel> SessionManager::dial(const std::shared_ptr<ActiveSession>& entry, const Device& device) {
    std::unique_ptr<SecureChannel> channel;
    try {
        channel = channel_factory_(device);
    } catch (const LanshareError& e) {
        fail(entry, e.kind(), e.what());
        return nullptr;
    } catch (const std::exception& e) {
        fail(entry, ErrorKind::Network, e.what());
        return nullptr;
    }

    if (!channel) {
        fail(entry, ErrorKind::Network, "no channel to " + device.id);
    }
    return channel;
}

void SessionManager::fail(const std::shared_ptr<ActiveSession>& entry, ErrorKind kind, const std::string& reason) {
    TransferSession failed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failed = entry->pending;
    }
    failed.state = TransferState::Aborted;
    failed.error = kind;
    failed.reason = reason;
    failed.finished_at = Clock::now();
    utilities::log_error("Sessions: Session " + entry->session_id + " with " + entry->peer_id + " failed (" +
                         std::string(to_string(kind)) + "): " + reason);
    finish(entry, failed, true);
}

void SessionManager::run_engine(const std::shared_ptr<ActiveSession>& entry, std::shared_ptr<TransferEngine> engine) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        attach(entry, engine);
    }

    TransferSession result = engine->run();
    finish(entry, result, false);
}

void SessionManager::attach(const std::shared_ptr<ActiveSession>& entry, const std::shared_ptr<TransferEngine>& engine) {
    EventBus& events = events_;
    engine->set_observer([&events](const TransferSession& session) {
        StatusEventType type = StatusEventType::TransferProgress;
        if (session.state == TransferState::Completed) {
            type = StatusEventType::TransferCompleted;
        } else if (session.state == TransferState::Aborted) {
            type = StatusEventType::TransferAborted;
        }
        events.publish_transfer(type, session);
    });

    entry->engine = engine;
    if (entry->cancel_requested) {
        engine->cancel();
    }
}

void SessionManager::finish(const std::shared_ptr<ActiveSession>& entry, const TransferSession& result, bool publish) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        history_.push_back(result);
        while (history_.size() > security::TERMINAL_HISTORY_LIMIT) {
            history_.pop_front();
        }
        finished_workers_.push_back(std::move(entry->worker));
        active_.erase(entry->session_id);
    }
    idle_cv_.notify_all();

    if (publish) {
        events_.publish_transfer(StatusEventType::TransferAborted, result);
    }
}

size_t SessionManager::active_count_locked(const std::string& peer_id) const {
    size_t count = 0;
    for (const auto& [id, entry] : active_) {
        if (entry->peer_id == peer_id) {
            count++;
        }
    }
    return count;
}

void SessionManager::reap() {
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        workers.swap(finished_workers_);
    }

    for (auto& worker : workers) {
        if (!worker.joinable()) {
            continue;
        }
        if (worker.get_id() == std::this_thread::get_id()) {
            // Reached from a callback on the finishing session's own thread
            worker.detach();
        } else {
            worker.join();
        }
    }
}

} // namespace lanshare
