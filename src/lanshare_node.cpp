/**
 * @file lanshare_node.cpp
 * @brief Implementation of the node orchestrator
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lanshare/lanshare_node.hpp"
#include "lanshare/errors.hpp"
#include "lanshare/security_config.hpp"
#include "lanshare/tcp_stream.hpp"
#include "lanshare/utilities.hpp"
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iostream>

namespace lanshare {

using namespace lanshare::utilities;

// ============================================================================
// Constructor and Destructor
// ============================================================================

LanshareNode::LanshareNode(NodeConfig config)
    : config_(std::move(config))
    , running_(false)
{
    std::string error;
    if (!config_.validate(&error)) {
        throw std::invalid_argument("Invalid configuration: " + error);
    }
    if (config_.data_dir.empty()) {
        config_.data_dir = security::get_data_directory();
    }
    if (config_.downloads_dir.empty()) {
        config_.downloads_dir = config_.data_dir / "received";
    }
}

LanshareNode::~LanshareNode() {
    if (running_) {
        log_warn("Node: Destructor called while still running, forcing stop");
        stop();
    }
}

// ============================================================================
// Lifecycle Management
// ============================================================================

bool LanshareNode::start() {
    if (running_) {
        log_warn("Node: Already running");
        return false;
    }

    log_info("Node: Starting...");

    try {
        if (!initialize_data_directory()) {
            log_error("Node: Failed to initialize data directory");
            return false;
        }

        if (!initialize_identity()) {
            log_error("Node: Failed to initialize identity");
            return false;
        }

        if (!initialize_subsystems()) {
            log_error("Node: Failed to initialize subsystems");
            shutdown_subsystems();
            return false;
        }

        running_ = true;
        start_time_ = std::chrono::steady_clock::now();

        log_info("Node: Started as " + identity_->get_device_id() + " on port " + std::to_string(get_port()));
        return true;

    } catch (const std::exception& e) {
        log_error("Node: Exception during start: " + std::string(e.what()));
        shutdown_subsystems();
        return false;
    }
}

void LanshareNode::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    log_info("Node: Stopping...");
    shutdown_subsystems();
    log_info("Node: Stopped");
}

bool LanshareNode::is_running() const {
    return running_;
}

std::string LanshareNode::get_device_id() const {
    return identity_ ? identity_->get_device_id() : std::string();
}

uint16_t LanshareNode::get_port() const {
    return listener_ ? listener_->local_port() : 0;
}

uint16_t LanshareNode::get_discovery_port() const {
    return discovery_ ? discovery_->local_port() : 0;
}

// ============================================================================
// Devices
// ============================================================================

std::vector<Device> LanshareNode::list_devices() const {
    return registry_.list_all().to_vector();
}

std::optional<Device> LanshareNode::get_device(const std::string& device_id) const {
    return registry_.get(device_id);
}

std::optional<Device> LanshareNode::add_device(const std::string& address, uint16_t port) {
    if (!running_) {
        return std::nullopt;
    }

    auto ack = TcpProber::exchange(address, port, config_.probe_timeout());
    if (!ack) {
        log_warn("Node: No device answered at " + address + ":" + std::to_string(port));
        return std::nullopt;
    }
    if (ack->device_id == identity_->get_device_id()) {
        log_warn("Node: " + address + ":" + std::to_string(port) + " is this device");
        return std::nullopt;
    }

    Device device;
    device.id = ack->device_id;
    device.display_name = ack->display_name;
    device.address = address;
    device.port = port;
    device.status = DeviceStatus::Online;
    device.last_seen = Clock::now();
    device.trusted = true;
    registry_.upsert(device);

    TrustedDevice record;
    record.device_id = device.id;
    record.display_name = device.display_name;
    record.address = address;
    record.port = port;
    record.trusted = true;
    record.paired_at = to_unix_seconds(device.last_seen);
    record.last_seen = record.paired_at;
    if (!trust_store_->save_device(record)) {
        log_error("Node: Failed to persist device " + device.id);
    }

    log_info("Node: Added device " + device.id + " (" + device.display_name + ") at " +
             address + ":" + std::to_string(port));
    return registry_.get(device.id);
}

bool LanshareNode::trust_device(const std::string& device_id) {
    if (!trust_store_) {
        return false;
    }

    bool found = registry_.update(device_id, [](Device& device) {
        device.trusted = true;
    });
    if (!found) {
        log_warn("Node: Cannot trust unknown device " + device_id);
        return false;
    }

    auto device = registry_.get(device_id);
    if (!device) {
        return false;  // Removed concurrently
    }

    TrustedDevice record;
    record.device_id = device->id;
    record.display_name = device->display_name;
    record.address = device->address;
    record.port = device->port;
    record.trusted = true;
    record.paired_at = to_unix_seconds(Clock::now());
    record.last_seen = to_unix_seconds(device->last_seen);
    if (!trust_store_->save_device(record)) {
        log_error("Node: Failed to persist trust for " + device_id);
        return false;
    }

    log_info("Node: Trusted device " + device_id);
    return true;
}

bool LanshareNode::forget_device(const std::string& device_id) {
    bool removed = registry_.remove(device_id);
    if (trust_store_ && trust_store_->remove_device(device_id)) {
        removed = true;
    }
    if (removed) {
        log_info("Node: Forgot device " + device_id);
    }
    return removed;
}

bool LanshareNode::announce() {
    return discovery_ ? discovery_->announce_presence() : false;
}

void LanshareNode::check_health() {
    if (health_) {
        health_->check_now();
    }
}

// ============================================================================
// Transfers
// ============================================================================

std::string LanshareNode::send(const std::string& peer_id, const std::string& file_path) {
    if (!running_ || !sessions_) {
        throw ResourceError("node is not running");
    }
    return sessions_->start_send(peer_id, file_path);
}

bool LanshareNode::cancel(const std::string& session_id) {
    return sessions_ ? sessions_->cancel(session_id) : false;
}

std::optional<TransferSession> LanshareNode::transfer_status(const std::string& session_id) const {
    if (!sessions_) {
        return std::nullopt;
    }
    return sessions_->status(session_id);
}

std::vector<TransferSession> LanshareNode::list_transfers() const {
    return sessions_ ? sessions_->list_active() : std::vector<TransferSession>();
}

std::vector<TransferSession> LanshareNode::transfer_history() const {
    return sessions_ ? sessions_->list_history() : std::vector<TransferSession>();
}

std::shared_ptr<StatusSubscription> LanshareNode::subscribe_status() {
    return events_.subscribe();
}

void LanshareNode::set_accept_callback(AcceptCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    accept_callback_ = std::move(callback);
}

// ============================================================================
// Shared Folders
// ============================================================================

DirListingMessage LanshareNode::list_remote_dir(const std::string& peer_id, const std::string& path) {
    if (!running_ || !sessions_) {
        throw ResourceError("node is not running");
    }
    auto device = registry_.get(peer_id);
    if (!device) {
        throw NetworkError("unknown device " + peer_id);
    }
    if (device->status != DeviceStatus::Online) {
        throw NetworkError("device " + peer_id + " is " + to_string(device->status));
    }

    const auto timeout = std::chrono::seconds(config_.io_timeout_seconds);
    auto channel = open_channel(*device);
    channel->send(ListDirMessage{path}, timeout);
    ChannelMessage reply = channel->receive(timeout);
    channel->close();

    if (auto* listing = std::get_if<DirListingMessage>(&reply)) {
        return std::move(*listing);
    }
    if (const auto* error = std::get_if<ErrorMessage>(&reply)) {
        throw LanshareError(codec::error_kind_from_reason(error->reason),
                            "listing of '" + path + "' refused by " + peer_id + ": " + error->reason);
    }
    throw ProtocolViolation("unexpected " + codec::message_type_name(reply) + " in answer to listDir");
}

std::string LanshareNode::download(const std::string& peer_id, const std::string& remote_path) {
    if (!running_ || !sessions_) {
        throw ResourceError("node is not running");
    }
    return sessions_->start_download(peer_id, remote_path);
}

// ============================================================================
// Pairing and Status
// ============================================================================

ConnectionInfo LanshareNode::connection_info() const {
    ConnectionInfo info;
    if (identity_) {
        info.device_id = identity_->get_device_id();
        info.display_name = identity_->get_display_name();
    }
    info.addresses = get_local_ip_addresses();
    info.port = get_port();
    info.pairing_code = pairing_code();
    return info;
}

std::string LanshareNode::pairing_code() const {
    auto addresses = get_local_ip_addresses();
    std::string address = addresses.empty() ? "127.0.0.1" : addresses.front();

    std::string digest = sha256_hex(get_device_id() + ":" + address + ":" + std::to_string(get_port()));
    std::string code = to_uppercase(digest.substr(0, 8));
    return code.substr(0, 4) + "-" + code.substr(4, 4);
}

void LanshareNode::print_status() const {
    uint64_t uptime = 0;
    if (running_) {
        uptime = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - start_time_).count());
    }

    size_t online = 0;
    DeviceSnapshot devices = registry_.list_all();
    for (const Device& device : devices) {
        if (device.status == DeviceStatus::Online) {
            online++;
        }
    }

    std::cout << "\n+-----------------------------------------------------------------+\n";
    std::cout << "|                     LanShare Node Status                        |\n";
    std::cout << "+-----------------------------------------------------------------+\n";
    std::cout << "| Device ID:        " << std::left << std::setw(45) << get_device_id() << " |\n";
    std::cout << "| Name:             " << std::left << std::setw(45)
              << (identity_ ? identity_->get_display_name() : "") << " |\n";
    std::cout << "| Port:             " << std::left << std::setw(45) << get_port() << " |\n";
    std::cout << "| Pairing Code:     " << std::left << std::setw(45) << pairing_code() << " |\n";
    std::cout << "| Status:           " << std::left << std::setw(45) << (running_ ? "RUNNING" : "STOPPED") << " |\n";
    std::cout << "| Uptime:           " << std::left << std::setw(45) << format_duration(uptime) << " |\n";
    std::cout << "+-----------------------------------------------------------------+\n";
    std::cout << "| Known Devices:    " << std::left << std::setw(45) << devices.size() << " |\n";
    std::cout << "| Online Devices:   " << std::left << std::setw(45) << online << " |\n";
    std::cout << "| Active Transfers: " << std::left << std::setw(45) << list_transfers().size() << " |\n";
    std::cout << "+-----------------------------------------------------------------+\n\n";
}

// ============================================================================
// Private Methods - Initialization
// ============================================================================

bool LanshareNode::initialize_data_directory() {
    try {
        for (const auto& dir : {config_.data_dir, config_.downloads_dir, config_.data_dir / "db"}) {
            if (!std::filesystem::exists(dir)) {
                std::filesystem::create_directories(dir);
                log_info("Node: Created directory: " + dir.string());
            }
        }
        return true;

    } catch (const std::exception& e) {
        log_error("Node: Failed to initialize data directory: " + std::string(e.what()));
        return false;
    }
}

bool LanshareNode::initialize_identity() {
    try {
        auto identity_file = config_.data_dir / "identity.json";
        std::string name = config_.device_name.empty() ? get_hostname() : config_.device_name;

        auto identity = DeviceIdentity::load(identity_file);
        if (identity) {
            log_info("Node: Loaded existing identity");
            identity_ = std::make_shared<DeviceIdentity>(*identity);

            if (!config_.device_name.empty() && identity_->get_display_name() != config_.device_name) {
                if (identity_->set_display_name(config_.device_name) && !identity_->save(identity_file)) {
                    log_warn("Node: Failed to save renamed identity");
                }
            }
        } else {
            log_info("Node: Creating new identity");
            identity_ = std::make_shared<DeviceIdentity>(DeviceIdentity::generate_device_id(get_hostname()), name);

            if (!identity_->save(identity_file)) {
                log_error("Node: Failed to save identity");
                return false;
            }
            log_info("Node: Saved new identity to " + identity_file.string());
        }

        log_info("Node: Identity initialized for " + identity_->get_device_id());
        return true;

    } catch (const std::exception& e) {
        log_error("Node: Failed to initialize identity: " + std::string(e.what()));
        return false;
    }
}

bool LanshareNode::initialize_subsystems() {
    trust_store_ = std::make_unique<TrustStore>((config_.data_dir / "db" / "trust.db").string());

    EventBus& events = events_;
    registry_.set_event_callback([&events](RegistryEvent event, const Device& device) {
        events.publish_device(event, device);
    });
    load_trusted_devices();

    sessions_ = std::make_unique<SessionManager>(
        registry_,
        [this](const Device& device) { return open_channel(device); },
        transfer_options(),
        events_,
        config_.max_concurrent_per_peer
    );

    io_context_.restart();
    work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
        io_context_.get_executor()
    );

    size_t num_threads = std::thread::hardware_concurrency();
    if (num_threads == 0) num_threads = 2;

    log_info("Node: Starting " + std::to_string(num_threads) + " worker threads");
    for (size_t i = 0; i < num_threads; ++i) {
        worker_threads_.emplace_back([this]() {
            try {
                io_context_.run();
            } catch (const std::exception& e) {
                log_error("Node: Worker thread exception: " + std::string(e.what()));
            }
        });
    }

    // Listener first: discovery advertises the port it actually bound
    listener_ = std::make_unique<TransferListener>(
        io_context_,
        config_.port,
        [this](std::shared_ptr<TcpStream> stream) { handle_connection(std::move(stream)); },
        config_.max_concurrent_handshakes
    );
    if (!listener_->start()) {
        return false;
    }

    if (config_.discovery_enabled) {
        DiscoveryOptions discovery_options;
        discovery_options.listen_port = config_.discovery_port;
        discovery_options.announce_port = config_.discovery_port;
        discovery_options.announce_address = config_.announce_address;
        discovery_options.announce_interval = config_.announce_interval();
        discovery_options.transfer_port = listener_->local_port();

        discovery_ = std::make_unique<DiscoveryService>(identity_, registry_, io_context_, discovery_options);
        if (!discovery_->start()) {
            return false;
        }
    }

    HealthOptions health_options;
    health_options.interval = config_.health_check_interval();
    health_options.max_consecutive_misses = config_.max_consecutive_misses;
    health_options.stale_retention = config_.stale_retention();
    health_options.max_concurrent_probes = config_.max_concurrent_probes;

    health_ = std::make_unique<HealthMonitor>(
        registry_, std::make_shared<TcpProber>(config_.probe_timeout()), health_options);
    return health_->start();
}

void LanshareNode::load_trusted_devices() {
    auto trusted = trust_store_->list_trusted();
    for (const TrustedDevice& record : trusted) {
        Device device;
        device.id = record.device_id;
        device.display_name = record.display_name;
        device.address = record.address;
        device.port = record.port;
        device.status = DeviceStatus::Unknown;
        device.last_seen = from_unix_seconds(record.last_seen);
        device.trusted = true;
        registry_.upsert(device);
    }
    if (!trusted.empty()) {
        log_info("Node: Loaded " + std::to_string(trusted.size()) + " trusted devices");
    }
}

void LanshareNode::shutdown_subsystems() {
    if (health_) {
        health_->stop();
    }
    if (discovery_) {
        discovery_->stop();
    }
    if (listener_) {
        listener_->stop();
    }
    if (sessions_) {
        sessions_->shutdown();
    }
    events_.close_all();

    work_guard_.reset();
    io_context_.stop();
    for (auto& thread : worker_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    worker_threads_.clear();

    registry_.set_event_callback(nullptr);
    health_.reset();
    discovery_.reset();
    listener_.reset();
    sessions_.reset();
    trust_store_.reset();
}

// ============================================================================
// Private Methods - Connections
// ============================================================================

void LanshareNode::handle_connection(std::shared_ptr<TcpStream> stream) {
    const auto timeout = std::chrono::seconds(config_.io_timeout_seconds);
    std::string remote = stream->remote_address();

    try {
        Frame frame = codec::read_frame(*stream, timeout);

        switch (frame.kind) {
            case FrameKind::Probe: {
                ProbeAckMessage ack;
                ack.device_id = identity_->get_device_id();
                ack.display_name = identity_->get_display_name();
                codec::write_frame(*stream, FrameKind::ProbeAck, ack.to_bytes(), timeout);
                stream->close();
                return;
            }

            case FrameKind::Hello: {
                auto channel = SecureChannel::accept(stream, frame, *identity_, *trust_store_, timeout);
                std::string peer_id = channel->peer().device_id;

                // A completed handshake is as good as a probe
                registry_.update(peer_id, [](Device& device) {
                    device.status = DeviceStatus::Online;
                    device.consecutive_misses = 0;
                    device.last_seen = Clock::now();
                });

                // The first message says what the peer wants
                ChannelMessage request = channel->receive(std::chrono::seconds(config_.negotiation_timeout_seconds));
                if (const auto* header = std::get_if<HeaderMessage>(&request)) {
                    sessions_->accept_incoming(std::move(channel),
                        [this](const std::string& peer, const HeaderMessage& offer) {
                            return accept_offer(peer, offer);
                        },
                        *header);
                } else if (const auto* listing = std::get_if<ListDirMessage>(&request)) {
                    serve_listing(*channel, peer_id, *listing);
                    channel->close();
                } else if (const auto* pull = std::get_if<DownloadMessage>(&request)) {
                    serve_download(std::move(channel), peer_id, *pull);
                } else if (std::holds_alternative<CancelMessage>(request)) {
                    channel->close();
                } else {
                    throw ProtocolViolation("unexpected " + codec::message_type_name(request) + " on new channel");
                }
                return;
            }

            default:
                throw ProtocolViolation("unexpected " + std::to_string(static_cast<int>(frame.kind)) +
                                        " frame on new connection");
        }

    } catch (const AuthenticationError& e) {
        log_error("Node: Authentication failed for connection from " + remote +
                  " (possible impersonation): " + std::string(e.what()));
    } catch (const LanshareError& e) {
        log_warn("Node: Connection from " + remote + " failed (" + std::string(to_string(e.kind())) +
                 "): " + std::string(e.what()));
    }
    stream->close();
}

bool LanshareNode::accept_offer(const std::string& peer_id, const HeaderMessage& header) {
    if (config_.auto_accept) {
        return true;
    }

    AcceptCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = accept_callback_;
    }
    if (!callback) {
        log_info("Node: Declining " + header.file_name + " from " + peer_id + ", no consent handler");
        return false;
    }
    return callback(peer_id, header);
}

// ============================================================================
// Private Methods - Shared Folders
// ============================================================================

bool LanshareNode::may_browse(const std::string& peer_id) const {
    if (config_.shared_dir.empty()) {
        return false;
    }
    auto device = registry_.get(peer_id);
    return device && device->trusted;
}

std::optional<std::filesystem::path> LanshareNode::resolve_shared(const std::string& relative) const {
    if (config_.shared_dir.empty()) {
        return std::nullopt;
    }

    std::filesystem::path requested(relative);
    if (requested.has_root_name() || requested.has_root_directory()) {
        return std::nullopt;
    }

    std::filesystem::path candidate = config_.shared_dir / requested;
    std::error_code ec;
    auto canonical_root = std::filesystem::weakly_canonical(config_.shared_dir, ec);
    if (ec) {
        return std::nullopt;
    }
    auto canonical_candidate = std::filesystem::weakly_canonical(candidate, ec);
    if (ec) {
        return std::nullopt;
    }
    if (canonical_candidate == canonical_root) {
        return config_.shared_dir;
    }
    if (!security::is_safe_path(candidate, config_.shared_dir)) {
        return std::nullopt;
    }
    return candidate;
}

void LanshareNode::serve_listing(SecureChannel& channel, const std::string& peer_id, const ListDirMessage& request) {
    const auto timeout = std::chrono::seconds(config_.io_timeout_seconds);

    if (!may_browse(peer_id)) {
        log_warn("Node: Refusing directory listing for " + peer_id + ", folder not shared with it");
        channel.send(ErrorMessage{codec::ERROR_FORBIDDEN}, timeout);
        return;
    }

    std::error_code ec;
    auto dir = resolve_shared(request.path);
    if (!dir || !std::filesystem::is_directory(*dir, ec)) {
        channel.send(ErrorMessage{codec::ERROR_NOT_FOUND}, timeout);
        return;
    }

    DirListingMessage listing;
    listing.path = request.path;

    std::filesystem::directory_iterator it(*dir, std::filesystem::directory_options::skip_permission_denied, ec);
    for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        const std::filesystem::directory_entry& item = *it;

        // Links that lead out of the shared folder are not listed
        if (!security::is_safe_path(item.path(), config_.shared_dir)) {
            continue;
        }

        std::error_code item_ec;
        DirEntry entry;
        entry.name = item.path().filename().string();
        entry.is_dir = item.is_directory(item_ec);
        if (!entry.is_dir) {
            if (!item.is_regular_file(item_ec)) {
                continue;
            }
            entry.size = item.file_size(item_ec);
            if (item_ec) {
                continue;
            }
        }
        listing.entries.push_back(std::move(entry));
    }
    if (ec) {
        log_warn("Node: Cannot list " + dir->string() + ": " + ec.message());
        channel.send(ErrorMessage{codec::ERROR_RESOURCE}, timeout);
        return;
    }

    std::sort(listing.entries.begin(), listing.entries.end(),
              [](const DirEntry& a, const DirEntry& b) { return a.name < b.name; });
    if (listing.entries.size() > security::MAX_LISTING_ENTRIES) {
        listing.entries.resize(security::MAX_LISTING_ENTRIES);
        listing.truncated = true;
    }
    while (!listing.entries.empty() && codec::encode_message(listing).size() > security::MAX_JSON_SIZE) {
        listing.entries.resize(listing.entries.size() * 3 / 4);
        listing.truncated = true;
    }

    channel.send(listing, timeout);
    log_info("Node: Listed '" + request.path + "' (" + std::to_string(listing.entries.size()) +
             " entries) for " + peer_id);
}

void LanshareNode::serve_download(std::unique_ptr<SecureChannel> channel, const std::string& peer_id,
                                  const DownloadMessage& request) {
    const char* refusal = nullptr;
    std::optional<std::filesystem::path> file;

    if (!may_browse(peer_id)) {
        refusal = codec::ERROR_FORBIDDEN;
    } else {
        std::error_code ec;
        file = resolve_shared(request.path);
        if (!file || !std::filesystem::is_regular_file(*file, ec)) {
            refusal = codec::ERROR_NOT_FOUND;
        }
    }

    if (refusal) {
        log_warn("Node: Refusing download of '" + request.path + "' by " + peer_id + " (" + refusal + ")");
        channel->send(ErrorMessage{refusal}, std::chrono::seconds(config_.io_timeout_seconds));
        channel->close();
        return;
    }

    sessions_->serve_download(std::move(channel), *file);
}

std::unique_ptr<SecureChannel> LanshareNode::open_channel(const Device& device) {
    auto stream = TcpStream::connect(device.address, device.port,
                                     std::chrono::duration_cast<std::chrono::milliseconds>(security::CONNECTION_TIMEOUT));
    return SecureChannel::initiate(stream, *identity_, *trust_store_, device.id,
                                   std::chrono::seconds(config_.io_timeout_seconds));
}

TransferOptions LanshareNode::transfer_options() const {
    TransferOptions options;
    options.chunk_size = config_.chunk_size;
    options.negotiation_timeout = std::chrono::seconds(config_.negotiation_timeout_seconds);
    options.verification_timeout = std::chrono::seconds(config_.verification_timeout_seconds);
    options.io_timeout = std::chrono::seconds(config_.io_timeout_seconds);
    options.precompute_digest = true;
    options.downloads_dir = config_.downloads_dir;
    return options;
}

} // namespace lanshare
