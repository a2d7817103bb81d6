/**
 * @file transfer_engine.cpp
 * @brief Implementation of the transfer state machines
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lanshare/transfer_engine.hpp"
#include "lanshare/utilities.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <set>
#include <vector>

namespace lanshare {

namespace {

/// Timeout for the best-effort cancel notice sent from cancel()
constexpr auto CANCEL_NOTICE_TIMEOUT = std::chrono::seconds(1);

// Reject reason codes carried in headerAck
constexpr const char* REJECT_INVALID_NAME = "invalid-file-name";
constexpr const char* REJECT_UNSUPPORTED_DIGEST = "unsupported-digest";
constexpr const char* REJECT_INVALID_CHUNK_SIZE = "invalid-chunk-size";
constexpr const char* REJECT_TOO_LARGE = "file-too-large";
constexpr const char* REJECT_NO_SPACE = "insufficient-space";
constexpr const char* REJECT_WRITE_FAILED = "write-failed";
constexpr const char* REJECT_DECLINED = "declined";

bool is_sha256_hex(const std::string& digest) {
    return digest.size() == 64 &&
           std::all_of(digest.begin(), digest.end(), [](unsigned char c) { return std::isxdigit(c) != 0; });
}

uint64_t chunk_count(uint64_t file_size, uint32_t chunk_size) {
    return file_size / chunk_size + (file_size % chunk_size != 0 ? 1 : 0);
}

uint32_t chunk_length(uint64_t index, uint64_t file_size, uint32_t chunk_size) {
    uint64_t offset = index * chunk_size;
    return static_cast<uint32_t>(std::min<uint64_t>(chunk_size, file_size - offset));
}

/**
 * @brief First free name: "name", then "stem_1.ext", "stem_2.ext", ...
 */
std::filesystem::path unique_destination(const std::filesystem::path& dir, const std::string& name) {
    std::filesystem::path candidate = dir / name;
    if (!std::filesystem::exists(candidate)) {
        return candidate;
    }

    std::filesystem::path base(name);
    std::string stem = base.stem().string();
    std::string extension = base.extension().string();

    for (uint32_t n = 1; ; ++n) {
        candidate = dir / (stem + "_" + std::to_string(n) + extension);
        if (!std::filesystem::exists(candidate)) {
            return candidate;
        }
    }
}

} // namespace

std::string to_string(TransferDirection direction) {
    return direction == TransferDirection::Send ? "Send" : "Receive";
}

std::string to_string(TransferState state) {
    switch (state) {
        case TransferState::Negotiating:  return "Negotiating";
        case TransferState::Transferring: return "Transferring";
        case TransferState::Verifying:    return "Verifying";
        case TransferState::Completed:    return "Completed";
        case TransferState::Aborted:      return "Aborted";
    }
    return "Unknown";
}

// ============================================================================
// Construction
// ============================================================================

TransferEngine::TransferEngine(
    const std::string& session_id,
    TransferDirection direction,
    std::unique_ptr<SecureChannel> channel,
    TransferOptions options
)
    : channel_(std::move(channel))
    , options_(std::move(options))
    , session_id_(session_id)
    , cancelled_(false)
    , peer_terminated_(false)
{
    if (!channel_) {
        throw std::invalid_argument("TransferEngine: channel cannot be null");
    }

    session_.session_id = session_id;
    session_.direction = direction;
    session_.peer_id = channel_->peer().device_id;
    session_.chunk_size = options_.chunk_size;
    session_.started_at = Clock::now();
}

std::unique_ptr<TransferEngine> TransferEngine::create_sender(
    const std::string& session_id,
    std::unique_ptr<SecureChannel> channel,
    const std::filesystem::path& source,
    TransferOptions options
) {
    std::unique_ptr<TransferEngine> engine(new TransferEngine(
        session_id, TransferDirection::Send, std::move(channel), std::move(options)));
    engine->session_.local_path = source;
    engine->session_.file_name = source.filename().string();
    return engine;
}

std::unique_ptr<TransferEngine> TransferEngine::create_receiver(
    const std::string& session_id,
    std::unique_ptr<SecureChannel> channel,
    TransferOptions options,
    AcceptCallback accept_callback,
    std::optional<HeaderMessage> offer
) {
    std::unique_ptr<TransferEngine> engine(new TransferEngine(
        session_id, TransferDirection::Receive, std::move(channel), std::move(options)));
    engine->accept_callback_ = std::move(accept_callback);
    engine->offer_ = std::move(offer);
    return engine;
}

TransferEngine::~TransferEngine() {
    discard_partial_output();
}

// ============================================================================
// Public Interface
// ============================================================================

TransferSession TransferEngine::run() {
    try {
        check_cancelled();

        if (session_.direction == TransferDirection::Send) {
            run_sender();
        } else {
            run_receiver();
        }

    } catch (const LanshareError& e) {
        if (cancelled_.load()) {
            abort(ErrorKind::Cancelled, "cancelled");
        } else {
            abort(e.kind(), e.what());
        }
    } catch (const std::filesystem::filesystem_error& e) {
        abort(ErrorKind::Resource, e.what());
    } catch (const std::bad_alloc&) {
        abort(ErrorKind::Resource, "out of memory");
    }

    return snapshot();
}

void TransferEngine::cancel() {
    if (cancelled_.exchange(true)) {
        return;
    }
    if (is_terminal(snapshot().state)) {
        return;
    }

    utilities::log_info("Transfer: Cancelling session " + session_id_);

    // Tell the peer when the channel is idle; a send in progress is cut
    // short by closing the stream instead
    if (channel_->is_open()) {
        try {
            channel_->try_send(CancelMessage{}, CANCEL_NOTICE_TIMEOUT);
        } catch (const LanshareError& e) {
            utilities::log_debug("Transfer: Cancel notice not delivered: " + std::string(e.what()));
        }
    }
    channel_->close();
}

TransferSession TransferEngine::snapshot() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return session_;
}

void TransferEngine::set_observer(TransferObserver observer) {
    std::lock_guard<std::mutex> lock(observer_mutex_);
    observer_ = std::move(observer);
}

const std::string& TransferEngine::session_id() const {
    return session_id_;
}

// ============================================================================
// Sender
// ============================================================================

void TransferEngine::run_sender() {
    const std::filesystem::path source = session_.local_path;
    const uint32_t chunk_size = options_.chunk_size;

    std::ifstream input(source, std::ios::binary);
    if (!input) {
        throw ResourceError("cannot open " + source.string());
    }
    const uint64_t file_size = std::filesystem::file_size(source);

    const uint64_t total = chunk_count(file_size, chunk_size);
    if (total > std::numeric_limits<uint32_t>::max()) {
        throw ResourceError("file too large for chunk size " + std::to_string(chunk_size));
    }

    std::optional<std::string> digest;
    if (options_.precompute_digest) {
        digest = utilities::calculate_file_hash(source.string());
        if (!digest) {
            throw ResourceError("cannot read " + source.string());
        }
    }

    update([&](TransferSession& s) {
        s.file_size = file_size;
        s.chunk_size = chunk_size;
        s.integrity_digest = digest.value_or("");
    });

    // ---- Negotiating ----
    HeaderMessage header;
    header.file_name = session_.file_name;
    header.file_size = file_size;
    header.chunk_size = chunk_size;
    header.digest_algorithm = security::DIGEST_ALGORITHM;
    header.digest = digest;
    channel_->send(header, options_.io_timeout);

    auto negotiation_deadline = std::chrono::steady_clock::now() + options_.negotiation_timeout;
    ChannelMessage reply = channel_->receive(remaining_until(negotiation_deadline));
    const auto* ack = std::get_if<HeaderAckMessage>(&reply);
    if (!ack) {
        unexpected(reply, "negotiation");
    }
    if (!ack->accept) {
        throw RejectedError(ack->reason.value_or("rejected"));
    }

    set_state(TransferState::Transferring);
    utilities::log_info("Transfer: Sending " + header.file_name + " (" +
                        utilities::format_file_size(file_size) + ") to " + session_.peer_id);

    // ---- Transferring / Verifying ----
    utilities::Sha256 hasher;
    uint64_t hashed = 0;        // Chunks folded into the running digest
    uint64_t sent = 0;          // Highest chunk index sent + 1
    uint64_t next = 0;
    std::set<uint32_t> retransmitted;
    std::vector<uint8_t> buffer;
    bool complete_sent = false;
    std::chrono::steady_clock::time_point verify_deadline;

    auto rewind = [&](const RetransmitMessage& request) {
        if (request.index >= sent || retransmitted.count(request.index) > 0) {
            throw ProtocolViolation("invalid retransmit request for chunk " + std::to_string(request.index));
        }
        retransmitted.insert(request.index);
        next = request.index;
        update([](TransferSession& s) { s.retransmits++; });
        utilities::log_warn("Transfer: Peer requested retransmission of chunk " +
                            std::to_string(request.index) + " in session " + session_id_);
    };

    while (true) {
        check_cancelled();

        if (next < total) {
            while (auto control = channel_->poll(options_.io_timeout)) {
                if (const auto* request = std::get_if<RetransmitMessage>(&*control)) {
                    rewind(*request);
                } else {
                    unexpected(*control, "transfer");
                }
            }

            uint32_t length = chunk_length(next, file_size, chunk_size);
            buffer.resize(length);
            input.clear();
            input.seekg(static_cast<std::streamoff>(next * chunk_size));
            input.read(reinterpret_cast<char*>(buffer.data()), length);
            if (static_cast<uint64_t>(input.gcount()) != length) {
                throw ResourceError("short read from " + source.string());
            }

            if (!digest && next == hashed) {
                hasher.update(buffer.data(), buffer.size());
                hashed++;
            }

            channel_->send(codec::make_chunk(static_cast<uint32_t>(next), buffer), options_.io_timeout);

            uint64_t reached = next * chunk_size + length;
            update([reached](TransferSession& s) {
                s.bytes_transferred = std::max(s.bytes_transferred, reached);
                s.chunks_transferred++;
            });

            next++;
            sent = std::max(sent, next);
            continue;
        }

        if (!complete_sent) {
            if (!digest) {
                auto computed = hasher.finalize_hex();
                if (!computed) {
                    throw ResourceError("digest computation failed");
                }
                digest = computed;
                options_.precompute_digest = false;
                update([&](TransferSession& s) { s.integrity_digest = *computed; });
            }
            if (session_.state != TransferState::Verifying) {
                set_state(TransferState::Verifying);
                verify_deadline = std::chrono::steady_clock::now() + options_.verification_timeout;
            }

            CompleteMessage complete;
            if (!header.digest) {
                complete.digest = digest;
            }
            channel_->send(complete, options_.io_timeout);
            complete_sent = true;
        }

        ChannelMessage message = channel_->receive(remaining_until(verify_deadline));
        if (std::holds_alternative<CompleteMessage>(message)) {
            break;
        }
        if (const auto* request = std::get_if<RetransmitMessage>(&message)) {
            rewind(*request);
            complete_sent = false;
            continue;
        }
        unexpected(message, "verification");
    }

    channel_->close();
    set_state(TransferState::Completed);
    utilities::log_info("Transfer: Sent " + header.file_name + " to " + session_.peer_id);
}

// ============================================================================
// Receiver
// ============================================================================

void TransferEngine::run_receiver() {
    // ---- Negotiating ----
    if (!offer_) {
        auto negotiation_deadline = std::chrono::steady_clock::now() + options_.negotiation_timeout;
        ChannelMessage offer = channel_->receive(remaining_until(negotiation_deadline));
        const auto* header_ptr = std::get_if<HeaderMessage>(&offer);
        if (!header_ptr) {
            unexpected(offer, "negotiation");
        }
        offer_ = *header_ptr;
    }
    const HeaderMessage header = *offer_;
    const std::string name = security::sanitize_filename(header.file_name);

    update([&](TransferSession& s) {
        s.file_name = header.file_name;
        s.file_size = header.file_size;
        s.chunk_size = header.chunk_size;
        s.integrity_digest = header.digest.value_or("");
    });

    auto reject = [&](const char* reason) {
        HeaderAckMessage answer;
        answer.accept = false;
        answer.reason = reason;
        channel_->send(answer, options_.io_timeout);
        throw RejectedError(reason);
    };

    if (name.empty()) {
        reject(REJECT_INVALID_NAME);
    }
    if (utilities::to_lowercase(header.digest_algorithm) != security::DIGEST_ALGORITHM ||
        (header.digest && !is_sha256_hex(*header.digest))) {
        reject(REJECT_UNSUPPORTED_DIGEST);
    }
    if (header.chunk_size < security::MIN_CHUNK_SIZE || header.chunk_size > security::MAX_CHUNK_SIZE) {
        reject(REJECT_INVALID_CHUNK_SIZE);
    }
    const uint64_t total = chunk_count(header.file_size, header.chunk_size);
    if (total > std::numeric_limits<uint32_t>::max()) {
        reject(REJECT_TOO_LARGE);
    }

    std::error_code ec;
    std::filesystem::create_directories(options_.downloads_dir, ec);
    if (ec) {
        reject(REJECT_WRITE_FAILED);
    }
    auto space = std::filesystem::space(options_.downloads_dir, ec);
    if (!ec && space.available < header.file_size) {
        reject(REJECT_NO_SPACE);
    }

    if (accept_callback_ && !accept_callback_(session_.peer_id, header)) {
        reject(REJECT_DECLINED);
    }

    // Hidden temporary name; visible under the final name only once verified
    std::string temp_name = "." + name.substr(0, 128) + "." + session_id_ + ".part";
    temp_path_ = options_.downloads_dir / temp_name;
    output_.open(temp_path_, std::ios::binary | std::ios::trunc);
    if (!output_) {
        temp_path_.clear();
        reject(REJECT_WRITE_FAILED);
    }

    HeaderAckMessage accepted;
    accepted.accept = true;
    channel_->send(accepted, options_.io_timeout);

    set_state(TransferState::Transferring);
    utilities::log_info("Transfer: Receiving " + name + " (" +
                        utilities::format_file_size(header.file_size) + ") from " + session_.peer_id);

    // ---- Transferring ----
    utilities::Sha256 hasher;
    uint64_t expected = 0;
    std::optional<uint32_t> awaiting;     // Index requested for retransmission
    std::set<uint32_t> retried;

    while (expected < total) {
        check_cancelled();

        ChannelMessage message = channel_->receive(options_.io_timeout);

        if (const auto* chunk = std::get_if<ChunkMessage>(&message)) {
            // Go-back-N: chunks sent before the sender saw our request
            if (awaiting && chunk->index > *awaiting) {
                continue;
            }
            if (chunk->index != expected) {
                throw ProtocolViolation("expected chunk " + std::to_string(expected) +
                                        ", got " + std::to_string(chunk->index));
            }

            uint32_t length = chunk_length(expected, header.file_size, header.chunk_size);
            if (chunk->payload.size() != length) {
                throw ProtocolViolation("chunk " + std::to_string(chunk->index) + " has " +
                                        std::to_string(chunk->payload.size()) + " bytes, expected " +
                                        std::to_string(length));
            }

            if (!codec::verify_chunk(*chunk)) {
                if (retried.count(chunk->index) > 0) {
                    throw IntegrityError("chunk " + std::to_string(chunk->index) +
                                         " failed verification after retransmission");
                }
                retried.insert(chunk->index);
                awaiting = chunk->index;

                RetransmitMessage request;
                request.index = chunk->index;
                channel_->send(request, options_.io_timeout);
                update([](TransferSession& s) { s.retransmits++; });
                utilities::log_warn("Transfer: Checksum mismatch on chunk " + std::to_string(chunk->index) +
                                    " in session " + session_id_ + ", requesting retransmission");
                continue;
            }
            awaiting.reset();

            output_.write(reinterpret_cast<const char*>(chunk->payload.data()),
                          static_cast<std::streamsize>(chunk->payload.size()));
            if (!output_) {
                throw ResourceError("write to " + temp_path_.string() + " failed");
            }
            hasher.update(chunk->payload.data(), chunk->payload.size());

            expected++;
            update([length](TransferSession& s) {
                s.bytes_transferred += length;
                s.chunks_transferred++;
            });
            continue;
        }

        // End marker sent before our retransmit request reached the sender
        if (awaiting && std::holds_alternative<CompleteMessage>(message)) {
            continue;
        }

        unexpected(message, "transfer");
    }

    // ---- Verifying ----
    set_state(TransferState::Verifying);

    output_.flush();
    output_.close();
    if (output_.fail()) {
        throw ResourceError("write to " + temp_path_.string() + " failed");
    }

    auto computed = hasher.finalize_hex();
    if (!computed) {
        throw ResourceError("digest computation failed");
    }

    std::optional<std::string> declared = header.digest;
    auto verify_deadline = std::chrono::steady_clock::now() + options_.verification_timeout;
    while (true) {
        ChannelMessage message = channel_->receive(remaining_until(verify_deadline));
        if (const auto* complete = std::get_if<CompleteMessage>(&message)) {
            if (!declared) {
                declared = complete->digest;
            }
            break;
        }
        unexpected(message, "verification");
    }

    if (!declared || !is_sha256_hex(*declared)) {
        throw ProtocolViolation("sender declared no usable digest");
    }
    if (utilities::to_lowercase(*declared) != *computed) {
        throw IntegrityError("digest mismatch: expected " + *declared + ", computed " + *computed);
    }

    std::filesystem::path destination = unique_destination(options_.downloads_dir, name);
    std::filesystem::rename(temp_path_, destination);
    temp_path_.clear();

    update([&](TransferSession& s) {
        s.integrity_digest = *computed;
        s.local_path = destination;
    });

    try {
        channel_->send(CompleteMessage{}, options_.io_timeout);
    } catch (const NetworkError& e) {
        // The file is verified and in place regardless
        utilities::log_warn("Transfer: Completion notice to " + session_.peer_id +
                            " failed: " + std::string(e.what()));
    }
    channel_->close();

    set_state(TransferState::Completed);
    utilities::log_info("Transfer: Received " + destination.string() + " from " + session_.peer_id);
}

// ============================================================================
// Private Methods
// ============================================================================

void TransferEngine::update(const std::function<void(TransferSession&)>& mutator) {
    TransferSession copy;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        mutator(session_);
        copy = session_;
    }

    TransferObserver observer;
    {
        std::lock_guard<std::mutex> lock(observer_mutex_);
        observer = observer_;
    }
    if (observer) {
        observer(copy);
    }
}

void TransferEngine::set_state(TransferState state) {
    update([state](TransferSession& s) {
        s.state = state;
        if (is_terminal(state)) {
            s.finished_at = Clock::now();
        }
    });
}

void TransferEngine::abort(ErrorKind kind, const std::string& reason) {
    // Tell the peer why, where the channel still allows it
    if (!peer_terminated_ && channel_->is_open()) {
        const char* code = nullptr;
        switch (kind) {
            case ErrorKind::Integrity:         code = codec::ERROR_INTEGRITY; break;
            case ErrorKind::Resource:          code = codec::ERROR_RESOURCE; break;
            case ErrorKind::ProtocolViolation: code = codec::ERROR_PROTOCOL; break;
            default: break;
        }
        if (code) {
            try {
                ErrorMessage notice;
                notice.reason = code;
                channel_->send(notice, options_.io_timeout);
            } catch (const LanshareError& e) {
                utilities::log_debug("Transfer: Error notice not delivered: " + std::string(e.what()));
            }
        }
    }
    channel_->close();

    discard_partial_output();

    update([&](TransferSession& s) {
        s.state = TransferState::Aborted;
        s.error = kind;
        s.reason = reason;
        s.finished_at = Clock::now();
    });

    std::string message = "Transfer: Session " + session_id_ + " aborted (" +
                          std::string(to_string(kind)) + "): " + reason;
    if (kind == ErrorKind::Cancelled || kind == ErrorKind::Rejected) {
        utilities::log_info(message);
    } else {
        utilities::log_error(message);
    }
}

void TransferEngine::unexpected(const ChannelMessage& message, const char* context) {
    if (std::holds_alternative<CancelMessage>(message)) {
        peer_terminated_ = true;
        throw CancelledError("cancelled by peer");
    }
    if (const auto* error = std::get_if<ErrorMessage>(&message)) {
        peer_terminated_ = true;
        throw LanshareError(codec::error_kind_from_reason(error->reason), "peer reported: " + error->reason);
    }
    throw ProtocolViolation("unexpected " + codec::message_type_name(message) + " during " + context);
}

void TransferEngine::check_cancelled() const {
    if (cancelled_.load()) {
        throw CancelledError("cancelled");
    }
}

std::chrono::milliseconds TransferEngine::remaining_until(std::chrono::steady_clock::time_point deadline) const {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
        throw NetworkError("timed out");
    }
    return remaining;
}

void TransferEngine::discard_partial_output() {
    if (output_.is_open()) {
        output_.close();
    }
    if (!temp_path_.empty()) {
        std::error_code ec;
        std::filesystem::remove(temp_path_, ec);
        if (ec) {
            utilities::log_warn("Transfer: Cannot remove partial file " + temp_path_.string() +
                                ": " + ec.message());
        }
        temp_path_.clear();
    }
}

} // namespace lanshare
