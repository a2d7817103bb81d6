/**
 * @file secure_channel.cpp
 * @brief Implementation of the authenticated crypto channel
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lanshare/secure_channel.hpp"
#include "lanshare/errors.hpp"
#include "lanshare/security_config.hpp"
#include "lanshare/utilities.hpp"
#include <algorithm>

namespace lanshare {

namespace {

constexpr const char* INITIATOR_ROLE = "initiator";
constexpr const char* RESPONDER_ROLE = "responder";

HelloMessage make_hello(const DeviceIdentity& identity, const KeyExchangeKeyPair& ephemeral) {
    HelloMessage hello;
    hello.algorithm = security::CHANNEL_ALGORITHM;
    std::copy(ephemeral.public_key.begin(), ephemeral.public_key.end(), hello.ephemeral_key.begin());
    hello.identity_key = identity.get_signature_public_key();
    hello.device_id = identity.get_device_id();
    hello.display_name = identity.get_display_name();
    return hello;
}

HelloMessage parse_peer_hello(const Frame& frame) {
    if (frame.kind != FrameKind::Hello) {
        throw ProtocolViolation("SecureChannel: expected HELLO frame");
    }
    HelloMessage hello = HelloMessage::from_bytes(frame.body);
    if (hello.algorithm != security::CHANNEL_ALGORITHM) {
        throw ProtocolViolation("SecureChannel: unsupported algorithm '" + hello.algorithm + "'");
    }
    return hello;
}

std::vector<uint8_t> transcript_hash(
    const std::vector<uint8_t>& initiator_hello,
    const std::vector<uint8_t>& responder_hello
) {
    std::vector<uint8_t> transcript;
    transcript.reserve(initiator_hello.size() + responder_hello.size());
    transcript.insert(transcript.end(), initiator_hello.begin(), initiator_hello.end());
    transcript.insert(transcript.end(), responder_hello.begin(), responder_hello.end());
    return DeviceCrypto::generic_hash(transcript.data(), transcript.size(), security::TRANSCRIPT_HASH_SIZE);
}

std::vector<uint8_t> confirmation_message(const char* role, const std::vector<uint8_t>& transcript) {
    std::vector<uint8_t> message(role, role + std::char_traits<char>::length(role));
    message.insert(message.end(), transcript.begin(), transcript.end());
    return message;
}

std::vector<uint8_t> associated_data(uint64_t sequence) {
    std::vector<uint8_t> ad;
    ad.reserve(9);
    ad.push_back(static_cast<uint8_t>(FrameKind::Sealed));
    codec::put_u64(ad, sequence);
    return ad;
}

ChannelPeer peer_from_hello(const HelloMessage& hello, const ByteStream& stream) {
    ChannelPeer peer;
    peer.device_id = hello.device_id;
    peer.display_name = hello.display_name;
    peer.identity_key = hello.identity_key;
    peer.address = stream.remote_address();
    return peer;
}

} // namespace

// ============================================================================
// Handshake
// ============================================================================

std::unique_ptr<SecureChannel> SecureChannel::initiate(
    std::shared_ptr<ByteStream> stream,
    const DeviceIdentity& identity,
    TrustStore& trust,
    const std::string& expected_peer_id,
    std::chrono::milliseconds timeout
) {
    KeyExchangeKeyPair ephemeral = DeviceCrypto::generate_key_exchange_keypair();

    try {
        std::vector<uint8_t> own_hello = make_hello(identity, ephemeral).to_bytes();
        codec::write_frame(*stream, FrameKind::Hello, own_hello, timeout);

        Frame frame = codec::read_frame(*stream, timeout);
        HelloMessage peer_hello = parse_peer_hello(frame);

        if (!expected_peer_id.empty() && peer_hello.device_id != expected_peer_id) {
            throw AuthenticationError("SecureChannel: dialed " + expected_peer_id +
                                      " but peer identified as " + peer_hello.device_id);
        }

        auto keys = DeviceCrypto::client_session_keys(ephemeral, peer_hello.ephemeral_key);
        DeviceCrypto::secure_zero(ephemeral.secret_key.data(), ephemeral.secret_key.size());
        if (!keys) {
            throw AuthenticationError("SecureChannel: key agreement failed");
        }

        std::unique_ptr<SecureChannel> channel(new SecureChannel(
            stream, ChannelRole::Initiator, peer_from_hello(peer_hello, *stream), *keys));
        DeviceCrypto::secure_zero(keys->rx.data(), keys->rx.size());
        DeviceCrypto::secure_zero(keys->tx.data(), keys->tx.size());

        channel->confirm(identity, trust, transcript_hash(own_hello, frame.body), timeout);
        return channel;

    } catch (const LanshareError& e) {
        DeviceCrypto::secure_zero(ephemeral.secret_key.data(), ephemeral.secret_key.size());
        utilities::log_warn("SecureChannel: Handshake with " + stream->remote_address() +
                            " failed: " + std::string(e.what()));
        stream->close();
        throw;
    }
}

std::unique_ptr<SecureChannel> SecureChannel::accept(
    std::shared_ptr<ByteStream> stream,
    const Frame& hello_frame,
    const DeviceIdentity& identity,
    TrustStore& trust,
    std::chrono::milliseconds timeout
) {
    KeyExchangeKeyPair ephemeral = DeviceCrypto::generate_key_exchange_keypair();

    try {
        HelloMessage peer_hello = parse_peer_hello(hello_frame);

        std::vector<uint8_t> own_hello = make_hello(identity, ephemeral).to_bytes();
        codec::write_frame(*stream, FrameKind::Hello, own_hello, timeout);

        auto keys = DeviceCrypto::server_session_keys(ephemeral, peer_hello.ephemeral_key);
        DeviceCrypto::secure_zero(ephemeral.secret_key.data(), ephemeral.secret_key.size());
        if (!keys) {
            throw AuthenticationError("SecureChannel: key agreement failed");
        }

        std::unique_ptr<SecureChannel> channel(new SecureChannel(
            stream, ChannelRole::Responder, peer_from_hello(peer_hello, *stream), *keys));
        DeviceCrypto::secure_zero(keys->rx.data(), keys->rx.size());
        DeviceCrypto::secure_zero(keys->tx.data(), keys->tx.size());

        channel->confirm(identity, trust, transcript_hash(hello_frame.body, own_hello), timeout);
        return channel;

    } catch (const LanshareError& e) {
        DeviceCrypto::secure_zero(ephemeral.secret_key.data(), ephemeral.secret_key.size());
        utilities::log_warn("SecureChannel: Handshake with " + stream->remote_address() +
                            " failed: " + std::string(e.what()));
        stream->close();
        throw;
    }
}

void SecureChannel::confirm(
    const DeviceIdentity& identity,
    TrustStore& trust,
    const std::vector<uint8_t>& transcript,
    std::chrono::milliseconds timeout
) {
    const char* own_role = role_ == ChannelRole::Initiator ? INITIATOR_ROLE : RESPONDER_ROLE;
    const char* peer_role = role_ == ChannelRole::Initiator ? RESPONDER_ROLE : INITIATOR_ROLE;

    auto send_confirm = [&]() {
        ConfirmMessage own;
        own.signature = identity.sign(confirmation_message(own_role, transcript));
        send(own, timeout);
    };

    // The initiator proves itself first
    if (role_ == ChannelRole::Initiator) {
        send_confirm();
    }

    ChannelMessage reply = receive(timeout);
    const auto* peer_confirm = std::get_if<ConfirmMessage>(&reply);
    if (!peer_confirm) {
        throw ProtocolViolation("SecureChannel: expected confirm, got " + codec::message_type_name(reply));
    }

    if (!DeviceIdentity::verify(confirmation_message(peer_role, transcript),
                                peer_confirm->signature, peer_.identity_key)) {
        throw AuthenticationError("SecureChannel: invalid confirmation signature from " + peer_.device_id);
    }

    switch (trust.check_and_pin(peer_.device_id, peer_.identity_key, peer_.display_name)) {
        case PinResult::Pinned:
        case PinResult::Matched:
            break;
        case PinResult::Mismatch:
            throw AuthenticationError("SecureChannel: identity key of " + peer_.device_id +
                                      " does not match the pinned key (possible impersonation)");
        case PinResult::Failed:
            throw AuthenticationError("SecureChannel: cannot verify pinned identity of " + peer_.device_id);
    }

    if (role_ == ChannelRole::Responder) {
        send_confirm();
    }

    utilities::log_debug("SecureChannel: Established with " + peer_.device_id + " (" + peer_.address + ")");
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

SecureChannel::SecureChannel(
    std::shared_ptr<ByteStream> stream,
    ChannelRole role,
    ChannelPeer peer,
    const SessionKeys& keys
)
    : stream_(std::move(stream))
    , role_(role)
    , peer_(std::move(peer))
{
    std::copy(keys.tx.begin(), keys.tx.end(), state_.tx_key.begin());
    std::copy(keys.rx.begin(), keys.rx.end(), state_.rx_key.begin());
}

SecureChannel::~SecureChannel() {
    stream_->close();
    DeviceCrypto::secure_zero(&state_, sizeof(state_));
}

// ============================================================================
// Sealed Messaging
// ============================================================================

void SecureChannel::send(const ChannelMessage& message, std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(send_mutex_);
    send_locked(message, timeout);
}

bool SecureChannel::try_send(const ChannelMessage& message, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(send_mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        return false;
    }
    send_locked(message, timeout);
    return true;
}

void SecureChannel::send_locked(const ChannelMessage& message, std::chrono::milliseconds timeout) {
    uint64_t sequence = state_.tx_sequence;
    std::vector<uint8_t> plaintext = codec::encode_message(message);
    std::vector<uint8_t> ciphertext = DeviceCrypto::seal(
        plaintext,
        state_.tx_key,
        DeviceCrypto::nonce_for_sequence(sequence),
        associated_data(sequence)
    );

    std::vector<uint8_t> body;
    body.reserve(8 + ciphertext.size());
    codec::put_u64(body, sequence);
    body.insert(body.end(), ciphertext.begin(), ciphertext.end());

    codec::write_frame(*stream_, FrameKind::Sealed, body, timeout);
    state_.tx_sequence++;
}

ChannelMessage SecureChannel::receive(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(receive_mutex_);

    Frame frame;
    try {
        frame = codec::read_frame(*stream_, timeout);
    } catch (const ProtocolViolation&) {
        stream_->close();
        throw;
    }

    if (frame.kind != FrameKind::Sealed) {
        stream_->close();
        throw ProtocolViolation("SecureChannel: unexpected plaintext frame after handshake");
    }
    if (frame.body.size() < 8 + security::CHACHA20_TAG_SIZE) {
        stream_->close();
        throw ProtocolViolation("SecureChannel: truncated sealed frame");
    }

    uint64_t sequence = codec::get_u64(frame.body.data());
    if (sequence != state_.rx_sequence) {
        stream_->close();
        throw AuthenticationError("SecureChannel: sequence " + std::to_string(sequence) +
                                  " from " + peer_.device_id + ", expected " +
                                  std::to_string(state_.rx_sequence));
    }

    std::vector<uint8_t> ciphertext(frame.body.begin() + 8, frame.body.end());
    auto plaintext = DeviceCrypto::open(
        ciphertext,
        state_.rx_key,
        DeviceCrypto::nonce_for_sequence(sequence),
        associated_data(sequence)
    );
    if (!plaintext) {
        stream_->close();
        throw AuthenticationError("SecureChannel: message authentication failed from " + peer_.device_id);
    }
    state_.rx_sequence++;

    try {
        return codec::decode_message(*plaintext);
    } catch (const ProtocolViolation&) {
        stream_->close();
        throw;
    }
}

std::optional<ChannelMessage> SecureChannel::poll(std::chrono::milliseconds timeout) {
    if (stream_->available() == 0) {
        return std::nullopt;
    }
    return receive(timeout);
}

void SecureChannel::close() {
    stream_->close();
}

bool SecureChannel::is_open() const {
    return stream_->is_open();
}

const ChannelPeer& SecureChannel::peer() const {
    return peer_;
}

ChannelRole SecureChannel::role() const {
    return role_;
}

} // namespace lanshare
