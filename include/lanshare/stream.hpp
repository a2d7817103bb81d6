/**
 * @file stream.hpp
 * @brief Blocking bidirectional byte stream interface
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <cstddef>
#include <string>

namespace lanshare {

/**
 * @brief ByteStream - Reliable ordered byte transport
 *
 * Implemented over TCP in production and over in-memory pipes in tests.
 * Reads and writes block the calling thread; close() may be called from
 * any thread and unblocks pending I/O, which then fails with NetworkError.
 */
class ByteStream {
public:
    virtual ~ByteStream() = default;

    /**
     * @brief Read exactly size bytes
     * @throws NetworkError on timeout, peer close or after close()
     */
    virtual void read_exact(uint8_t* data, size_t size, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Write all bytes; returns once the transport accepted them
     * @throws NetworkError on timeout, reset or after close()
     */
    virtual void write_all(const uint8_t* data, size_t size, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Bytes readable without blocking
     */
    virtual size_t available() = 0;

    /**
     * @brief Close the stream (thread-safe, idempotent)
     */
    virtual void close() = 0;

    virtual bool is_open() const = 0;

    /**
     * @brief Remote peer address for logging and registry lookups
     */
    virtual std::string remote_address() const = 0;
};

} // namespace lanshare
