// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file varint.hpp
/// @brief Variable-length integer and length-prefixed string primitives
///
/// 7 data bits per byte, continuation bit (0x80) set on every byte except the
/// last, least-significant group first. At most 5 groups encode an int32.
/// Strings are a varint byte length followed by UTF-8 bytes, no terminator.
///
/// The primitives know nothing about packet ids or protocol states; the
/// Minecraft handshake encoder and decoder are built on top of them.

#include "keeper/errors.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace keeper {

/// Maximum number of 7-bit groups in an encoded int32
constexpr int kMaxVarIntBytes = 5;

/// Default upper bound for read_string (1 MiB)
constexpr size_t kMaxStringLength = 1024 * 1024;

/// Source of bytes for the decoders.
///
/// Implemented over an in-memory buffer (BufferReader) and over a socket
/// (query::TcpConnection).
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /// Fill exactly @p length bytes or throw.
    /// @throws ProtocolError if the source ends early
    /// @throws ConnectError on transport failure
    virtual void read_exact(uint8_t* out, size_t length) = 0;

    uint8_t read_byte() {
        uint8_t b = 0;
        read_exact(&b, 1);
        return b;
    }
};

/// ByteSource over a borrowed byte vector
class BufferReader : public ByteSource {
public:
    explicit BufferReader(const std::vector<uint8_t>& data) : data_(data) {}

    void read_exact(uint8_t* out, size_t length) override;

    size_t position() const { return pos_; }
    size_t remaining() const { return data_.size() - pos_; }

private:
    const std::vector<uint8_t>& data_;
    size_t pos_ = 0;
};

/// Append @p value as a varint. Negative values take the full 5 bytes.
void write_varint(std::vector<uint8_t>& buffer, int32_t value);

/// Number of bytes write_varint() would emit for @p value
size_t varint_size(int32_t value);

/// Decode one varint.
/// @throws ProtocolError("varint too long") if a 5th group still has the
///         continuation bit set
int32_t read_varint(ByteSource& source);

/// Append varint length + UTF-8 bytes
void write_string(std::vector<uint8_t>& buffer, const std::string& value);

/// Decode a length-prefixed string.
/// @throws ProtocolError on a negative length or one above @p max_length
std::string read_string(ByteSource& source, size_t max_length = kMaxStringLength);

/// Append a 16-bit value in network byte order
void write_u16_be(std::vector<uint8_t>& buffer, uint16_t value);

}  // namespace keeper
