// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#include "keeper/varint.hpp"

#include <cstring>

namespace keeper {

void BufferReader::read_exact(uint8_t* out, size_t length) {
    if (length > remaining()) {
        throw ProtocolError("unexpected end of buffer: need " + std::to_string(length) +
                            " bytes, have " + std::to_string(remaining()));
    }
    if (length > 0) {
        std::memcpy(out, data_.data() + pos_, length);
        pos_ += length;
    }
}

void write_varint(std::vector<uint8_t>& buffer, int32_t value) {
    // Shift as unsigned so negative values terminate after 5 groups
    uint32_t v = static_cast<uint32_t>(value);
    while ((v & ~0x7Fu) != 0) {
        buffer.push_back(static_cast<uint8_t>((v & 0x7F) | 0x80));
        v >>= 7;
    }
    buffer.push_back(static_cast<uint8_t>(v));
}

size_t varint_size(int32_t value) {
    uint32_t v = static_cast<uint32_t>(value);
    size_t size = 1;
    while ((v & ~0x7Fu) != 0) {
        v >>= 7;
        ++size;
    }
    return size;
}

int32_t read_varint(ByteSource& source) {
    uint32_t result = 0;
    for (int group = 0; group < kMaxVarIntBytes; ++group) {
        uint8_t b = source.read_byte();
        result |= static_cast<uint32_t>(b & 0x7F) << (7 * group);
        if ((b & 0x80) == 0) {
            return static_cast<int32_t>(result);
        }
    }
    throw ProtocolError("varint too long");
}

void write_string(std::vector<uint8_t>& buffer, const std::string& value) {
    write_varint(buffer, static_cast<int32_t>(value.size()));
    buffer.insert(buffer.end(), value.begin(), value.end());
}

std::string read_string(ByteSource& source, size_t max_length) {
    int32_t length = read_varint(source);
    if (length < 0) {
        throw ProtocolError("negative string length: " + std::to_string(length));
    }
    if (static_cast<size_t>(length) > max_length) {
        throw ProtocolError("string length " + std::to_string(length) +
                            " exceeds limit " + std::to_string(max_length));
    }

    std::string value(static_cast<size_t>(length), '\0');
    if (length > 0) {
        source.read_exact(reinterpret_cast<uint8_t*>(&value[0]), value.size());
    }
    return value;
}

void write_u16_be(std::vector<uint8_t>& buffer, uint16_t value) {
    buffer.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    buffer.push_back(static_cast<uint8_t>(value & 0xFF));
}

}  // namespace keeper
