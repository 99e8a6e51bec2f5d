// =============================================================================
// rcp-packager - Wire Codec Implementation
// =============================================================================

#include "rcp/format/wire_codec.h"

#include <bit>
#include <limits>

namespace rcp::format::wire {

namespace {

/// @brief Ensure `count` bytes are available at pos.
void requireBytes(ByteSpan data, std::size_t pos, std::size_t count, std::string_view what) {
    if (pos > data.size() || data.size() - pos < count) {
        throw TruncatedInputError(
            std::string("Truncated ") + std::string(what),
            ErrorContext().withOffset(pos));
    }
}

template <typename UInt>
void appendLittleEndian(Bytes& out, UInt value) {
    for (std::size_t i = 0; i < sizeof(UInt); ++i) {
        out.push_back(static_cast<std::uint8_t>(value >> (8 * i)));
    }
}

template <typename UInt>
UInt readLittleEndian(ByteSpan data, std::size_t pos) {
    UInt value = 0;
    for (std::size_t i = 0; i < sizeof(UInt); ++i) {
        value |= static_cast<UInt>(data[pos + i]) << (8 * i);
    }
    return value;
}

}  // namespace

// =============================================================================
// Encoding
// =============================================================================

void appendVarint(Bytes& out, std::uint64_t value) {
    while (value >= 0x80) {
        out.push_back(static_cast<std::uint8_t>((value & 0x7F) | 0x80));
        value >>= 7;
    }
    out.push_back(static_cast<std::uint8_t>(value));
}

Bytes encodeVarint(std::uint64_t value) {
    Bytes out;
    out.reserve(kMaxVarintBytes);
    appendVarint(out, value);
    return out;
}

void appendTag(Bytes& out, std::uint32_t fieldNumber, WireType wireType) {
    appendVarint(out, (static_cast<std::uint64_t>(fieldNumber) << 3) |
                          static_cast<std::uint64_t>(wireType));
}

Bytes encodeTag(std::uint32_t fieldNumber, WireType wireType) {
    Bytes out;
    appendTag(out, fieldNumber, wireType);
    return out;
}

void appendLengthDelimited(Bytes& out, ByteSpan payload) {
    appendVarint(out, payload.size());
    out.insert(out.end(), payload.begin(), payload.end());
}

void appendLengthDelimited(Bytes& out, std::string_view payload) {
    appendVarint(out, payload.size());
    out.insert(out.end(), payload.begin(), payload.end());
}

Bytes encodeLengthDelimited(ByteSpan payload) {
    Bytes out;
    out.reserve(payload.size() + kMaxVarintBytes);
    appendLengthDelimited(out, payload);
    return out;
}

void appendFloat(Bytes& out, float value) {
    appendLittleEndian(out, std::bit_cast<std::uint32_t>(value));
}

void appendDouble(Bytes& out, double value) {
    appendLittleEndian(out, std::bit_cast<std::uint64_t>(value));
}

// =============================================================================
// Decoding
// =============================================================================

std::uint64_t decodeVarint(ByteSpan data, std::size_t& pos) {
    const std::size_t start = pos;
    std::uint64_t result = 0;
    unsigned shift = 0;

    for (std::size_t i = 0; i < kMaxVarintBytes; ++i) {
        if (pos >= data.size()) {
            throw TruncatedInputError("Truncated varint", ErrorContext().withOffset(start));
        }
        const std::uint8_t byte = data[pos++];
        result |= static_cast<std::uint64_t>(byte & 0x7F) << shift;
        if ((byte & 0x80) == 0) {
            return result;
        }
        shift += 7;
    }

    // Ten continuation bytes without a terminator cannot encode a 64-bit value
    throw TruncatedInputError("Unterminated varint", ErrorContext().withOffset(start));
}

Tag decodeTag(ByteSpan data, std::size_t& pos) {
    const std::uint64_t raw = decodeVarint(data, pos);
    const std::uint64_t field = raw >> 3;

    Tag tag;
    tag.fieldNumber = field > std::numeric_limits<std::uint32_t>::max()
                          ? std::numeric_limits<std::uint32_t>::max()
                          : static_cast<std::uint32_t>(field);
    tag.wireType = static_cast<std::uint32_t>(raw & 0x07);
    return tag;
}

ByteSpan decodeLengthDelimited(ByteSpan data, std::size_t& pos) {
    const std::uint64_t length = decodeVarint(data, pos);
    if (length > data.size() - pos) {
        throw TruncatedInputError(
            "Length-delimited field overruns buffer: declared " + std::to_string(length) +
                " bytes, " + std::to_string(data.size() - pos) + " remaining",
            ErrorContext().withOffset(pos));
    }
    ByteSpan payload = data.subspan(pos, static_cast<std::size_t>(length));
    pos += static_cast<std::size_t>(length);
    return payload;
}

float decodeFloat(ByteSpan data, std::size_t& pos) {
    requireBytes(data, pos, sizeof(std::uint32_t), "fixed32");
    const auto bits = readLittleEndian<std::uint32_t>(data, pos);
    pos += sizeof(std::uint32_t);
    return std::bit_cast<float>(bits);
}

double decodeDouble(ByteSpan data, std::size_t& pos) {
    requireBytes(data, pos, sizeof(std::uint64_t), "fixed64");
    const auto bits = readLittleEndian<std::uint64_t>(data, pos);
    pos += sizeof(std::uint64_t);
    return std::bit_cast<double>(bits);
}

// =============================================================================
// WireReader
// =============================================================================

std::string WireReader::readString() {
    ByteSpan bytes = readBytes();
    return std::string(bytes.begin(), bytes.end());
}

}  // namespace rcp::format::wire
