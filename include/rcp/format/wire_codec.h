// =============================================================================
// rcp-packager - Wire Codec
// =============================================================================
// Low-level primitives for the protobuf-compatible binary wire format used
// by channel files.
//
// This module provides:
// - Unsigned base-128 varints
// - Field tags (field number << 3 | wire type)
// - Length-delimited byte fields
// - Little-endian IEEE-754 fixed32 (float) and fixed64 (double) values
// - WireReader: cursor over an encoded buffer used by message parsers
//
// Every decode routine throws TruncatedInputError when the buffer ends
// before the value is complete.
// =============================================================================

#ifndef RCP_FORMAT_WIRE_CODEC_H
#define RCP_FORMAT_WIRE_CODEC_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "rcp/common/error.h"
#include "rcp/common/types.h"

namespace rcp::format::wire {

// =============================================================================
// Wire Types
// =============================================================================

/// @brief Wire types understood by the codec.
enum class WireType : std::uint8_t {
    kVarint = 0,
    kFixed64 = 1,
    kLengthDelimited = 2,
    kFixed32 = 5
};

/// @brief Maximum encoded width of a 64-bit varint.
inline constexpr std::size_t kMaxVarintBytes = 10;

/// @brief Decoded field tag.
/// @note wireType keeps the raw 3-bit value so unsupported types (3, 4, 6, 7)
///       can be reported by the message layer.
struct Tag {
    std::uint32_t fieldNumber = 0;
    std::uint32_t wireType = 0;

    [[nodiscard]] bool is(std::uint32_t field, WireType type) const noexcept {
        return fieldNumber == field && wireType == static_cast<std::uint32_t>(type);
    }
};

// =============================================================================
// Encoding
// =============================================================================

/// @brief Append a varint to a buffer.
void appendVarint(Bytes& out, std::uint64_t value);

/// @brief Encode a varint into a fresh buffer.
[[nodiscard]] Bytes encodeVarint(std::uint64_t value);

/// @brief Append a field tag.
void appendTag(Bytes& out, std::uint32_t fieldNumber, WireType wireType);

/// @brief Encode a field tag into a fresh buffer.
[[nodiscard]] Bytes encodeTag(std::uint32_t fieldNumber, WireType wireType);

/// @brief Append varint(length) followed by the payload.
void appendLengthDelimited(Bytes& out, ByteSpan payload);

/// @brief String overload of appendLengthDelimited (UTF-8 bytes as-is).
void appendLengthDelimited(Bytes& out, std::string_view payload);

/// @brief Encode a length-delimited field body into a fresh buffer.
[[nodiscard]] Bytes encodeLengthDelimited(ByteSpan payload);

/// @brief Append 4 little-endian bytes of an IEEE-754 float.
void appendFloat(Bytes& out, float value);

/// @brief Append 8 little-endian bytes of an IEEE-754 double.
void appendDouble(Bytes& out, double value);

// =============================================================================
// Decoding
// =============================================================================

/// @brief Decode a varint starting at pos.
/// @param data Encoded buffer.
/// @param pos In: start offset. Out: offset just past the varint.
/// @throws TruncatedInputError if no terminating byte is found.
[[nodiscard]] std::uint64_t decodeVarint(ByteSpan data, std::size_t& pos);

/// @brief Decode a field tag starting at pos.
[[nodiscard]] Tag decodeTag(ByteSpan data, std::size_t& pos);

/// @brief Decode a length-delimited payload starting at pos.
/// @return View into data covering the payload.
/// @throws TruncatedInputError if the declared length overruns the buffer.
[[nodiscard]] ByteSpan decodeLengthDelimited(ByteSpan data, std::size_t& pos);

[[nodiscard]] float decodeFloat(ByteSpan data, std::size_t& pos);

[[nodiscard]] double decodeDouble(ByteSpan data, std::size_t& pos);

// =============================================================================
// WireReader
// =============================================================================

/// @brief Sequential reader over one encoded message.
/// @note Does not own the buffer; the caller keeps it alive.
class WireReader {
public:
    explicit WireReader(ByteSpan data) noexcept : data_(data) {}

    [[nodiscard]] bool atEnd() const noexcept { return pos_ >= data_.size(); }

    [[nodiscard]] std::size_t position() const noexcept { return pos_; }

    [[nodiscard]] Tag readTag() { return decodeTag(data_, pos_); }

    [[nodiscard]] std::uint64_t readVarint() { return decodeVarint(data_, pos_); }

    [[nodiscard]] float readFloat() { return decodeFloat(data_, pos_); }

    [[nodiscard]] double readDouble() { return decodeDouble(data_, pos_); }

    [[nodiscard]] ByteSpan readBytes() { return decodeLengthDelimited(data_, pos_); }

    /// @brief Read a length-delimited field as a UTF-8 string.
    [[nodiscard]] std::string readString();

private:
    ByteSpan data_;
    std::size_t pos_ = 0;
};

}  // namespace rcp::format::wire

#endif  // RCP_FORMAT_WIRE_CODEC_H
