// =============================================================================
// rcp-packager - RCP Message Definitions
// =============================================================================
// The closed set of RCP 2025 messages and their wire encoding.
//
// Field layout:
//   Checksum       1 path (LD)        2 sha256 (LD)
//   Manifest       1 version (LD)     2 package_id (LD)   3 source (LD)
//                  4 device_profile   5 dpi (fixed64)     6 created_at (LD)
//                  7 attributes, one LD {1 key, 2 value} entry per map item
//   Index          1 touch_samples    2 acc_samples       3 gyro_samples
//                  (varint)           4 duration_seconds (fixed64)
//                  5 checksums (repeated LD Checksum)
//   TouchChannel   1 t (varint)       2 x  3 y  4 pressure  5 size (fixed32)
//   Acc/Gyro       1 t (varint)       2 x  3 y  4 z (fixed32)
//
// Encoding rules:
// - Scalar fields in ascending field order; default values are omitted
// - Repeated columns emit one tag+value per element, including zeros
// - Parsing is strict: unknown field numbers throw UnknownFieldError and
//   known fields with another wire type throw WireTypeMismatchError
// - Channel columns must have equal length on both encode and decode
// =============================================================================

#ifndef RCP_FORMAT_RCP_MESSAGES_H
#define RCP_FORMAT_RCP_MESSAGES_H

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "rcp/common/error.h"
#include "rcp/common/types.h"

namespace rcp::format {

// =============================================================================
// Checksum
// =============================================================================

/// @brief SHA-256 digest of one package artifact.
struct Checksum {
    /// @brief Path relative to the package root, '/'-separated.
    std::string path;

    /// @brief 64 lowercase hex characters.
    std::string sha256;

    [[nodiscard]] Bytes serialize() const;
    [[nodiscard]] static Checksum parse(ByteSpan data);

    bool operator==(const Checksum&) const = default;
};

// =============================================================================
// Manifest
// =============================================================================

/// @brief Package-level descriptive metadata.
/// @note attributes is ordered by key, which fixes the encode order.
struct Manifest {
    std::string version;
    std::string packageId;
    std::string source;
    std::string deviceProfile;
    double dpi = 0.0;
    /// @brief ISO-8601 UTC timestamp with 'Z' suffix.
    std::string createdAt;
    std::map<std::string, std::string> attributes;

    [[nodiscard]] Bytes serialize() const;
    [[nodiscard]] static Manifest parse(ByteSpan data);

    bool operator==(const Manifest&) const = default;
};

// =============================================================================
// Index
// =============================================================================

/// @brief Summary derived from the channel files actually on disk.
struct Index {
    std::uint64_t touchSamples = 0;
    std::uint64_t accSamples = 0;
    std::uint64_t gyroSamples = 0;
    double durationSeconds = 0.0;
    std::vector<Checksum> checksums;

    [[nodiscard]] Bytes serialize() const;
    [[nodiscard]] static Index parse(ByteSpan data);

    bool operator==(const Index&) const = default;
};

// =============================================================================
// Channels
// =============================================================================

/// @brief Touch samples: position, pressure and contact size per timestamp.
struct TouchChannel {
    static constexpr ChannelKind kKind = ChannelKind::kTouch;
    static constexpr std::string_view kMessageName = "TouchChannel";

    std::vector<TimestampUs> t;
    std::vector<float> x;
    std::vector<float> y;
    std::vector<float> pressure;
    std::vector<float> size;

    /// @brief Number of samples (length of t).
    [[nodiscard]] std::size_t sampleCount() const noexcept { return t.size(); }

    /// @brief Throw ColumnLengthMismatchError unless all columns match.
    void validateColumns() const;

    [[nodiscard]] Bytes serialize() const;
    [[nodiscard]] static TouchChannel parse(ByteSpan data);

    bool operator==(const TouchChannel&) const = default;
};

/// @brief Three-axis inertial samples. Instantiated once per sensor so the
///        accelerometer and gyroscope stay distinct types.
template <ChannelKind Kind>
struct AxisChannel {
    static constexpr ChannelKind kKind = Kind;
    static constexpr std::string_view kMessageName =
        Kind == ChannelKind::kAccelerometer ? "AccChannel" : "GyroChannel";

    std::vector<TimestampUs> t;
    std::vector<float> x;
    std::vector<float> y;
    std::vector<float> z;

    [[nodiscard]] std::size_t sampleCount() const noexcept { return t.size(); }

    void validateColumns() const;

    [[nodiscard]] Bytes serialize() const;
    [[nodiscard]] static AxisChannel parse(ByteSpan data);

    bool operator==(const AxisChannel&) const = default;
};

using AccChannel = AxisChannel<ChannelKind::kAccelerometer>;
using GyroChannel = AxisChannel<ChannelKind::kGyroscope>;

extern template struct AxisChannel<ChannelKind::kAccelerometer>;
extern template struct AxisChannel<ChannelKind::kGyroscope>;

/// @brief Compile-time mapping from channel kind to its message type.
template <ChannelKind Kind>
struct ChannelTraits;

template <>
struct ChannelTraits<ChannelKind::kTouch> {
    using Type = TouchChannel;
};

template <>
struct ChannelTraits<ChannelKind::kAccelerometer> {
    using Type = AccChannel;
};

template <>
struct ChannelTraits<ChannelKind::kGyroscope> {
    using Type = GyroChannel;
};

template <ChannelKind Kind>
using ChannelType = typename ChannelTraits<Kind>::Type;

/// @brief Satisfied by the three channel message types.
template <typename T>
concept ChannelMessage = requires(const T& channel) {
    { T::kKind } -> std::convertible_to<ChannelKind>;
    { channel.sampleCount() } -> std::convertible_to<std::size_t>;
    channel.validateColumns();
    { channel.t } -> std::convertible_to<const std::vector<TimestampUs>&>;
};

// =============================================================================
// Closed Message Set
// =============================================================================

/// @brief Discriminator for the six RCP message kinds.
enum class MessageKind : std::uint8_t {
    kChecksum,
    kManifest,
    kIndex,
    kTouchChannel,
    kAccChannel,
    kGyroChannel
};

/// @brief Any RCP message.
using Message = std::variant<Checksum, Manifest, Index, TouchChannel, AccChannel, GyroChannel>;

[[nodiscard]] std::string_view messageKindName(MessageKind kind) noexcept;

/// @brief Kind of the message currently held.
[[nodiscard]] MessageKind messageKindOf(const Message& message) noexcept;

/// @brief Serialize whichever message is held.
[[nodiscard]] Bytes serializeMessage(const Message& message);

/// @brief Parse bytes as the given message kind.
[[nodiscard]] Message parseMessage(MessageKind kind, ByteSpan data);

/// @brief Timestamp span of a channel in seconds.
/// @note Empty: 0. Single sample: t[0] / 1e6. Otherwise (last - first) / 1e6.
[[nodiscard]] double channelDurationSeconds(const std::vector<TimestampUs>& t) noexcept;

}  // namespace rcp::format

#endif  // RCP_FORMAT_RCP_MESSAGES_H
