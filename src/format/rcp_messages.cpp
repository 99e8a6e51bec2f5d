// =============================================================================
// rcp-packager - RCP Message Codec Implementation
// =============================================================================

#include "rcp/format/rcp_messages.h"

#include <algorithm>
#include <set>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "rcp/format/wire_codec.h"

namespace rcp::format {

using wire::Tag;
using wire::WireReader;
using wire::WireType;

namespace {

// Field numbers
constexpr std::uint32_t kChecksumPath = 1;
constexpr std::uint32_t kChecksumSha256 = 2;

constexpr std::uint32_t kManifestVersion = 1;
constexpr std::uint32_t kManifestPackageId = 2;
constexpr std::uint32_t kManifestSource = 3;
constexpr std::uint32_t kManifestDeviceProfile = 4;
constexpr std::uint32_t kManifestDpi = 5;
constexpr std::uint32_t kManifestCreatedAt = 6;
constexpr std::uint32_t kManifestAttributes = 7;

constexpr std::uint32_t kEntryKey = 1;
constexpr std::uint32_t kEntryValue = 2;

constexpr std::uint32_t kIndexTouchSamples = 1;
constexpr std::uint32_t kIndexAccSamples = 2;
constexpr std::uint32_t kIndexGyroSamples = 3;
constexpr std::uint32_t kIndexDuration = 4;
constexpr std::uint32_t kIndexChecksums = 5;

constexpr std::uint32_t kColumnT = 1;
constexpr std::uint32_t kColumnX = 2;
constexpr std::uint32_t kColumnY = 3;
constexpr std::uint32_t kColumnPressure = 4;  // Touch
constexpr std::uint32_t kColumnZ = 4;         // Acc / Gyro
constexpr std::uint32_t kColumnSize = 5;

/// @brief Check the wire type of a tag whose field number is known.
void expectWireType(std::string_view messageName, const Tag& tag, WireType expected,
                    std::size_t tagOffset) {
    if (tag.wireType != static_cast<std::uint32_t>(expected)) {
        throw WireTypeMismatchError(messageName, tag.fieldNumber,
                                    static_cast<std::uint32_t>(expected), tag.wireType,
                                    ErrorContext().withOffset(tagOffset));
    }
}

[[noreturn]] void throwUnknownField(std::string_view messageName, const Tag& tag,
                                    std::size_t tagOffset) {
    throw UnknownFieldError(messageName, tag.fieldNumber, ErrorContext().withOffset(tagOffset));
}

void appendStringField(Bytes& out, std::uint32_t field, const std::string& value) {
    if (value.empty()) {
        return;
    }
    wire::appendTag(out, field, WireType::kLengthDelimited);
    wire::appendLengthDelimited(out, std::string_view(value));
}

void appendTimestampColumn(Bytes& out, std::uint32_t field,
                           const std::vector<TimestampUs>& column) {
    for (TimestampUs value : column) {
        wire::appendTag(out, field, WireType::kVarint);
        wire::appendVarint(out, value);
    }
}

void appendFloatColumn(Bytes& out, std::uint32_t field, const std::vector<float>& column) {
    for (float value : column) {
        wire::appendTag(out, field, WireType::kFixed32);
        wire::appendFloat(out, value);
    }
}

/// @brief Throw ColumnLengthMismatchError listing the distinct lengths.
void ensureLengthsMatch(std::string_view messageName,
                        std::initializer_list<std::size_t> lengths) {
    std::set<std::size_t> distinct(lengths.begin(), lengths.end());
    if (distinct.size() > 1) {
        throw ColumnLengthMismatchError(
            fmt::format("{}: mismatched column lengths: [{}]", messageName,
                        fmt::join(distinct, ", ")));
    }
}

std::pair<std::string, std::string> parseAttributeEntry(ByteSpan data) {
    constexpr std::string_view kEntryName = "Manifest.AttributesEntry";
    std::string key;
    std::string value;

    WireReader reader(data);
    while (!reader.atEnd()) {
        const std::size_t tagOffset = reader.position();
        const Tag tag = reader.readTag();
        switch (tag.fieldNumber) {
            case kEntryKey:
                expectWireType(kEntryName, tag, WireType::kLengthDelimited, tagOffset);
                key = reader.readString();
                break;
            case kEntryValue:
                expectWireType(kEntryName, tag, WireType::kLengthDelimited, tagOffset);
                value = reader.readString();
                break;
            default:
                throwUnknownField(kEntryName, tag, tagOffset);
        }
    }
    return {std::move(key), std::move(value)};
}

}  // namespace

// =============================================================================
// Checksum
// =============================================================================

Bytes Checksum::serialize() const {
    Bytes out;
    appendStringField(out, kChecksumPath, path);
    appendStringField(out, kChecksumSha256, sha256);
    return out;
}

Checksum Checksum::parse(ByteSpan data) {
    constexpr std::string_view kName = "Checksum";
    Checksum result;

    WireReader reader(data);
    while (!reader.atEnd()) {
        const std::size_t tagOffset = reader.position();
        const Tag tag = reader.readTag();
        switch (tag.fieldNumber) {
            case kChecksumPath:
                expectWireType(kName, tag, WireType::kLengthDelimited, tagOffset);
                result.path = reader.readString();
                break;
            case kChecksumSha256:
                expectWireType(kName, tag, WireType::kLengthDelimited, tagOffset);
                result.sha256 = reader.readString();
                break;
            default:
                throwUnknownField(kName, tag, tagOffset);
        }
    }
    return result;
}

// =============================================================================
// Manifest
// =============================================================================

Bytes Manifest::serialize() const {
    Bytes out;
    appendStringField(out, kManifestVersion, version);
    appendStringField(out, kManifestPackageId, packageId);
    appendStringField(out, kManifestSource, source);
    appendStringField(out, kManifestDeviceProfile, deviceProfile);
    if (dpi != 0.0) {
        wire::appendTag(out, kManifestDpi, WireType::kFixed64);
        wire::appendDouble(out, dpi);
    }
    appendStringField(out, kManifestCreatedAt, createdAt);

    Bytes entry;
    for (const auto& [key, value] : attributes) {
        entry.clear();
        wire::appendTag(entry, kEntryKey, WireType::kLengthDelimited);
        wire::appendLengthDelimited(entry, std::string_view(key));
        wire::appendTag(entry, kEntryValue, WireType::kLengthDelimited);
        wire::appendLengthDelimited(entry, std::string_view(value));

        wire::appendTag(out, kManifestAttributes, WireType::kLengthDelimited);
        wire::appendLengthDelimited(out, ByteSpan(entry));
    }
    return out;
}

Manifest Manifest::parse(ByteSpan data) {
    constexpr std::string_view kName = "Manifest";
    Manifest result;

    WireReader reader(data);
    while (!reader.atEnd()) {
        const std::size_t tagOffset = reader.position();
        const Tag tag = reader.readTag();
        switch (tag.fieldNumber) {
            case kManifestVersion:
                expectWireType(kName, tag, WireType::kLengthDelimited, tagOffset);
                result.version = reader.readString();
                break;
            case kManifestPackageId:
                expectWireType(kName, tag, WireType::kLengthDelimited, tagOffset);
                result.packageId = reader.readString();
                break;
            case kManifestSource:
                expectWireType(kName, tag, WireType::kLengthDelimited, tagOffset);
                result.source = reader.readString();
                break;
            case kManifestDeviceProfile:
                expectWireType(kName, tag, WireType::kLengthDelimited, tagOffset);
                result.deviceProfile = reader.readString();
                break;
            case kManifestDpi:
                expectWireType(kName, tag, WireType::kFixed64, tagOffset);
                result.dpi = reader.readDouble();
                break;
            case kManifestCreatedAt:
                expectWireType(kName, tag, WireType::kLengthDelimited, tagOffset);
                result.createdAt = reader.readString();
                break;
            case kManifestAttributes: {
                expectWireType(kName, tag, WireType::kLengthDelimited, tagOffset);
                auto [key, value] = parseAttributeEntry(reader.readBytes());
                // Entries without a key carry nothing addressable
                if (!key.empty()) {
                    result.attributes[std::move(key)] = std::move(value);
                }
                break;
            }
            default:
                throwUnknownField(kName, tag, tagOffset);
        }
    }
    return result;
}

// =============================================================================
// Index
// =============================================================================

Bytes Index::serialize() const {
    Bytes out;
    const std::pair<std::uint32_t, std::uint64_t> counts[] = {
        {kIndexTouchSamples, touchSamples},
        {kIndexAccSamples, accSamples},
        {kIndexGyroSamples, gyroSamples},
    };
    for (const auto& [field, value] : counts) {
        if (value != 0) {
            wire::appendTag(out, field, WireType::kVarint);
            wire::appendVarint(out, value);
        }
    }
    if (durationSeconds != 0.0) {
        wire::appendTag(out, kIndexDuration, WireType::kFixed64);
        wire::appendDouble(out, durationSeconds);
    }
    for (const auto& checksum : checksums) {
        wire::appendTag(out, kIndexChecksums, WireType::kLengthDelimited);
        wire::appendLengthDelimited(out, ByteSpan(checksum.serialize()));
    }
    return out;
}

Index Index::parse(ByteSpan data) {
    constexpr std::string_view kName = "Index";
    Index result;

    WireReader reader(data);
    while (!reader.atEnd()) {
        const std::size_t tagOffset = reader.position();
        const Tag tag = reader.readTag();
        switch (tag.fieldNumber) {
            case kIndexTouchSamples:
                expectWireType(kName, tag, WireType::kVarint, tagOffset);
                result.touchSamples = reader.readVarint();
                break;
            case kIndexAccSamples:
                expectWireType(kName, tag, WireType::kVarint, tagOffset);
                result.accSamples = reader.readVarint();
                break;
            case kIndexGyroSamples:
                expectWireType(kName, tag, WireType::kVarint, tagOffset);
                result.gyroSamples = reader.readVarint();
                break;
            case kIndexDuration:
                expectWireType(kName, tag, WireType::kFixed64, tagOffset);
                result.durationSeconds = reader.readDouble();
                break;
            case kIndexChecksums:
                expectWireType(kName, tag, WireType::kLengthDelimited, tagOffset);
                result.checksums.push_back(Checksum::parse(reader.readBytes()));
                break;
            default:
                throwUnknownField(kName, tag, tagOffset);
        }
    }
    return result;
}

// =============================================================================
// TouchChannel
// =============================================================================

void TouchChannel::validateColumns() const {
    ensureLengthsMatch(kMessageName, {t.size(), x.size(), y.size(), pressure.size(), size.size()});
}

Bytes TouchChannel::serialize() const {
    validateColumns();

    Bytes out;
    // 2-byte tag+varint estimate for t, 5 bytes per float column entry
    out.reserve(t.size() * (4 + 4 * 5));
    appendTimestampColumn(out, kColumnT, t);
    appendFloatColumn(out, kColumnX, x);
    appendFloatColumn(out, kColumnY, y);
    appendFloatColumn(out, kColumnPressure, pressure);
    appendFloatColumn(out, kColumnSize, size);
    return out;
}

TouchChannel TouchChannel::parse(ByteSpan data) {
    TouchChannel result;

    WireReader reader(data);
    while (!reader.atEnd()) {
        const std::size_t tagOffset = reader.position();
        const Tag tag = reader.readTag();
        switch (tag.fieldNumber) {
            case kColumnT:
                expectWireType(kMessageName, tag, WireType::kVarint, tagOffset);
                result.t.push_back(reader.readVarint());
                break;
            case kColumnX:
                expectWireType(kMessageName, tag, WireType::kFixed32, tagOffset);
                result.x.push_back(reader.readFloat());
                break;
            case kColumnY:
                expectWireType(kMessageName, tag, WireType::kFixed32, tagOffset);
                result.y.push_back(reader.readFloat());
                break;
            case kColumnPressure:
                expectWireType(kMessageName, tag, WireType::kFixed32, tagOffset);
                result.pressure.push_back(reader.readFloat());
                break;
            case kColumnSize:
                expectWireType(kMessageName, tag, WireType::kFixed32, tagOffset);
                result.size.push_back(reader.readFloat());
                break;
            default:
                throwUnknownField(kMessageName, tag, tagOffset);
        }
    }

    result.validateColumns();
    return result;
}

// =============================================================================
// AxisChannel
// =============================================================================

template <ChannelKind Kind>
void AxisChannel<Kind>::validateColumns() const {
    ensureLengthsMatch(kMessageName, {t.size(), x.size(), y.size(), z.size()});
}

template <ChannelKind Kind>
Bytes AxisChannel<Kind>::serialize() const {
    validateColumns();

    Bytes out;
    out.reserve(t.size() * (4 + 3 * 5));
    appendTimestampColumn(out, kColumnT, t);
    appendFloatColumn(out, kColumnX, x);
    appendFloatColumn(out, kColumnY, y);
    appendFloatColumn(out, kColumnZ, z);
    return out;
}

template <ChannelKind Kind>
AxisChannel<Kind> AxisChannel<Kind>::parse(ByteSpan data) {
    AxisChannel result;

    WireReader reader(data);
    while (!reader.atEnd()) {
        const std::size_t tagOffset = reader.position();
        const Tag tag = reader.readTag();
        switch (tag.fieldNumber) {
            case kColumnT:
                expectWireType(kMessageName, tag, WireType::kVarint, tagOffset);
                result.t.push_back(reader.readVarint());
                break;
            case kColumnX:
                expectWireType(kMessageName, tag, WireType::kFixed32, tagOffset);
                result.x.push_back(reader.readFloat());
                break;
            case kColumnY:
                expectWireType(kMessageName, tag, WireType::kFixed32, tagOffset);
                result.y.push_back(reader.readFloat());
                break;
            case kColumnZ:
                expectWireType(kMessageName, tag, WireType::kFixed32, tagOffset);
                result.z.push_back(reader.readFloat());
                break;
            default:
                throwUnknownField(kMessageName, tag, tagOffset);
        }
    }

    result.validateColumns();
    return result;
}

template struct AxisChannel<ChannelKind::kAccelerometer>;
template struct AxisChannel<ChannelKind::kGyroscope>;

// =============================================================================
// Closed Message Set
// =============================================================================

std::string_view messageKindName(MessageKind kind) noexcept {
    switch (kind) {
        case MessageKind::kChecksum:
            return "Checksum";
        case MessageKind::kManifest:
            return "Manifest";
        case MessageKind::kIndex:
            return "Index";
        case MessageKind::kTouchChannel:
            return TouchChannel::kMessageName;
        case MessageKind::kAccChannel:
            return AccChannel::kMessageName;
        case MessageKind::kGyroChannel:
            return GyroChannel::kMessageName;
    }
    return "Unknown";
}

MessageKind messageKindOf(const Message& message) noexcept {
    return static_cast<MessageKind>(message.index());
}

Bytes serializeMessage(const Message& message) {
    return std::visit([](const auto& held) { return held.serialize(); }, message);
}

Message parseMessage(MessageKind kind, ByteSpan data) {
    switch (kind) {
        case MessageKind::kChecksum:
            return Checksum::parse(data);
        case MessageKind::kManifest:
            return Manifest::parse(data);
        case MessageKind::kIndex:
            return Index::parse(data);
        case MessageKind::kTouchChannel:
            return TouchChannel::parse(data);
        case MessageKind::kAccChannel:
            return AccChannel::parse(data);
        case MessageKind::kGyroChannel:
            return GyroChannel::parse(data);
    }
    throw UsageError("Unknown message kind: " +
                     std::to_string(static_cast<unsigned>(kind)));
}

double channelDurationSeconds(const std::vector<TimestampUs>& t) noexcept {
    if (t.empty()) {
        return 0.0;
    }
    if (t.size() == 1) {
        return static_cast<double>(t.front()) / kMicrosPerSecond;
    }
    // Signed difference so a non-monotonic channel yields a negative span
    const auto span = static_cast<double>(static_cast<std::int64_t>(t.back() - t.front()));
    return span / kMicrosPerSecond;
}

}  // namespace rcp::format
