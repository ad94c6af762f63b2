// ==============================================================================
// Layer 1: Frame Codec
// comment_tag.h - Identification of metadata tags embedded in MP3 streams
// ==============================================================================
// Size detectors share one convention:
//   > 0  the data starts with a tag of that many bytes
//   0    the data does not start with this tag
//   -1   more data is needed to decide (never returned once eof is set)
// ==============================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace Taper::Mp3 {

enum class TagType : uint8_t {
    None = 0,
    Id3v2,
    Id3v1,
    Apev2,
    Lyrics3v2,
    Lyrics3v1
};

inline constexpr int64_t kTagNeedMoreData = -1;

/// ID3v1 tags are always this long
inline constexpr int64_t kId3v1Size = 128;

/// Lyrics3 v1 body limit plus header and footer
inline constexpr int64_t kLyrics3v1MaxSize = 5100 + 20;

[[nodiscard]] constexpr std::string_view tagTypeName(TagType type) noexcept {
    switch (type) {
        case TagType::Id3v2: return "ID3v2";
        case TagType::Id3v1: return "ID3v1";
        case TagType::Apev2: return "APEv2";
        case TagType::Lyrics3v2: return "Lyrics3v2";
        case TagType::Lyrics3v1: return "Lyrics3v1";
        case TagType::None: break;
    }
    return "none";
}

struct TagMatch {
    TagType type = TagType::None;
    int64_t size = 0;
};

namespace detail {

[[nodiscard]] constexpr bool startsWith(std::span<const uint8_t> data, std::string_view prefix,
                                        size_t offset = 0) noexcept {
    if (offset + prefix.size() > data.size()) {
        return false;
    }
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (data[offset + i] != static_cast<uint8_t>(prefix[i])) {
            return false;
        }
    }
    return true;
}

/// True if the available bytes contradict @p prefix
[[nodiscard]] constexpr bool rulesOut(std::span<const uint8_t> data, std::string_view prefix) noexcept {
    const size_t n = (data.size() < prefix.size()) ? data.size() : prefix.size();
    return !startsWith(data.first(n), prefix.substr(0, n));
}

/// Decimal digits at [pos, pos+len), or -1 if any byte is not a digit
[[nodiscard]] constexpr int64_t parseDigits(std::span<const uint8_t> data, size_t pos, size_t len) noexcept {
    int64_t value = 0;
    for (size_t i = pos; i < pos + len; ++i) {
        const uint8_t ch = data[i];
        if (ch < '0' || ch > '9') {
            return -1;
        }
        value = value * 10 + (ch - '0');
    }
    return value;
}

[[nodiscard]] constexpr bool isUpper(uint8_t ch) noexcept {
    return ch >= 'A' && ch <= 'Z';
}

} // namespace detail

// =============================================================================
// Individual Tag Detectors
// =============================================================================

/// ID3v2: "ID3", version, flags, 4-byte synchsafe size (+10 header, +10 footer)
[[nodiscard]] constexpr int64_t id3v2Size(std::span<const uint8_t> data) noexcept {
    if (detail::rulesOut(data, "ID3")) {
        return 0;
    }
    if (data.size() < 10) {
        return kTagNeedMoreData;
    }
    if (data[3] == 0xFF || data[4] == 0xFF) {
        return 0;
    }
    for (size_t i = 6; i < 10; ++i) {
        if (data[i] >= 0x80) {
            return 0;
        }
    }

    int64_t size = 10;
    size += (static_cast<int64_t>(data[6]) << 21) + (static_cast<int64_t>(data[7]) << 14) +
            (static_cast<int64_t>(data[8]) << 7) + data[9];
    if (data[5] & 0x10) {
        size += 10;  // footer present
    }
    return size;
}

/// @brief ID3v1: exactly the last 128 bytes of the stream, starting with "TAG".
///
/// Only recognized once @p eof confirms nothing follows the 128 bytes.
/// @param offset Where the candidate tag starts within @p data
[[nodiscard]] constexpr int64_t id3v1Size(std::span<const uint8_t> data, bool eof,
                                          size_t offset = 0) noexcept {
    if (offset > data.size()) {
        return 0;
    }
    const auto tail = data.subspan(offset);
    if (detail::rulesOut(tail, "TAG")) {
        return 0;
    }
    const auto available = static_cast<int64_t>(tail.size());
    if (available == kId3v1Size && eof) {
        return kId3v1Size;
    }
    // until EOF is seen, even a full 128 bytes may not be the end of the file
    if (available <= kId3v1Size && !eof) {
        return kTagNeedMoreData;
    }
    return 0;
}

/// APEv2: 32-byte "APETAGEX" header, little-endian size excludes the header
[[nodiscard]] constexpr int64_t apev2Size(std::span<const uint8_t> data) noexcept {
    if (detail::rulesOut(data, "APETAGEX")) {
        return 0;
    }
    if (data.size() < 16) {
        return kTagNeedMoreData;
    }
    const uint32_t size = static_cast<uint32_t>(data[12]) |
                          (static_cast<uint32_t>(data[13]) << 8) |
                          (static_cast<uint32_t>(data[14]) << 16) |
                          (static_cast<uint32_t>(data[15]) << 24);
    return 32 + static_cast<int64_t>(size);
}

/// Lyrics3 v2: "LYRICSBEGIN", fields "XXX00000data", size field, "LYRICS200"
[[nodiscard]] constexpr int64_t lyrics3v2Size(std::span<const uint8_t> data) noexcept {
    if (detail::rulesOut(data, "LYRICSBEGIN")) {
        return 0;
    }

    size_t pos = 11;
    bool foundEnd = false;
    while (pos + 8 < data.size()) {
        if (pos >= 0x80000) {
            return 0;
        }
        if (detail::isUpper(data[pos]) && detail::isUpper(data[pos + 1]) &&
            detail::isUpper(data[pos + 2])) {
            const int64_t fieldSize = detail::parseDigits(data, pos + 3, 5);
            if (fieldSize < 0) {
                return 0;
            }
            pos += static_cast<size_t>(fieldSize) + 8;
            continue;
        }

        // six-digit size of everything before it marks the end of the fields
        const int64_t tagSize = detail::parseDigits(data, pos, 6);
        if (tagSize < 0 || static_cast<size_t>(tagSize) != pos) {
            return 0;
        }
        pos += 6;
        foundEnd = true;
        break;
    }

    if (!foundEnd || pos + 9 > data.size()) {
        return kTagNeedMoreData;
    }
    return detail::startsWith(data, "LYRICS200", pos) ? static_cast<int64_t>(pos + 9) : 0;
}

/// Lyrics3 v1: "LYRICSBEGIN" ... "LYRICSEND", located just before EOF or an ID3v1 tag
[[nodiscard]] constexpr int64_t lyrics3v1Size(std::span<const uint8_t> data, bool eof) noexcept {
    if (detail::rulesOut(data, "LYRICSBEGIN")) {
        return 0;
    }

    auto length = static_cast<int64_t>(data.size());
    if (length > kLyrics3v1MaxSize + kId3v1Size) {
        return 0;
    }
    if (!eof) {
        return kTagNeedMoreData;
    }
    if (length < 20) {
        return 0;
    }
    if (length >= kId3v1Size + 20 &&
        id3v1Size(data, eof, static_cast<size_t>(length - kId3v1Size)) == kId3v1Size) {
        length -= kId3v1Size;
    }

    return detail::startsWith(data, "LYRICSEND", static_cast<size_t>(length - 9)) ? length : 0;
}

// =============================================================================
// Combined Detection
// =============================================================================

/// @brief Identify the tag at the start of @p data.
/// @param eof True if @p data runs to the end of the stream
/// @return Tag type and size; type None with size 0 (not a tag) or -1 (need data)
[[nodiscard]] constexpr TagMatch identifyTag(std::span<const uint8_t> data, bool eof) noexcept {
    const int64_t v2 = id3v2Size(data);
    if (v2 > 0) {
        return {TagType::Id3v2, v2};
    }
    const int64_t v1 = id3v1Size(data, eof);
    if (v1 > 0) {
        return {TagType::Id3v1, v1};
    }
    const int64_t ape = apev2Size(data);
    if (ape > 0) {
        return {TagType::Apev2, ape};
    }
    const int64_t lyrics2 = lyrics3v2Size(data);
    if (lyrics2 > 0) {
        return {TagType::Lyrics3v2, lyrics2};
    }
    const int64_t lyrics1 = lyrics3v1Size(data, eof);
    if (lyrics1 > 0) {
        return {TagType::Lyrics3v1, lyrics1};
    }

    if (eof) {
        return {};
    }
    const bool needMore = v2 < 0 || v1 < 0 || ape < 0 || lyrics2 < 0 || lyrics1 < 0;
    return {TagType::None, needMore ? kTagNeedMoreData : 0};
}

} // namespace Taper::Mp3
