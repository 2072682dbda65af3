#ifndef INCLUDE_COKACENC_CORE_CHUNKNAME_HPP
#define INCLUDE_COKACENC_CORE_CHUNKNAME_HPP

#include "cokacenc/crypto/Md5Digest.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cokacenc::core
{

constexpr std::string_view g_chunkSuffix{ ".cokacenc" };
constexpr std::string_view g_splitMarker{ "SPLTD" };
constexpr std::string_view g_provisionalChunkSuffix{ ".cokacenc-partial" };

constexpr std::size_t g_fnHashChars{ 5U };
constexpr std::size_t g_contentHashChars{ 8U };
constexpr std::size_t g_sequenceLabelChars{ 4U };

constexpr std::uint32_t g_sequenceRadix{ 26U };
constexpr std::uint32_t g_maxChunkCount{ g_sequenceRadix * g_sequenceRadix * g_sequenceRadix * g_sequenceRadix };
constexpr std::uint32_t g_maxChunkIndex{ g_maxChunkCount - 1U };

// Metadata carried by a chunk filename.
//   single: <fnHash5>.<contentHash8>.<originalName>.cokacenc
//   split:  <fnHash5>.SPLTD.<contentHash8>.<seq4>.<originalName>.cokacenc
struct ChunkName final
{
    std::string fnHash5;
    std::string contentHash8;
    std::optional<std::uint32_t> sequence;
    std::string originalName;

    [[nodiscard]] bool isSplit() const noexcept
    {
        return sequence.has_value();
    }
};

// 0 -> "aaaa", 1 -> "aaab", 26 -> "aaba". std::nullopt past "zzzz".
[[nodiscard]] std::optional<std::string> sequenceLabel(std::uint32_t index);

// Inverse of sequenceLabel; rejects anything outside [a-z]{4}.
[[nodiscard]] std::optional<std::uint32_t> parseSequenceLabel(std::string_view label) noexcept;

// First 5 lowercase hex characters of MD5(originalName).
[[nodiscard]] std::string fileNameFingerprint(std::string_view originalName);

// First 8 lowercase hex characters of a whole-file MD5.
[[nodiscard]] std::string contentFingerprint(const cokacenc::crypto::Md5Value& digest);

// A basename that can round-trip through a chunk name: non-empty, not "." or "..", no '/' or NUL.
[[nodiscard]] bool isValidOriginalName(std::string_view originalName) noexcept;

// Throws std::invalid_argument on malformed fields and std::out_of_range past the last sequence label.
[[nodiscard]] std::string encodeChunkName(std::string_view originalName, std::string_view contentHash8,
                                          std::string_view fnHash5, std::optional<std::uint32_t> sequence);

[[nodiscard]] std::string encodeChunkName(const ChunkName& name);

// Strict; anything that is not exactly one of the two grammars, or whose fnHash5 does not match the decoded
// name, yields std::nullopt.
[[nodiscard]] std::optional<ChunkName> decodeChunkName(std::string_view fileName);

// Hidden name a chunk is written under before the content hash is known.
[[nodiscard]] std::string provisionalChunkName(std::string_view fnHash5, std::uint32_t index,
                                               std::string_view originalName);

} // namespace cokacenc::core

#endif // INCLUDE_COKACENC_CORE_CHUNKNAME_HPP
