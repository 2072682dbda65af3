#ifndef INCLUDE_COKACENC_CORE_CHUNKHEADER_HPP
#define INCLUDE_COKACENC_CORE_CHUNKHEADER_HPP

#include "cokacenc/crypto/ICryptoProvider.hpp"
#include "cokacenc/crypto/KdfParams.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <variant>

namespace cokacenc::core
{

constexpr std::string_view g_chunkMagic{ "COKACENC" };
constexpr std::size_t g_chunkMagicBytes{ 8U };
constexpr std::uint32_t g_chunkFormatVersionV1{ 1U };
constexpr std::uint32_t g_chunkFormatVersionCurrent{ g_chunkFormatVersionV1 };

// magic | version (u32 LE) | salt | iv
constexpr std::size_t g_chunkHeaderBytes{ g_chunkMagicBytes + 4U + cokacenc::crypto::g_pbkdf2SaltBytes +
                                          cokacenc::crypto::g_aesIvBytes };
static_assert(g_chunkHeaderBytes == 44U);

struct ChunkHeader final
{
    std::uint32_t version{ g_chunkFormatVersionCurrent };
    std::array<std::uint8_t, cokacenc::crypto::g_pbkdf2SaltBytes> salt{};
    std::array<std::uint8_t, cokacenc::crypto::g_aesIvBytes> iv{};
};

enum class HeaderError : std::uint8_t
{
    Truncated,
    BadMagic,
    UnsupportedVersion,
};

[[nodiscard]] std::array<std::byte, g_chunkHeaderBytes> encodeChunkHeader(const ChunkHeader& header) noexcept;

// Reads the first g_chunkHeaderBytes of `bytes`; anything after them is ignored.
[[nodiscard]] std::variant<ChunkHeader, HeaderError> decodeChunkHeader(std::span<const std::byte> bytes) noexcept;

} // namespace cokacenc::core

#endif // INCLUDE_COKACENC_CORE_CHUNKHEADER_HPP
