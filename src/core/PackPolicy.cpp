#include "cokacenc/core/PackPolicy.hpp"
#include <limits>
#include <span>

namespace cokacenc::core
{

[[nodiscard]] bool isValidChunkBytes(std::uint64_t chunkBytes) noexcept
{
    if (chunkBytes == g_kUnboundedChunkBytes)
    {
        return true;
    }
    return chunkBytes >= cokacenc::crypto::g_aesBlockBytes;
}

[[nodiscard]] std::uint64_t alignedChunkBytes(std::uint64_t chunkBytes) noexcept
{
    return chunkBytes - (chunkBytes % cokacenc::crypto::g_aesBlockBytes);
}

[[nodiscard]] bool isValidKdfParams(const cokacenc::crypto::Pbkdf2Params& params) noexcept
{
    return params.iterations != 0U && params.iterations <= cokacenc::crypto::g_kPbkdf2MaxIterations;
}

[[nodiscard]] std::optional<ChunkError> validatePackOptions(const PackOptions& options) noexcept
{
    if (!isValidChunkBytes(options.chunkBytes))
    {
        return ChunkError::InvalidChunkSize;
    }
    if (!isValidKdfParams(options.kdf))
    {
        return ChunkError::CryptoError;
    }
    return std::nullopt;
}

[[nodiscard]] std::optional<ChunkError> validateUnpackOptions(const UnpackOptions& options) noexcept
{
    if (!isValidKdfParams(options.kdf))
    {
        return ChunkError::CryptoError;
    }
    return std::nullopt;
}

[[nodiscard]] std::optional<std::uint64_t> chunkBytesFromMiB(std::uint64_t mib) noexcept
{
    if (mib > std::numeric_limits<std::uint64_t>::max() / g_kBytesPerMiB)
    {
        return std::nullopt;
    }
    return mib * g_kBytesPerMiB;
}

[[nodiscard]] std::optional<ChunkHeader> makeChunkHeader(cokacenc::crypto::ICryptoProvider& crypto) noexcept
{
    ChunkHeader header{};
    header.version = g_chunkFormatVersionCurrent;

    if (!crypto.randomBytes(std::span<std::uint8_t>{ header.salt }))
    {
        return std::nullopt;
    }
    if (!crypto.randomBytes(std::span<std::uint8_t>{ header.iv }))
    {
        return std::nullopt;
    }
    return header;
}

} // namespace cokacenc::core
