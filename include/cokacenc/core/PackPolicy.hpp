#ifndef INCLUDE_COKACENC_CORE_PACKPOLICY_HPP
#define INCLUDE_COKACENC_CORE_PACKPOLICY_HPP

#include "cokacenc/core/ChunkErrors.hpp"
#include "cokacenc/core/ChunkHeader.hpp"
#include "cokacenc/crypto/ICryptoProvider.hpp"
#include "cokacenc/crypto/KdfParams.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>

namespace cokacenc::core
{

constexpr std::uint64_t g_kBytesPerMiB{ 1024U * 1024U };
constexpr std::uint64_t g_kDefaultChunkMiB{ 1800U };
constexpr std::uint64_t g_kDefaultChunkBytes{ g_kDefaultChunkMiB * g_kBytesPerMiB };

// 0 means "never split".
constexpr std::uint64_t g_kUnboundedChunkBytes{ 0U };

constexpr std::size_t g_kIoBufferBytes{ 64U * 1024U };

struct PackOptions final
{
    std::uint64_t chunkBytes{ g_kDefaultChunkBytes };
    bool deleteOriginal{ false };
    cokacenc::crypto::Pbkdf2Params kdf{ cokacenc::crypto::g_kPbkdf2DefaultParams };
};

struct UnpackOptions final
{
    bool deleteChunks{ false };
    cokacenc::crypto::Pbkdf2Params kdf{ cokacenc::crypto::g_kPbkdf2DefaultParams };
};

// 0, or at least one AES block.
[[nodiscard]] bool isValidChunkBytes(std::uint64_t chunkBytes) noexcept;

// Budget rounded down to whole AES blocks; intermediate chunks are finalized without padding. 0 stays 0.
[[nodiscard]] std::uint64_t alignedChunkBytes(std::uint64_t chunkBytes) noexcept;

[[nodiscard]] bool isValidKdfParams(const cokacenc::crypto::Pbkdf2Params& params) noexcept;

// std::nullopt when the options are usable.
[[nodiscard]] std::optional<ChunkError> validatePackOptions(const PackOptions& options) noexcept;

[[nodiscard]] std::optional<ChunkError> validateUnpackOptions(const UnpackOptions& options) noexcept;

// Converts a --size value in MiB; std::nullopt on overflow.
[[nodiscard]] std::optional<std::uint64_t> chunkBytesFromMiB(std::uint64_t mib) noexcept;

// Fresh random salt and IV for one chunk. std::nullopt if the random source fails.
[[nodiscard]] std::optional<ChunkHeader> makeChunkHeader(cokacenc::crypto::ICryptoProvider& crypto) noexcept;

} // namespace cokacenc::core

#endif // INCLUDE_COKACENC_CORE_PACKPOLICY_HPP
