#ifndef INCLUDE_COKACENC_CORE_CHUNKSERVICE_HPP
#define INCLUDE_COKACENC_CORE_CHUNKSERVICE_HPP

#include "cokacenc/core/ChunkErrors.hpp"
#include "cokacenc/core/ChunkName.hpp"
#include "cokacenc/core/ChunkStreamer.hpp"
#include "cokacenc/core/PackPolicy.hpp"
#include "cokacenc/crypto/ICryptoProvider.hpp"
#include "cokacenc/security/SecureMemory.hpp"
#include <compare>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace cokacenc::core
{

struct PackedFile final
{
    std::vector<std::filesystem::path> chunks;
    std::vector<std::uint64_t> chunkPlaintextBytes;
    std::string contentHash;
    std::uint64_t plaintextBytes{ 0U };
};

struct UnpackedFile final
{
    std::filesystem::path outputPath;
    bool verified{ false };
};

// Identity of one original file as recovered from chunk names.
struct LogicalFileKey final
{
    std::string fnHash5;
    std::string originalName;

    auto operator<=>(const LogicalFileKey&) const = default;
};

struct MalformedGroup final
{
    LogicalFileKey key;
    ChunkError error{ ChunkError::SequenceGap };
    std::vector<std::filesystem::path> paths;
};

struct GroupedChunks final
{
    std::map<LogicalFileKey, std::vector<std::filesystem::path>> groups;
    std::vector<MalformedGroup> malformed;
};

struct UnpackOutcome final
{
    LogicalFileKey key;
    ChunkResult<UnpackedFile> result;
};

struct UnpackReport final
{
    std::vector<UnpackOutcome> files;
    std::vector<MalformedGroup> malformed;
};

// Checks a group whose members are already in sequence order. std::nullopt when it can be merged.
[[nodiscard]] std::optional<ChunkError> validateChunkGroup(std::span<const ChunkName> ordered) noexcept;

// Control plane: chunk naming, grouping, ordering, verification, and delete policies.
class ChunkService final
{
public:
    explicit ChunkService(cokacenc::crypto::ICryptoProvider& crypto) noexcept;

    void setProgressSink(ProgressSink sink);

    // Encrypts `path` into chunk files beside it. On failure nothing written for this file is left behind.
    [[nodiscard]] ChunkResult<PackedFile> packFile(const std::filesystem::path& path,
                                                   const cokacenc::security::SecureString& secret,
                                                   const PackOptions& options) noexcept;

    // Merges one group in sequence order into the original name, in the chunks' directory. The output only
    // appears under its final name after the content hash matched.
    [[nodiscard]] ChunkResult<UnpackedFile> unpackGroup(std::span<const std::filesystem::path> orderedChunkPaths,
                                                        const cokacenc::security::SecureString& secret,
                                                        const UnpackOptions& options) noexcept;

    // Names that are not chunk files are ignored.
    [[nodiscard]] GroupedChunks groupAndOrder(std::span<const std::filesystem::path> candidatePaths) const;

    [[nodiscard]] UnpackReport unpackAll(std::span<const std::filesystem::path> candidatePaths,
                                         const cokacenc::security::SecureString& secret,
                                         const UnpackOptions& options);

private:
    cokacenc::crypto::ICryptoProvider* m_crypto{ nullptr };
    ProgressSink m_progress;
};

} // namespace cokacenc::core

#endif // INCLUDE_COKACENC_CORE_CHUNKSERVICE_HPP
