#ifndef INCLUDE_COKACENC_CORE_CHUNKSTREAMER_HPP
#define INCLUDE_COKACENC_CORE_CHUNKSTREAMER_HPP

#include "cokacenc/core/ChunkErrors.hpp"
#include "cokacenc/crypto/ICryptoProvider.hpp"
#include "cokacenc/crypto/KdfParams.hpp"
#include "cokacenc/crypto/Md5Digest.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iosfwd>
#include <span>
#include <vector>

namespace cokacenc::core
{

enum class ChunkPhase : std::uint8_t
{
    Encrypted,
    Decrypted,
};

// Reported once per finished chunk.
struct ChunkProgress final
{
    ChunkPhase phase{ ChunkPhase::Encrypted };
    std::filesystem::path chunkPath{};
    std::uint32_t index{ 0U };
    std::uint64_t plaintextBytes{ 0U };
};

using ProgressSink = std::function<void(const ChunkProgress&)>;

// Where chunk `index` of the file being packed is written.
using ChunkPathFn = std::function<std::filesystem::path(std::uint32_t index)>;

struct EncryptedStream final
{
    cokacenc::crypto::Md5Value digest{};
    std::vector<std::filesystem::path> chunks;
    std::vector<std::uint64_t> chunkPlaintextBytes;
    std::uint64_t plaintextBytes{ 0U };
};

struct DecryptedStream final
{
    cokacenc::crypto::Md5Value digest{};
    std::uint64_t plaintextBytes{ 0U };
};

// Data plane: moves one logical file between plaintext and chunk files through AES-256-CBC, in bounded memory,
// while computing the whole-file MD5. Holds no per-file state between calls.
class ChunkStreamer final
{
public:
    ChunkStreamer(cokacenc::crypto::ICryptoProvider& crypto, cokacenc::crypto::Pbkdf2Params kdf) noexcept;

    void setProgressSink(ProgressSink sink);

    // Splits `source` into chunks of at most `chunkBytes` plaintext bytes, rounded down to whole AES blocks
    // (0 = one chunk). Every chunk but the last ends on a block boundary without padding; the last is PKCS7
    // padded. Chunks already written are left in place on failure.
    [[nodiscard]] ChunkResult<EncryptedStream> encryptFile(const std::filesystem::path& source,
                                                           std::span<const std::byte> secret,
                                                           std::uint64_t chunkBytes,
                                                           const ChunkPathFn& chunkPath) noexcept;

    // Decrypts a single chunk into `out`. Intermediate chunks use CbcPadding::None.
    [[nodiscard]] ChunkResult<DecryptedStream> decryptChunk(const std::filesystem::path& chunk,
                                                            std::span<const std::byte> secret,
                                                            cokacenc::crypto::CbcPadding padding,
                                                            std::ostream& out) noexcept;

    // Decrypts an ordered chunk list into `output` (truncated first). Only the last chunk is unpadded.
    // The output is left in place on failure.
    [[nodiscard]] ChunkResult<DecryptedStream> decryptChunks(std::span<const std::filesystem::path> orderedChunks,
                                                             std::span<const std::byte> secret,
                                                             const std::filesystem::path& output) noexcept;

private:
    cokacenc::crypto::ICryptoProvider* m_crypto{ nullptr };
    cokacenc::crypto::Pbkdf2Params m_kdf{};
    ProgressSink m_progress;
};

} // namespace cokacenc::core

#endif // INCLUDE_COKACENC_CORE_CHUNKSTREAMER_HPP
