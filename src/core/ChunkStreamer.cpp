#include "cokacenc/core/ChunkStreamer.hpp"
#include "cokacenc/core/ChunkHeader.hpp"
#include "cokacenc/core/ChunkName.hpp"
#include "cokacenc/core/PackPolicy.hpp"
#include "cokacenc/security/SecureMemory.hpp"
#include <algorithm>
#include <array>
#include <fstream>
#include <ios>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace cokacenc::core
{
namespace
{

using cokacenc::crypto::CbcPadding;

// Carries a typed failure out of the streaming helpers up to the noexcept entry points.
class StreamFailure final : public std::runtime_error
{
public:
    StreamFailure(ChunkError code, std::filesystem::path path)
        : std::runtime_error{ std::string{ errorName(code) } }, m_failure{ chunkFailure(code, std::move(path)) }
    {
    }

    [[nodiscard]] const ChunkFailure& failure() const noexcept
    {
        return m_failure;
    }

private:
    ChunkFailure m_failure;
};

struct OpenChunk final
{
    std::filesystem::path path;
    std::uint32_t index{ 0U };
    std::ofstream out;
    std::unique_ptr<cokacenc::crypto::IChunkEncryptor> encryptor;
    std::uint64_t plaintextBytes{ 0U };
};

[[nodiscard]] ChunkError toChunkError(HeaderError e) noexcept
{
    switch (e)
    {
    case HeaderError::Truncated:
        return ChunkError::TruncatedHeader;
    case HeaderError::BadMagic:
        return ChunkError::BadMagic;
    case HeaderError::UnsupportedVersion:
        return ChunkError::UnsupportedVersion;
    }
    return ChunkError::BadMagic;
}

void writeBytes(std::ostream& out, std::span<const std::uint8_t> data, const std::filesystem::path& path)
{
    if (data.empty())
    {
        return;
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out)
    {
        throw StreamFailure{ ChunkError::WriteFailed, path };
    }
}

[[nodiscard]] std::size_t readSome(std::istream& in, std::span<std::uint8_t> buffer, const std::filesystem::path& path)
{
    in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    if (in.bad())
    {
        throw StreamFailure{ ChunkError::ReadFailed, path };
    }
    return static_cast<std::size_t>(in.gcount());
}

[[nodiscard]] OpenChunk openChunk(cokacenc::crypto::ICryptoProvider& crypto, const cokacenc::crypto::Pbkdf2Params& kdf,
                                  std::uint32_t index, std::span<const std::byte> secret,
                                  const ChunkPathFn& chunkPath, const std::filesystem::path& source)
{
    if (index > g_maxChunkIndex)
    {
        throw StreamFailure{ ChunkError::SequenceOverflow, source };
    }

    OpenChunk chunk{};
    chunk.index = index;
    chunk.path = chunkPath(index);

    const auto headerOpt{ makeChunkHeader(crypto) };
    if (!headerOpt)
    {
        throw StreamFailure{ ChunkError::RandomFailed, chunk.path };
    }

    auto key{ crypto.deriveChunkKey(secret, headerOpt->salt, kdf) };
    chunk.encryptor = crypto.makeChunkEncryptor(key, headerOpt->iv);
    cokacenc::security::secureRelease(key);

    chunk.out.open(chunk.path, std::ios::binary | std::ios::trunc);
    if (!chunk.out)
    {
        throw StreamFailure{ ChunkError::WriteFailed, chunk.path };
    }

    const auto encoded{ encodeChunkHeader(*headerOpt) };
    chunk.out.write(reinterpret_cast<const char*>(encoded.data()), static_cast<std::streamsize>(encoded.size()));
    if (!chunk.out)
    {
        throw StreamFailure{ ChunkError::WriteFailed, chunk.path };
    }
    return chunk;
}

void closeChunk(OpenChunk& chunk, CbcPadding padding, std::vector<std::uint8_t>& cipherOut, EncryptedStream& result,
                const ProgressSink& progress)
{
    chunk.encryptor->finish(padding, cipherOut);
    writeBytes(chunk.out, cipherOut, chunk.path);
    chunk.out.close();
    if (chunk.out.fail())
    {
        throw StreamFailure{ ChunkError::WriteFailed, chunk.path };
    }

    result.chunks.push_back(chunk.path);
    result.chunkPlaintextBytes.push_back(chunk.plaintextBytes);
    if (progress)
    {
        progress(ChunkProgress{ .phase = ChunkPhase::Encrypted,
                                .chunkPath = chunk.path,
                                .index = chunk.index,
                                .plaintextBytes = chunk.plaintextBytes });
    }
}

// Streams one chunk's ciphertext into `out`, feeding the plaintext to `digest`. Returns the plaintext size.
[[nodiscard]] std::uint64_t decryptInto(cokacenc::crypto::ICryptoProvider& crypto,
                                        const cokacenc::crypto::Pbkdf2Params& kdf, const std::filesystem::path& chunk,
                                        std::span<const std::byte> secret, CbcPadding padding, std::ostream& out,
                                        const std::filesystem::path& outPath, cokacenc::crypto::Md5Digest& digest)
{
    std::ifstream in{ chunk, std::ios::binary };
    if (!in)
    {
        throw StreamFailure{ ChunkError::ReadFailed, chunk };
    }

    std::array<std::byte, g_chunkHeaderBytes> headerBytes{};
    in.read(reinterpret_cast<char*>(headerBytes.data()), static_cast<std::streamsize>(headerBytes.size()));
    if (in.bad())
    {
        throw StreamFailure{ ChunkError::ReadFailed, chunk };
    }
    const auto headerRead{ static_cast<std::size_t>(in.gcount()) };

    const auto decoded{ decodeChunkHeader(std::span<const std::byte>{ headerBytes.data(), headerRead }) };
    if (std::holds_alternative<HeaderError>(decoded))
    {
        throw StreamFailure{ toChunkError(std::get<HeaderError>(decoded)), chunk };
    }
    const auto& header{ std::get<ChunkHeader>(decoded) };

    auto key{ crypto.deriveChunkKey(secret, header.salt, kdf) };
    const auto decryptor{ crypto.makeChunkDecryptor(key, header.iv, padding) };
    cokacenc::security::secureRelease(key);

    std::vector<std::uint8_t> buffer(g_kIoBufferBytes);
    std::vector<std::uint8_t> plain{};
    std::uint64_t plaintextBytes{ 0U };
    for (;;)
    {
        const std::size_t got{ readSome(in, buffer, chunk) };
        if (got == 0U)
        {
            break;
        }
        decryptor->update(std::span<const std::uint8_t>{ buffer.data(), got }, plain);
        writeBytes(out, plain, outPath);
        digest.update(plain);
        plaintextBytes += plain.size();
    }

    if (!decryptor->finish(plain))
    {
        throw StreamFailure{ ChunkError::CorruptChunk, chunk };
    }
    writeBytes(out, plain, outPath);
    digest.update(plain);
    plaintextBytes += plain.size();
    return plaintextBytes;
}

} // namespace

ChunkStreamer::ChunkStreamer(cokacenc::crypto::ICryptoProvider& crypto, cokacenc::crypto::Pbkdf2Params kdf) noexcept
    : m_crypto(&crypto), m_kdf(kdf)
{
}

void ChunkStreamer::setProgressSink(ProgressSink sink)
{
    m_progress = std::move(sink);
}

[[nodiscard]] ChunkResult<EncryptedStream> ChunkStreamer::encryptFile(const std::filesystem::path& source,
                                                                      std::span<const std::byte> secret,
                                                                      std::uint64_t chunkBytes,
                                                                      const ChunkPathFn& chunkPath) noexcept
{
    if (secret.empty())
    {
        return chunkFailure(ChunkError::EmptySecret, source);
    }
    if (!isValidChunkBytes(chunkBytes))
    {
        return chunkFailure(ChunkError::InvalidChunkSize, source);
    }
    const std::uint64_t budget{ alignedChunkBytes(chunkBytes) };

    try
    {
        std::ifstream in{ source, std::ios::binary };
        if (!in)
        {
            return chunkFailure(ChunkError::ReadFailed, source);
        }

        EncryptedStream result{};
        cokacenc::crypto::Md5Digest digest{};
        std::vector<std::uint8_t> buffer(g_kIoBufferBytes);
        std::vector<std::uint8_t> cipherOut{};
        std::optional<OpenChunk> chunk{};
        std::uint32_t nextIndex{ 0U };

        for (;;)
        {
            const std::size_t got{ readSome(in, buffer, source) };
            if (got == 0U)
            {
                break;
            }
            std::span<const std::uint8_t> pending{ buffer.data(), got };
            digest.update(pending);
            result.plaintextBytes += got;

            while (!pending.empty())
            {
                // A full chunk is only closed once more plaintext shows up, so no empty trailing chunk exists.
                if (chunk && budget != g_kUnboundedChunkBytes && chunk->plaintextBytes == budget)
                {
                    closeChunk(*chunk, CbcPadding::None, cipherOut, result, m_progress);
                    chunk.reset();
                }
                if (!chunk)
                {
                    chunk.emplace(openChunk(*m_crypto, m_kdf, nextIndex, secret, chunkPath, source));
                    ++nextIndex;
                }

                std::size_t take{ pending.size() };
                if (budget != g_kUnboundedChunkBytes)
                {
                    take = static_cast<std::size_t>(std::min<std::uint64_t>(take, budget - chunk->plaintextBytes));
                }
                chunk->encryptor->update(pending.first(take), cipherOut);
                writeBytes(chunk->out, cipherOut, chunk->path);
                chunk->plaintextBytes += take;
                pending = pending.subspan(take);
            }
        }

        if (!chunk)
        {
            chunk.emplace(openChunk(*m_crypto, m_kdf, nextIndex, secret, chunkPath, source));
        }
        closeChunk(*chunk, CbcPadding::Pkcs7, cipherOut, result, m_progress);

        result.digest = digest.finish();
        return result;
    }
    catch (const StreamFailure& e)
    {
        return e.failure();
    }
    catch (const std::exception&)
    {
        return chunkFailure(ChunkError::CryptoError, source);
    }
}

[[nodiscard]] ChunkResult<DecryptedStream> ChunkStreamer::decryptChunk(const std::filesystem::path& chunk,
                                                                       std::span<const std::byte> secret,
                                                                       cokacenc::crypto::CbcPadding padding,
                                                                       std::ostream& out) noexcept
{
    if (secret.empty())
    {
        return chunkFailure(ChunkError::EmptySecret, chunk);
    }

    try
    {
        cokacenc::crypto::Md5Digest digest{};
        DecryptedStream result{};
        result.plaintextBytes = decryptInto(*m_crypto, m_kdf, chunk, secret, padding, out, chunk, digest);
        result.digest = digest.finish();
        if (m_progress)
        {
            m_progress(ChunkProgress{ .phase = ChunkPhase::Decrypted,
                                      .chunkPath = chunk,
                                      .index = 0U,
                                      .plaintextBytes = result.plaintextBytes });
        }
        return result;
    }
    catch (const StreamFailure& e)
    {
        return e.failure();
    }
    catch (const std::exception&)
    {
        return chunkFailure(ChunkError::CryptoError, chunk);
    }
}

[[nodiscard]] ChunkResult<DecryptedStream>
ChunkStreamer::decryptChunks(std::span<const std::filesystem::path> orderedChunks, std::span<const std::byte> secret,
                             const std::filesystem::path& output) noexcept
{
    if (secret.empty())
    {
        return chunkFailure(ChunkError::EmptySecret, output);
    }
    if (orderedChunks.empty())
    {
        return chunkFailure(ChunkError::IncompleteGroup, output);
    }

    std::size_t current{ 0U };
    try
    {
        std::ofstream out{ output, std::ios::binary | std::ios::trunc };
        if (!out)
        {
            return chunkFailure(ChunkError::WriteFailed, output);
        }

        cokacenc::crypto::Md5Digest digest{};
        DecryptedStream result{};
        for (; current < orderedChunks.size(); ++current)
        {
            const bool last{ current + 1U == orderedChunks.size() };
            const std::uint64_t produced{ decryptInto(*m_crypto, m_kdf, orderedChunks[current], secret,
                                                      last ? CbcPadding::Pkcs7 : CbcPadding::None, out, output,
                                                      digest) };
            result.plaintextBytes += produced;
            if (m_progress)
            {
                m_progress(ChunkProgress{ .phase = ChunkPhase::Decrypted,
                                          .chunkPath = orderedChunks[current],
                                          .index = static_cast<std::uint32_t>(current),
                                          .plaintextBytes = produced });
            }
        }

        out.close();
        if (out.fail())
        {
            return chunkFailure(ChunkError::WriteFailed, output);
        }
        result.digest = digest.finish();
        return result;
    }
    catch (const StreamFailure& e)
    {
        return e.failure();
    }
    catch (const std::exception&)
    {
        const auto& blamed{ current < orderedChunks.size() ? orderedChunks[current] : output };
        return chunkFailure(ChunkError::CryptoError, blamed);
    }
}

} // namespace cokacenc::core
