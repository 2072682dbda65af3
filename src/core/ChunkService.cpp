#include "cokacenc/core/ChunkService.hpp"
#include <algorithm>
#include <optional>
#include <string_view>
#include <system_error>
#include <utility>

namespace cokacenc::core
{
namespace
{

constexpr std::string_view g_kUnpackingSuffix{ ".cokacenc-unpacking" };

// Best effort: callers are already returning the failure that made these files worthless.
void discardFiles(std::span<const std::filesystem::path> paths) noexcept
{
    for (const auto& p : paths)
    {
        std::error_code ec{};
        static_cast<void>(std::filesystem::remove(p, ec));
    }
}

void discardFile(const std::filesystem::path& path) noexcept
{
    discardFiles(std::span<const std::filesystem::path>{ &path, 1U });
}

[[nodiscard]] bool removeFile(const std::filesystem::path& path) noexcept
{
    std::error_code ec{};
    const bool removed{ std::filesystem::remove(path, ec) };
    return removed && !ec;
}

[[nodiscard]] std::filesystem::path provisionalOutputPath(const std::filesystem::path& dir,
                                                          std::string_view originalName)
{
    std::string name{ "." };
    name.append(originalName);
    name.append(g_kUnpackingSuffix);
    return dir / name;
}

} // namespace

[[nodiscard]] std::optional<ChunkError> validateChunkGroup(std::span<const ChunkName> ordered) noexcept
{
    if (ordered.empty())
    {
        return ChunkError::IncompleteGroup;
    }

    const ChunkName& first{ ordered.front() };
    for (const auto& n : ordered)
    {
        if (n.isSplit() != first.isSplit())
        {
            return ChunkError::MixedGroup;
        }
    }
    for (const auto& n : ordered)
    {
        if (n.contentHash8 != first.contentHash8)
        {
            return ChunkError::ContentHashMismatch;
        }
    }

    if (!first.isSplit())
    {
        return ordered.size() == 1U ? std::nullopt : std::optional<ChunkError>{ ChunkError::DuplicateSequence };
    }

    for (std::size_t i{}; i < ordered.size(); ++i)
    {
        const std::uint32_t seq{ *ordered[i].sequence };
        if (seq == i)
        {
            continue;
        }
        if (i > 0U && seq == *ordered[i - 1U].sequence)
        {
            return ChunkError::DuplicateSequence;
        }
        return ChunkError::SequenceGap;
    }

    // Pack never splits into a single chunk, so a lone "aaaa" means the rest went missing.
    if (ordered.size() == 1U)
    {
        return ChunkError::IncompleteGroup;
    }
    return std::nullopt;
}

ChunkService::ChunkService(cokacenc::crypto::ICryptoProvider& crypto) noexcept : m_crypto(&crypto)
{
}

void ChunkService::setProgressSink(ProgressSink sink)
{
    m_progress = std::move(sink);
}

[[nodiscard]] ChunkResult<PackedFile> ChunkService::packFile(const std::filesystem::path& path,
                                                             const cokacenc::security::SecureString& secret,
                                                             const PackOptions& options) noexcept
{
    if (const auto invalid{ validatePackOptions(options) })
    {
        return chunkFailure(*invalid, path);
    }
    if (secret.empty())
    {
        return chunkFailure(ChunkError::EmptySecret, path);
    }

    std::vector<std::filesystem::path> provisional{};
    PackedFile packed{};
    try
    {
        const std::string originalName{ path.filename().string() };
        if (!isValidOriginalName(originalName))
        {
            return chunkFailure(ChunkError::InvalidFileName, path);
        }
        const std::string fnHash5{ fileNameFingerprint(originalName) };
        const std::filesystem::path dir{ path.parent_path() };

        const ChunkPathFn chunkPath{ [&](std::uint32_t index) {
            provisional.push_back(dir / provisionalChunkName(fnHash5, index, originalName));
            return provisional.back();
        } };

        ChunkStreamer streamer{ *m_crypto, options.kdf };
        streamer.setProgressSink(m_progress);
        const auto streamed{ streamer.encryptFile(path, cokacenc::security::asBytes(secret), options.chunkBytes,
                                                  chunkPath) };
        if (std::holds_alternative<ChunkFailure>(streamed))
        {
            discardFiles(provisional);
            return std::get<ChunkFailure>(streamed);
        }
        const auto& stream{ std::get<EncryptedStream>(streamed) };

        packed.contentHash = contentFingerprint(stream.digest);
        packed.plaintextBytes = stream.plaintextBytes;
        packed.chunkPlaintextBytes = stream.chunkPlaintextBytes;

        const bool split{ stream.chunks.size() > 1U };
        for (std::size_t i{}; i < stream.chunks.size(); ++i)
        {
            std::optional<std::uint32_t> sequence{};
            if (split)
            {
                sequence = static_cast<std::uint32_t>(i);
            }
            const auto finalPath{ dir / encodeChunkName(originalName, packed.contentHash, fnHash5, sequence) };

            std::error_code ec{};
            std::filesystem::rename(stream.chunks[i], finalPath, ec);
            if (ec)
            {
                discardFiles(packed.chunks);
                discardFiles(std::span<const std::filesystem::path>{ stream.chunks }.subspan(i));
                return chunkFailure(ChunkError::RenameFailed, stream.chunks[i]);
            }
            packed.chunks.push_back(finalPath);
        }
    }
    catch (const std::exception&)
    {
        discardFiles(provisional);
        discardFiles(packed.chunks);
        return chunkFailure(ChunkError::CryptoError, path);
    }

    if (options.deleteOriginal && !removeFile(path))
    {
        return chunkFailure(ChunkError::RemoveFailed, path);
    }
    return packed;
}

[[nodiscard]] ChunkResult<UnpackedFile>
ChunkService::unpackGroup(std::span<const std::filesystem::path> orderedChunkPaths,
                          const cokacenc::security::SecureString& secret, const UnpackOptions& options) noexcept
{
    if (orderedChunkPaths.empty())
    {
        return chunkFailure(ChunkError::IncompleteGroup);
    }
    const std::filesystem::path& first{ orderedChunkPaths.front() };
    if (const auto invalid{ validateUnpackOptions(options) })
    {
        return chunkFailure(*invalid, first);
    }
    if (secret.empty())
    {
        return chunkFailure(ChunkError::EmptySecret, first);
    }

    std::filesystem::path temp{};
    try
    {
        std::vector<ChunkName> names{};
        names.reserve(orderedChunkPaths.size());
        for (const auto& p : orderedChunkPaths)
        {
            auto decoded{ decodeChunkName(p.filename().string()) };
            if (!decoded)
            {
                return chunkFailure(ChunkError::MixedGroup, p);
            }
            if (!names.empty() &&
                (decoded->fnHash5 != names.front().fnHash5 || decoded->originalName != names.front().originalName))
            {
                return chunkFailure(ChunkError::MixedGroup, p);
            }
            names.push_back(std::move(*decoded));
        }
        if (const auto malformed{ validateChunkGroup(names) })
        {
            return chunkFailure(*malformed, first);
        }

        const std::filesystem::path dir{ first.parent_path() };
        const std::filesystem::path output{ dir / names.front().originalName };
        temp = provisionalOutputPath(dir, names.front().originalName);

        ChunkStreamer streamer{ *m_crypto, options.kdf };
        streamer.setProgressSink(m_progress);
        const auto decrypted{ streamer.decryptChunks(orderedChunkPaths, cokacenc::security::asBytes(secret), temp) };
        if (std::holds_alternative<ChunkFailure>(decrypted))
        {
            discardFile(temp);
            return std::get<ChunkFailure>(decrypted);
        }

        if (contentFingerprint(std::get<DecryptedStream>(decrypted).digest) != names.front().contentHash8)
        {
            discardFile(temp);
            return chunkFailure(ChunkError::IntegrityMismatch, output);
        }

        std::error_code ec{};
        std::filesystem::rename(temp, output, ec);
        if (ec)
        {
            discardFile(temp);
            return chunkFailure(ChunkError::RenameFailed, output);
        }

        if (options.deleteChunks)
        {
            // Every chunk gets a removal attempt; the first one left behind is reported.
            std::optional<std::filesystem::path> leftOver{};
            for (const auto& p : orderedChunkPaths)
            {
                if (!removeFile(p) && !leftOver)
                {
                    leftOver = p;
                }
            }
            if (leftOver)
            {
                return chunkFailure(ChunkError::RemoveFailed, *leftOver);
            }
        }
        return UnpackedFile{ .outputPath = output, .verified = true };
    }
    catch (const std::exception&)
    {
        if (!temp.empty())
        {
            discardFile(temp);
        }
        return chunkFailure(ChunkError::CryptoError, first);
    }
}

[[nodiscard]] GroupedChunks ChunkService::groupAndOrder(std::span<const std::filesystem::path> candidatePaths) const
{
    std::map<LogicalFileKey, std::vector<std::pair<ChunkName, std::filesystem::path>>> buckets{};
    for (const auto& p : candidatePaths)
    {
        auto decoded{ decodeChunkName(p.filename().string()) };
        if (!decoded)
        {
            continue;
        }
        LogicalFileKey key{ .fnHash5 = decoded->fnHash5, .originalName = decoded->originalName };
        buckets[std::move(key)].emplace_back(std::move(*decoded), p);
    }

    GroupedChunks out{};
    for (auto& [key, members] : buckets)
    {
        // std::nullopt orders before every label, so single members sort first.
        std::stable_sort(members.begin(), members.end(),
                         [](const auto& a, const auto& b) { return a.first.sequence < b.first.sequence; });

        std::vector<ChunkName> names{};
        std::vector<std::filesystem::path> paths{};
        names.reserve(members.size());
        paths.reserve(members.size());
        for (auto& [name, path] : members)
        {
            names.push_back(std::move(name));
            paths.push_back(std::move(path));
        }

        if (const auto malformed{ validateChunkGroup(names) })
        {
            out.malformed.push_back(MalformedGroup{ .key = key, .error = *malformed, .paths = std::move(paths) });
            continue;
        }
        out.groups.emplace(key, std::move(paths));
    }
    return out;
}

[[nodiscard]] UnpackReport ChunkService::unpackAll(std::span<const std::filesystem::path> candidatePaths,
                                                   const cokacenc::security::SecureString& secret,
                                                   const UnpackOptions& options)
{
    auto grouped{ groupAndOrder(candidatePaths) };

    UnpackReport report{};
    report.malformed = std::move(grouped.malformed);
    for (const auto& [key, paths] : grouped.groups)
    {
        report.files.push_back(UnpackOutcome{ .key = key, .result = unpackGroup(paths, secret, options) });
    }
    return report;
}

} // namespace cokacenc::core
