#ifndef INCLUDE_COKACENC_CORE_CHUNKERRORS_HPP
#define INCLUDE_COKACENC_CORE_CHUNKERRORS_HPP

#include <cstdint>
#include <filesystem>
#include <string_view>
#include <utility>
#include <variant>

namespace cokacenc::core
{

enum class ChunkError : std::uint8_t
{
    // Format
    BadMagic,
    UnsupportedVersion,
    TruncatedHeader,
    SequenceGap,
    DuplicateSequence,
    ContentHashMismatch,
    MixedGroup,
    IncompleteGroup,
    SequenceOverflow,
    InvalidFileName,
    // Integrity
    IntegrityMismatch,
    CorruptChunk,
    // Configuration
    InvalidChunkSize,
    EmptySecret,
    // I/O
    ReadFailed,
    WriteFailed,
    RemoveFailed,
    RenameFailed,
    // Crypto
    RandomFailed,
    CryptoError,
};

enum class ChunkErrorCategory : std::uint8_t
{
    Format,
    Integrity,
    Configuration,
    Io,
    Crypto,
};

// A failure is always attributable to one file or one chunk group; `path` names it.
struct ChunkFailure final
{
    ChunkError code{ ChunkError::CryptoError };
    std::filesystem::path path{};
};

template <class T> using ChunkResult = std::variant<T, ChunkFailure>;

[[nodiscard]] inline ChunkFailure chunkFailure(ChunkError code, std::filesystem::path path = {})
{
    return ChunkFailure{ .code = code, .path = std::move(path) };
}

[[nodiscard]] ChunkErrorCategory categoryOf(ChunkError e) noexcept;

// Stable identifier, e.g. "IntegrityMismatch".
[[nodiscard]] std::string_view errorName(ChunkError e) noexcept;

// Short human readable description for the command-line front-end.
[[nodiscard]] std::string_view describeError(ChunkError e) noexcept;

} // namespace cokacenc::core

#endif // INCLUDE_COKACENC_CORE_CHUNKERRORS_HPP
