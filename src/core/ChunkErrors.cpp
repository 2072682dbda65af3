#include "cokacenc/core/ChunkErrors.hpp"

namespace cokacenc::core
{

[[nodiscard]] ChunkErrorCategory categoryOf(ChunkError e) noexcept
{
    switch (e)
    {
    case ChunkError::BadMagic:
    case ChunkError::UnsupportedVersion:
    case ChunkError::TruncatedHeader:
    case ChunkError::SequenceGap:
    case ChunkError::DuplicateSequence:
    case ChunkError::ContentHashMismatch:
    case ChunkError::MixedGroup:
    case ChunkError::IncompleteGroup:
    case ChunkError::SequenceOverflow:
    case ChunkError::InvalidFileName:
        return ChunkErrorCategory::Format;
    case ChunkError::IntegrityMismatch:
    case ChunkError::CorruptChunk:
        return ChunkErrorCategory::Integrity;
    case ChunkError::InvalidChunkSize:
    case ChunkError::EmptySecret:
        return ChunkErrorCategory::Configuration;
    case ChunkError::ReadFailed:
    case ChunkError::WriteFailed:
    case ChunkError::RemoveFailed:
    case ChunkError::RenameFailed:
        return ChunkErrorCategory::Io;
    case ChunkError::RandomFailed:
    case ChunkError::CryptoError:
        return ChunkErrorCategory::Crypto;
    }
    return ChunkErrorCategory::Crypto;
}

[[nodiscard]] std::string_view errorName(ChunkError e) noexcept
{
    switch (e)
    {
    case ChunkError::BadMagic:
        return "BadMagic";
    case ChunkError::UnsupportedVersion:
        return "UnsupportedVersion";
    case ChunkError::TruncatedHeader:
        return "TruncatedHeader";
    case ChunkError::SequenceGap:
        return "SequenceGap";
    case ChunkError::DuplicateSequence:
        return "DuplicateSequence";
    case ChunkError::ContentHashMismatch:
        return "ContentHashMismatch";
    case ChunkError::MixedGroup:
        return "MixedGroup";
    case ChunkError::IncompleteGroup:
        return "IncompleteGroup";
    case ChunkError::SequenceOverflow:
        return "SequenceOverflow";
    case ChunkError::InvalidFileName:
        return "InvalidFileName";
    case ChunkError::IntegrityMismatch:
        return "IntegrityMismatch";
    case ChunkError::CorruptChunk:
        return "CorruptChunk";
    case ChunkError::InvalidChunkSize:
        return "InvalidChunkSize";
    case ChunkError::EmptySecret:
        return "EmptySecret";
    case ChunkError::ReadFailed:
        return "ReadFailed";
    case ChunkError::WriteFailed:
        return "WriteFailed";
    case ChunkError::RemoveFailed:
        return "RemoveFailed";
    case ChunkError::RenameFailed:
        return "RenameFailed";
    case ChunkError::RandomFailed:
        return "RandomFailed";
    case ChunkError::CryptoError:
        return "CryptoError";
    }
    return "Unknown";
}

[[nodiscard]] std::string_view describeError(ChunkError e) noexcept
{
    switch (e)
    {
    case ChunkError::BadMagic:
        return "not a cokacenc chunk (bad magic)";
    case ChunkError::UnsupportedVersion:
        return "unsupported chunk format version";
    case ChunkError::TruncatedHeader:
        return "chunk is shorter than its header";
    case ChunkError::SequenceGap:
        return "chunk sequence has a gap";
    case ChunkError::DuplicateSequence:
        return "chunk sequence label appears twice";
    case ChunkError::ContentHashMismatch:
        return "chunks disagree on the content hash";
    case ChunkError::MixedGroup:
        return "split and single chunks share one name";
    case ChunkError::IncompleteGroup:
        return "split file has only one chunk";
    case ChunkError::SequenceOverflow:
        return "file needs more than 456976 chunks";
    case ChunkError::InvalidFileName:
        return "file name cannot be carried in a chunk name";
    case ChunkError::IntegrityMismatch:
        return "content hash mismatch after decryption";
    case ChunkError::CorruptChunk:
        return "chunk ciphertext or padding is corrupt";
    case ChunkError::InvalidChunkSize:
        return "chunk size must be 0 or at least 16 bytes";
    case ChunkError::EmptySecret:
        return "key is empty";
    case ChunkError::ReadFailed:
        return "read failed";
    case ChunkError::WriteFailed:
        return "write failed";
    case ChunkError::RemoveFailed:
        return "remove failed";
    case ChunkError::RenameFailed:
        return "rename failed";
    case ChunkError::RandomFailed:
        return "random generator failed";
    case ChunkError::CryptoError:
        return "crypto library failure";
    }
    return "unknown error";
}

} // namespace cokacenc::core
