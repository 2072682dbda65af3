#include "cokacenc/core/ChunkHeader.hpp"

#include "LittleEndian.hpp"
#include <cstddef>

namespace cokacenc::core
{
namespace
{

constexpr std::size_t g_kU32Bytes{ cokacenc::core::detail::g_kU32Bytes };

template <std::size_t N>
void copyOut(const std::array<std::uint8_t, N>& field, std::span<std::byte> out, std::size_t offset) noexcept
{
    for (std::size_t i{}; i < N; ++i)
    {
        out[offset + i] = static_cast<std::byte>(field[i]);
    }
}

template <std::size_t N>
void copyIn(std::span<const std::byte> in, std::size_t offset, std::array<std::uint8_t, N>& field) noexcept
{
    for (std::size_t i{}; i < N; ++i)
    {
        field[i] = std::to_integer<std::uint8_t>(in[offset + i]);
    }
}

} // namespace

[[nodiscard]] std::array<std::byte, g_chunkHeaderBytes> encodeChunkHeader(const ChunkHeader& header) noexcept
{
    std::array<std::byte, g_chunkHeaderBytes> out{};

    std::size_t offset{};
    for (std::size_t i{}; i < g_chunkMagicBytes; ++i)
    {
        out[i] = static_cast<std::byte>(g_chunkMagic[i]);
    }
    offset += g_chunkMagicBytes;

    cokacenc::core::detail::writeU32LE(std::span<std::byte, g_kU32Bytes>{ out.data() + offset, g_kU32Bytes },
                                       header.version);
    offset += g_kU32Bytes;

    copyOut(header.salt, out, offset);
    offset += header.salt.size();

    copyOut(header.iv, out, offset);

    return out;
}

[[nodiscard]] std::variant<ChunkHeader, HeaderError> decodeChunkHeader(std::span<const std::byte> bytes) noexcept
{
    if (bytes.size() < g_chunkHeaderBytes)
    {
        return HeaderError::Truncated;
    }

    std::size_t offset{};
    for (std::size_t i{}; i < g_chunkMagicBytes; ++i)
    {
        if (std::to_integer<char>(bytes[i]) != g_chunkMagic[i])
        {
            return HeaderError::BadMagic;
        }
    }
    offset += g_chunkMagicBytes;

    ChunkHeader header{};
    header.version = cokacenc::core::detail::readU32LE(
        std::span<const std::byte, g_kU32Bytes>{ bytes.data() + offset, g_kU32Bytes });
    if (header.version != g_chunkFormatVersionV1)
    {
        return HeaderError::UnsupportedVersion;
    }
    offset += g_kU32Bytes;

    copyIn(bytes, offset, header.salt);
    offset += header.salt.size();

    copyIn(bytes, offset, header.iv);

    return header;
}

} // namespace cokacenc::core
