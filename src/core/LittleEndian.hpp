#ifndef COKACENC_SRC_CORE_LITTLEENDIAN_HPP
#define COKACENC_SRC_CORE_LITTLEENDIAN_HPP

#include <cstddef>
#include <cstdint>
#include <span>

namespace cokacenc::core::detail
{

constexpr std::size_t g_kU32Bytes{ sizeof(std::uint32_t) };

constexpr std::uint32_t g_kByteMaskU32{ 0xFFU };
constexpr std::uint32_t g_kBitsPerByte{ 8U };

inline void writeU32LE(std::span<std::byte, g_kU32Bytes> out, std::uint32_t v) noexcept
{
    for (std::size_t i{}; i < out.size(); ++i)
    {
        const std::uint32_t shiftBits{ static_cast<std::uint32_t>(i) * g_kBitsPerByte };
        out[i] = static_cast<std::byte>((v >> shiftBits) & g_kByteMaskU32);
    }
}

[[nodiscard]] inline std::uint32_t readU32LE(std::span<const std::byte, g_kU32Bytes> in) noexcept
{
    std::uint32_t v{ 0U };
    for (std::size_t i{}; i < in.size(); ++i)
    {
        const std::uint32_t shiftBits{ static_cast<std::uint32_t>(i) * g_kBitsPerByte };
        v |= (static_cast<std::uint32_t>(std::to_integer<std::uint8_t>(in[i])) << shiftBits);
    }
    return v;
}

} // namespace cokacenc::core::detail

#endif // COKACENC_SRC_CORE_LITTLEENDIAN_HPP
