#include "cokacenc/core/ChunkName.hpp"

#include <stdexcept>

namespace cokacenc::core
{
namespace
{

constexpr char g_kFieldSeparator{ '.' };

[[nodiscard]] bool isLowerHex(std::string_view s, std::size_t width) noexcept
{
    if (s.size() != width)
    {
        return false;
    }
    for (const char c : s)
    {
        const bool digit{ c >= '0' && c <= '9' };
        const bool letter{ c >= 'a' && c <= 'f' };
        if (!digit && !letter)
        {
            return false;
        }
    }
    return true;
}

// Splits off `<field>.` from the front of `rest`; the field must be exactly `width` characters.
[[nodiscard]] std::optional<std::string_view> takeField(std::string_view& rest, std::size_t width) noexcept
{
    if (rest.size() <= width || rest[width] != g_kFieldSeparator)
    {
        return std::nullopt;
    }
    const std::string_view field{ rest.substr(0, width) };
    rest.remove_prefix(width + 1U);
    return field;
}

} // namespace

[[nodiscard]] std::optional<std::string> sequenceLabel(std::uint32_t index)
{
    if (index > g_maxChunkIndex)
    {
        return std::nullopt;
    }

    std::string label(g_sequenceLabelChars, 'a');
    std::uint32_t remaining{ index };
    for (std::size_t i{ g_sequenceLabelChars }; i > 0U; --i)
    {
        label[i - 1U] = static_cast<char>('a' + static_cast<char>(remaining % g_sequenceRadix));
        remaining /= g_sequenceRadix;
    }
    return label;
}

[[nodiscard]] std::optional<std::uint32_t> parseSequenceLabel(std::string_view label) noexcept
{
    if (label.size() != g_sequenceLabelChars)
    {
        return std::nullopt;
    }

    std::uint32_t index{ 0U };
    for (const char c : label)
    {
        if (c < 'a' || c > 'z')
        {
            return std::nullopt;
        }
        index = index * g_sequenceRadix + static_cast<std::uint32_t>(c - 'a');
    }
    return index;
}

[[nodiscard]] std::string fileNameFingerprint(std::string_view originalName)
{
    return cokacenc::crypto::md5Hex(originalName).substr(0, g_fnHashChars);
}

[[nodiscard]] std::string contentFingerprint(const cokacenc::crypto::Md5Value& digest)
{
    return cokacenc::crypto::toLowerHex(digest).substr(0, g_contentHashChars);
}

[[nodiscard]] bool isValidOriginalName(std::string_view originalName) noexcept
{
    if (originalName.empty() || originalName == "." || originalName == "..")
    {
        return false;
    }
    return originalName.find('/') == std::string_view::npos && originalName.find('\0') == std::string_view::npos;
}

[[nodiscard]] std::string encodeChunkName(std::string_view originalName, std::string_view contentHash8,
                                          std::string_view fnHash5, std::optional<std::uint32_t> sequence)
{
    if (!isValidOriginalName(originalName))
    {
        throw std::invalid_argument("encodeChunkName: invalid original name");
    }
    if (!isLowerHex(fnHash5, g_fnHashChars))
    {
        throw std::invalid_argument("encodeChunkName: fnHash5 must be 5 lowercase hex characters");
    }
    if (!isLowerHex(contentHash8, g_contentHashChars))
    {
        throw std::invalid_argument("encodeChunkName: contentHash8 must be 8 lowercase hex characters");
    }

    std::string out{};
    out.reserve(fnHash5.size() + g_splitMarker.size() + contentHash8.size() + g_sequenceLabelChars +
                originalName.size() + g_chunkSuffix.size() + 4U);

    out.append(fnHash5);
    out.push_back(g_kFieldSeparator);
    if (sequence)
    {
        const auto label{ sequenceLabel(*sequence) };
        if (!label)
        {
            throw std::out_of_range("encodeChunkName: sequence index past zzzz");
        }
        out.append(g_splitMarker);
        out.push_back(g_kFieldSeparator);
        out.append(contentHash8);
        out.push_back(g_kFieldSeparator);
        out.append(*label);
    }
    else
    {
        out.append(contentHash8);
    }
    out.push_back(g_kFieldSeparator);
    out.append(originalName);
    out.append(g_chunkSuffix);
    return out;
}

[[nodiscard]] std::string encodeChunkName(const ChunkName& name)
{
    return encodeChunkName(name.originalName, name.contentHash8, name.fnHash5, name.sequence);
}

[[nodiscard]] std::optional<ChunkName> decodeChunkName(std::string_view fileName)
{
    if (fileName.size() <= g_chunkSuffix.size() || !fileName.ends_with(g_chunkSuffix))
    {
        return std::nullopt;
    }
    std::string_view rest{ fileName.substr(0, fileName.size() - g_chunkSuffix.size()) };

    const auto fnHash5{ takeField(rest, g_fnHashChars) };
    if (!fnHash5 || !isLowerHex(*fnHash5, g_fnHashChars))
    {
        return std::nullopt;
    }

    ChunkName out{};
    out.fnHash5 = std::string{ *fnHash5 };

    // "SPLTD" is never valid hex, so the two grammars cannot be confused.
    const bool split{ rest.size() > g_splitMarker.size() && rest.starts_with(g_splitMarker) &&
                      rest[g_splitMarker.size()] == g_kFieldSeparator };
    if (split)
    {
        rest.remove_prefix(g_splitMarker.size() + 1U);
    }

    const auto contentHash8{ takeField(rest, g_contentHashChars) };
    if (!contentHash8 || !isLowerHex(*contentHash8, g_contentHashChars))
    {
        return std::nullopt;
    }
    out.contentHash8 = std::string{ *contentHash8 };

    if (split)
    {
        const auto label{ takeField(rest, g_sequenceLabelChars) };
        if (!label)
        {
            return std::nullopt;
        }
        out.sequence = parseSequenceLabel(*label);
        if (!out.sequence)
        {
            return std::nullopt;
        }
    }

    if (!isValidOriginalName(rest))
    {
        return std::nullopt;
    }
    out.originalName = std::string{ rest };

    if (fileNameFingerprint(out.originalName) != out.fnHash5)
    {
        return std::nullopt;
    }
    return out;
}

[[nodiscard]] std::string provisionalChunkName(std::string_view fnHash5, std::uint32_t index,
                                               std::string_view originalName)
{
    const auto label{ sequenceLabel(index) };
    if (!label)
    {
        throw std::out_of_range("provisionalChunkName: sequence index past zzzz");
    }

    std::string out{};
    out.push_back(g_kFieldSeparator);
    out.append(fnHash5);
    out.push_back(g_kFieldSeparator);
    out.append(*label);
    out.push_back(g_kFieldSeparator);
    out.append(originalName);
    out.append(g_provisionalChunkSuffix);
    return out;
}

} // namespace cokacenc::core
