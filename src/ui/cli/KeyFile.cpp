#include "KeyFile.hpp"

#include "cokacenc/security/ScopeWipe.hpp"
#include "cokacenc/security/SecureRandom.hpp"
#include <fstream>
#include <ios>
#include <limits>
#include <openssl/evp.h>
#include <stdexcept>
#include <system_error>

namespace cokacenc::ui::cli
{

namespace
{

[[nodiscard]] bool isAsciiSpace(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

void trimInPlace(cokacenc::security::SecureString& s)
{
    std::size_t end = s.size();
    while (end > 0U && isAsciiSpace(s[end - 1U]))
    {
        --end;
    }
    std::size_t begin = 0U;
    while (begin < end && isAsciiSpace(s[begin]))
    {
        ++begin;
    }

    cokacenc::security::SecureString trimmed(s.begin() + static_cast<std::ptrdiff_t>(begin),
                                             s.begin() + static_cast<std::ptrdiff_t>(end));
    cokacenc::security::secureRelease(s);
    s.swap(trimmed);
}

} // namespace

cokacenc::security::SecureString loadKeyFile(const std::filesystem::path& path)
{
    std::error_code ec{};
    const auto size = std::filesystem::file_size(path, ec);
    if (ec)
    {
        throw std::runtime_error("cannot read key file: " + path.string());
    }
    if (size > g_kMaxKeyFileBytes)
    {
        throw std::runtime_error("key file is too large: " + path.string());
    }

    std::ifstream in{ path, std::ios::binary };
    if (!in)
    {
        throw std::runtime_error("cannot open key file: " + path.string());
    }

    cokacenc::security::SecureString key{};
    key.resize(static_cast<std::size_t>(size));
    in.read(key.data(), static_cast<std::streamsize>(key.size()));
    if (in.bad() || static_cast<std::size_t>(in.gcount()) != key.size())
    {
        cokacenc::security::secureRelease(key);
        throw std::runtime_error("cannot read key file: " + path.string());
    }

    trimInPlace(key);
    if (key.empty())
    {
        throw std::runtime_error("key file is empty: " + path.string());
    }
    return key;
}

cokacenc::security::SecureString encodeBase64(std::span<const std::uint8_t> bytes)
{
    constexpr std::size_t kMaxInput{ static_cast<std::size_t>(std::numeric_limits<int>::max() / 4 * 3) };
    if (bytes.size() > kMaxInput)
    {
        throw std::invalid_argument("encodeBase64: input too large");
    }

    cokacenc::security::SecureString out{};
    // EVP_EncodeBlock writes 4 characters per 3-byte group plus a terminating NUL.
    out.resize(((bytes.size() + 2U) / 3U) * 4U + 1U);
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), bytes.data(),
                                        static_cast<int>(bytes.size()));
    if (written < 0)
    {
        throw std::runtime_error("encodeBase64: EVP_EncodeBlock failed");
    }
    out.resize(static_cast<std::size_t>(written));
    while (!out.empty() && out.back() == '=')
    {
        out.pop_back();
    }
    return out;
}

std::size_t generateKeyFile(const std::filesystem::path& path, std::size_t length, bool force)
{
    if (length == 0U)
    {
        throw std::invalid_argument("key length must be at least 1 byte");
    }
    if (length > g_kMaxKeyFileBytes)
    {
        throw std::invalid_argument("key length is too large");
    }

    std::error_code ec{};
    if (!force && std::filesystem::exists(path, ec))
    {
        throw std::runtime_error("file already exists: " + path.string() + " (use --force to overwrite)");
    }

    cokacenc::security::SecureBuffer raw{};
    raw.resize(length);
    auto wipeRaw = cokacenc::security::scopeWipe(raw);
    if (!cokacenc::security::secureRandomFill(std::span<std::uint8_t>{ raw }))
    {
        throw std::runtime_error("CSPRNG failure");
    }

    auto encoded = encodeBase64(raw);
    auto wipeEncoded = cokacenc::security::scopeWipe(encoded);

    std::ofstream out{ path, std::ios::binary | std::ios::trunc };
    if (!out)
    {
        throw std::runtime_error("cannot create key file: " + path.string());
    }
    out.write(encoded.data(), static_cast<std::streamsize>(encoded.size()));
    out.close();
    if (out.fail())
    {
        throw std::runtime_error("cannot write key file: " + path.string());
    }

#if !defined(_WIN32)
    std::filesystem::permissions(path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
    if (ec)
    {
        throw std::runtime_error("cannot restrict key file permissions: " + path.string());
    }
#endif

    return encoded.size();
}

} // namespace cokacenc::ui::cli
