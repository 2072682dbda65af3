#ifndef INCLUDE_COKACENC_CRYPTO_MD5DIGEST_HPP
#define INCLUDE_COKACENC_CRYPTO_MD5DIGEST_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace cokacenc::crypto
{

constexpr std::size_t g_md5DigestBytes{ 16 };

using Md5Value = std::array<std::uint8_t, g_md5DigestBytes>;

// Running MD5 over a byte stream. Used as a non-cryptographic content fingerprint only.
// Throws std::runtime_error if the underlying library fails.
class Md5Digest final
{
public:
    Md5Digest();
    Md5Digest(const Md5Digest&) = delete;
    Md5Digest& operator=(const Md5Digest&) = delete;
    Md5Digest(Md5Digest&&) noexcept;
    Md5Digest& operator=(Md5Digest&&) noexcept;
    ~Md5Digest();

    void update(std::span<const std::uint8_t> data);

    // Finalizes the digest. The object must not be updated afterwards.
    [[nodiscard]] Md5Value finish();

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};

[[nodiscard]] std::string toLowerHex(std::span<const std::uint8_t> bytes);

// Lowercase hex MD5 of `text`, e.g. for the filename fingerprint.
[[nodiscard]] std::string md5Hex(std::string_view text);

} // namespace cokacenc::crypto

#endif // INCLUDE_COKACENC_CRYPTO_MD5DIGEST_HPP
