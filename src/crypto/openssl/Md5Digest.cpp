#include "cokacenc/crypto/Md5Digest.hpp"

#include <openssl/evp.h>
#include <stdexcept>

namespace cokacenc::crypto
{

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

struct Md5Digest::Impl
{
    EvpMdCtxPtr ctx{ nullptr, &EVP_MD_CTX_free };
};

Md5Digest::Md5Digest() : m_impl{ std::make_unique<Impl>() }
{
    m_impl->ctx.reset(EVP_MD_CTX_new());
    if (!m_impl->ctx)
    {
        throw std::runtime_error("Md5Digest: EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(m_impl->ctx.get(), EVP_md5(), nullptr) != 1)
    {
        throw std::runtime_error("Md5Digest: EVP_DigestInit_ex failed");
    }
}

Md5Digest::Md5Digest(Md5Digest&&) noexcept = default;
Md5Digest& Md5Digest::operator=(Md5Digest&&) noexcept = default;
Md5Digest::~Md5Digest() = default;

void Md5Digest::update(std::span<const std::uint8_t> data)
{
    if (data.empty())
    {
        return;
    }
    if (EVP_DigestUpdate(m_impl->ctx.get(), data.data(), data.size()) != 1)
    {
        throw std::runtime_error("Md5Digest: EVP_DigestUpdate failed");
    }
}

[[nodiscard]] Md5Value Md5Digest::finish()
{
    Md5Value out{};
    unsigned int written{ 0U };
    if (EVP_DigestFinal_ex(m_impl->ctx.get(), out.data(), &written) != 1 || written != out.size())
    {
        throw std::runtime_error("Md5Digest: EVP_DigestFinal_ex failed");
    }
    return out;
}

[[nodiscard]] std::string toLowerHex(std::span<const std::uint8_t> bytes)
{
    constexpr char kHex[] = "0123456789abcdef";
    constexpr std::uint8_t kNibbleShift{ 4U };
    constexpr std::uint8_t kNibbleMask{ 0x0FU };

    std::string out{};
    out.reserve(bytes.size() * 2U);
    for (const std::uint8_t b : bytes)
    {
        out.push_back(kHex[(b >> kNibbleShift) & kNibbleMask]);
        out.push_back(kHex[b & kNibbleMask]);
    }
    return out;
}

[[nodiscard]] std::string md5Hex(std::string_view text)
{
    Md5Digest digest{};
    digest.update(std::span<const std::uint8_t>{ reinterpret_cast<const std::uint8_t*>(text.data()), text.size() });
    const auto value{ digest.finish() };
    return toLowerHex(value);
}

} // namespace cokacenc::crypto
