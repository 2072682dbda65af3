#ifndef INCLUDE_COKACENC_SECURITY_SCOPEWIPE_HPP
#define INCLUDE_COKACENC_SECURITY_SCOPEWIPE_HPP

#include "cokacenc/security/SecureMemory.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

namespace cokacenc::security
{

// Wipes a borrowed span when the guard leaves scope unless release() was called first.
class [[nodiscard]] ScopeWipe final
{
public:
    ScopeWipe(const ScopeWipe&) = delete;
    ScopeWipe& operator=(const ScopeWipe&) = delete;
    ScopeWipe& operator=(ScopeWipe&&) = delete;

    explicit ScopeWipe(std::span<std::byte> b) noexcept : m_bytes{ b }
    {
    }

    ScopeWipe(ScopeWipe&& sw) noexcept : m_bytes{ sw.m_bytes }, m_active{ sw.m_active }
    {
        sw.release();
    }

    ~ScopeWipe() noexcept
    {
        if (!m_active || m_bytes.empty())
        {
            return;
        }
        secureWipe(m_bytes);
    }

    void release() noexcept
    {
        m_active = false;
        m_bytes = {};
    }

private:
    std::span<std::byte> m_bytes;
    bool m_active{ true };
};

[[nodiscard]] inline ScopeWipe scopeWipe(std::span<std::uint8_t> b) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(b) };
}

[[nodiscard]] inline ScopeWipe scopeWipe(SecureBuffer& b) noexcept
{
    return ScopeWipe{ asWritableBytes(b) };
}

[[nodiscard]] inline ScopeWipe scopeWipe(SecureString& s) noexcept
{
    return ScopeWipe{ asWritableBytes(s) };
}

} // namespace cokacenc::security

#endif // INCLUDE_COKACENC_SECURITY_SCOPEWIPE_HPP
