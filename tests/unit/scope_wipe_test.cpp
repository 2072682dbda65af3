#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <span>

#include "cokacenc/security/ScopeWipe.hpp"

namespace
{

constexpr std::size_t g_bufferSize{ 32U };
constexpr std::uint8_t g_nonZeroByte{ 0xA5U };

void expectAllBytesEq(std::span<const std::uint8_t> buffer, std::uint8_t expected)
{
    for (const auto b : buffer)
    {
        EXPECT_EQ(b, expected);
    }
}

} // namespace

TEST(ScopeWipe, WipesOnDestruction)
{
    std::array<std::uint8_t, g_bufferSize> buffer{};
    buffer.fill(g_nonZeroByte);

    {
        const auto guard = cokacenc::security::scopeWipe(std::span{ buffer });
        (void)guard;
        expectAllBytesEq(buffer, g_nonZeroByte);
    }

    expectAllBytesEq(buffer, std::uint8_t{});
}

TEST(ScopeWipe, ReleaseDisablesWipe)
{
    std::array<std::uint8_t, g_bufferSize> buffer{};
    buffer.fill(g_nonZeroByte);

    {
        auto guard = cokacenc::security::scopeWipe(std::span{ buffer });
        guard.release();
    }

    expectAllBytesEq(buffer, g_nonZeroByte);
}

TEST(ScopeWipe, MoveTransfersWipeResponsibility)
{
    std::array<std::uint8_t, g_bufferSize> buffer{};
    buffer.fill(g_nonZeroByte);

    {
        auto a = cokacenc::security::scopeWipe(std::span{ buffer });
        {
            auto b = std::move(a);
            (void)b;
        }
        expectAllBytesEq(buffer, std::uint8_t{});
        buffer.fill(g_nonZeroByte);
    }

    // The moved-from guard no longer owns the span.
    expectAllBytesEq(buffer, g_nonZeroByte);
}

TEST(ScopeWipe, WipesSecretStringInPlace)
{
    auto secret{ cokacenc::security::secureStringFrom("c2VjcmV0LWtleQ") };
    const auto size{ secret.size() };

    {
        const auto guard = cokacenc::security::scopeWipe(secret);
        (void)guard;
    }

    ASSERT_EQ(secret.size(), size);
    for (const char c : secret)
    {
        EXPECT_EQ(c, '\0');
    }
}

TEST(ScopeWipe, WipesDerivedKeyBuffer)
{
    cokacenc::security::SecureBuffer key(g_bufferSize, g_nonZeroByte);

    {
        const auto guard = cokacenc::security::scopeWipe(key);
        (void)guard;
    }

    expectAllBytesEq(key, std::uint8_t{});
}
