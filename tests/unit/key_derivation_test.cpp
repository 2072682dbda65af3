#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string_view>

#include "TestUtils.hpp"
#include "cokacenc/crypto/KeyDerivation.hpp"
#include "cokacenc/crypto/Md5Digest.hpp"

namespace
{

constexpr std::size_t g_invalidSaltBytes{ cokacenc::crypto::g_pbkdf2SaltBytes - 1U };
constexpr std::string_view g_kPassword{ "password" };

std::span<const std::byte> asBytes(std::string_view s)
{
    return { reinterpret_cast<const std::byte*>(s.data()), s.size() };
}

[[nodiscard]] std::array<std::uint8_t, cokacenc::crypto::g_pbkdf2SaltBytes> countingSalt()
{
    std::array<std::uint8_t, cokacenc::crypto::g_pbkdf2SaltBytes> salt{};
    for (std::size_t i{}; i < salt.size(); ++i)
    {
        salt[i] = static_cast<std::uint8_t>(i);
    }
    return salt;
}

} // namespace

TEST(KeyDerivation, RejectsEmptySecret)
{
    const auto salt{ countingSalt() };
    EXPECT_THROW((void)cokacenc::crypto::deriveChunkKeyPbkdf2Sha512(std::span<const std::byte>{}, salt,
                                                                    cokacenc::test_utils::g_kFastKdf),
                 std::invalid_argument);
}

TEST(KeyDerivation, RejectsWrongSaltSize)
{
    std::array<std::uint8_t, g_invalidSaltBytes> salt{};
    EXPECT_THROW((void)cokacenc::crypto::deriveChunkKeyPbkdf2Sha512(asBytes(g_kPassword), salt,
                                                                    cokacenc::test_utils::g_kFastKdf),
                 std::invalid_argument);
}

TEST(KeyDerivation, RejectsUnsafeIterationCounts)
{
    const auto salt{ countingSalt() };
    EXPECT_THROW((void)cokacenc::crypto::deriveChunkKeyPbkdf2Sha512(asBytes(g_kPassword), salt, { .iterations = 0U }),
                 std::invalid_argument);
    EXPECT_THROW((void)cokacenc::crypto::deriveChunkKeyPbkdf2Sha512(
                     asBytes(g_kPassword), salt, { .iterations = cokacenc::crypto::g_kPbkdf2MaxIterations + 1U }),
                 std::invalid_argument);
}

TEST(KeyDerivation, MatchesPbkdf2HmacSha512Vectors)
{
    const auto salt{ countingSalt() };
    const auto key{ cokacenc::crypto::deriveChunkKeyPbkdf2Sha512(asBytes(g_kPassword), salt,
                                                                 cokacenc::test_utils::g_kFastKdf) };
    ASSERT_EQ(key.size(), cokacenc::crypto::g_chunkKeyBytes);
    EXPECT_EQ(cokacenc::crypto::toLowerHex(key), "c74e4080d0fbb41fee5868c0ff60fd75acae2638215987e5ff54f8eae211339b");

    constexpr std::string_view kAsciiSalt{ "saltsaltsaltsalt" };
    const std::span<const std::uint8_t> asciiSalt{ reinterpret_cast<const std::uint8_t*>(kAsciiSalt.data()),
                                                   kAsciiSalt.size() };
    const auto single{ cokacenc::crypto::deriveChunkKeyPbkdf2Sha512(asBytes(g_kPassword), asciiSalt,
                                                                    { .iterations = 1U }) };
    EXPECT_EQ(cokacenc::crypto::toLowerHex(single),
              "ccc6bd2cbf575bd344c9cf542877fc6e9372cbf1f1e1df392c6cf5f6038bb574");
}

TEST(KeyDerivation, IsDeterministic)
{
    const auto salt{ countingSalt() };
    const auto a{ cokacenc::crypto::deriveChunkKeyPbkdf2Sha512(asBytes(g_kPassword), salt,
                                                               cokacenc::test_utils::g_kFastKdf) };
    const auto b{ cokacenc::crypto::deriveChunkKeyPbkdf2Sha512(asBytes(g_kPassword), salt,
                                                               cokacenc::test_utils::g_kFastKdf) };
    EXPECT_EQ(a, b);
}

TEST(KeyDerivation, DifferentSaltProducesDifferentKey)
{
    auto saltA{ countingSalt() };
    auto saltB{ countingSalt() };
    saltB[0] = 0xFFU;

    const auto a{ cokacenc::crypto::deriveChunkKeyPbkdf2Sha512(asBytes(g_kPassword), saltA,
                                                               cokacenc::test_utils::g_kFastKdf) };
    const auto b{ cokacenc::crypto::deriveChunkKeyPbkdf2Sha512(asBytes(g_kPassword), saltB,
                                                               cokacenc::test_utils::g_kFastKdf) };
    EXPECT_NE(a, b);
}

TEST(KeyDerivation, DefaultIterationCountMatchesReference)
{
    if (!cokacenc::test_utils::slowTestsEnabled())
    {
        GTEST_SKIP() << "Set COKACENC_RUN_SLOW_TESTS=1 to run slow KDF tests.";
    }

    const auto salt{ countingSalt() };
    const auto key{ cokacenc::crypto::deriveChunkKeyPbkdf2Sha512(asBytes(g_kPassword), salt,
                                                                 cokacenc::crypto::g_kPbkdf2DefaultParams) };
    EXPECT_EQ(cokacenc::crypto::toLowerHex(key), "fbde14d338cc6f821057f3f4a78ac20bc701b11e37a93b3790c3510e019473f3");
}
