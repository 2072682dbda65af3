#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <stdexcept>
#include <string_view>
#include <vector>

#include "TestUtils.hpp"
#include "cokacenc/crypto/Md5Digest.hpp"
#include "cokacenc/crypto/providers/OpenSslProviderFactory.hpp"

namespace
{

using cokacenc::crypto::CbcPadding;

// NIST SP 800-38A, F.2.5 CBC-AES256.Encrypt.
constexpr std::array<std::uint8_t, 32> g_kNistKey{ 0x60, 0x3d, 0xeb, 0x10, 0x15, 0xca, 0x71, 0xbe, 0x2b, 0x73, 0xae,
                                                   0xf0, 0x85, 0x7d, 0x77, 0x81, 0x1f, 0x35, 0x2c, 0x07, 0x3b, 0x61,
                                                   0x08, 0xd7, 0x2d, 0x98, 0x10, 0xa3, 0x09, 0x14, 0xdf, 0xf4 };
constexpr std::array<std::uint8_t, 16> g_kNistIv{ 0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07,
                                                  0x08, 0x09, 0x0a, 0x0b, 0x0c, 0x0d, 0x0e, 0x0f };
constexpr std::array<std::uint8_t, 32> g_kNistPlain{ 0x6b, 0xc1, 0xbe, 0xe2, 0x2e, 0x40, 0x9f, 0x96, 0xe9, 0x3d, 0x7e,
                                                     0x11, 0x73, 0x93, 0x17, 0x2a, 0xae, 0x2d, 0x8a, 0x57, 0x1e, 0x03,
                                                     0xac, 0x9c, 0x9e, 0xb7, 0x6f, 0xac, 0x45, 0xaf, 0x8e, 0x51 };
constexpr std::string_view g_kNistCipherHex{ "f58c4c04d6e5f1ba779eabfb5f7bfbd69cfc4e967edb808d679f777bc6702c7d" };

[[nodiscard]] std::vector<std::uint8_t> encryptAll(cokacenc::crypto::ICryptoProvider& crypto,
                                                   std::span<const std::uint8_t> key, std::span<const std::uint8_t> iv,
                                                   std::span<const std::uint8_t> plain, CbcPadding padding)
{
    auto enc{ crypto.makeChunkEncryptor(key, iv) };
    std::vector<std::uint8_t> out{};
    std::vector<std::uint8_t> piece{};
    enc->update(plain, piece);
    out.insert(out.end(), piece.begin(), piece.end());
    enc->finish(padding, piece);
    out.insert(out.end(), piece.begin(), piece.end());
    return out;
}

[[nodiscard]] bool decryptAll(cokacenc::crypto::ICryptoProvider& crypto, std::span<const std::uint8_t> key,
                              std::span<const std::uint8_t> iv, std::span<const std::uint8_t> cipher,
                              CbcPadding padding, std::vector<std::uint8_t>& out)
{
    auto dec{ crypto.makeChunkDecryptor(key, iv, padding) };
    std::vector<std::uint8_t> piece{};
    out.clear();
    dec->update(cipher, piece);
    out.insert(out.end(), piece.begin(), piece.end());
    const bool ok{ dec->finish(piece) };
    out.insert(out.end(), piece.begin(), piece.end());
    return ok;
}

} // namespace

class OpenSslCryptoProviderTest : public ::testing::Test
{
protected:
    std::unique_ptr<cokacenc::crypto::ICryptoProvider> m_crypto{
        cokacenc::crypto::providers::makeOpenSslCryptoProvider()
    };
};

TEST_F(OpenSslCryptoProviderTest, UnpaddedStreamMatchesNistVector)
{
    const auto cipher{ encryptAll(*m_crypto, g_kNistKey, g_kNistIv, g_kNistPlain, CbcPadding::None) };
    EXPECT_EQ(cokacenc::crypto::toLowerHex(cipher), g_kNistCipherHex);

    std::vector<std::uint8_t> plain{};
    ASSERT_TRUE(decryptAll(*m_crypto, g_kNistKey, g_kNistIv, cipher, CbcPadding::None, plain));
    EXPECT_TRUE(std::equal(plain.begin(), plain.end(), g_kNistPlain.begin(), g_kNistPlain.end()));
}

TEST_F(OpenSslCryptoProviderTest, PaddedStreamAddsAFullBlockOnBoundary)
{
    const auto cipher{ encryptAll(*m_crypto, g_kNistKey, g_kNistIv, g_kNistPlain, CbcPadding::Pkcs7) };
    ASSERT_EQ(cipher.size(), g_kNistPlain.size() + cokacenc::crypto::g_aesBlockBytes);
    // CBC prefix is unaffected by the padding block.
    EXPECT_EQ(cokacenc::crypto::toLowerHex(std::span{ cipher }.first(32U)), g_kNistCipherHex);

    std::vector<std::uint8_t> plain{};
    ASSERT_TRUE(decryptAll(*m_crypto, g_kNistKey, g_kNistIv, cipher, CbcPadding::Pkcs7, plain));
    EXPECT_TRUE(std::equal(plain.begin(), plain.end(), g_kNistPlain.begin(), g_kNistPlain.end()));
}

TEST_F(OpenSslCryptoProviderTest, PaddedRoundTripAcrossUpdates)
{
    const auto data{ cokacenc::test_utils::patternBytes(1000U) };

    auto enc{ m_crypto->makeChunkEncryptor(g_kNistKey, g_kNistIv) };
    std::vector<std::uint8_t> cipher{};
    std::vector<std::uint8_t> piece{};
    for (std::size_t off{}; off < data.size(); off += 333U)
    {
        const auto take{ std::min<std::size_t>(333U, data.size() - off) };
        enc->update(std::span{ data }.subspan(off, take), piece);
        cipher.insert(cipher.end(), piece.begin(), piece.end());
    }
    enc->finish(CbcPadding::Pkcs7, piece);
    cipher.insert(cipher.end(), piece.begin(), piece.end());
    EXPECT_EQ(cipher.size(), 1008U);

    std::vector<std::uint8_t> plain{};
    ASSERT_TRUE(decryptAll(*m_crypto, g_kNistKey, g_kNistIv, cipher, CbcPadding::Pkcs7, plain));
    EXPECT_EQ(plain, data);
}

TEST_F(OpenSslCryptoProviderTest, EmptyPaddedStreamIsOneBlock)
{
    const auto cipher{ encryptAll(*m_crypto, g_kNistKey, g_kNistIv, {}, CbcPadding::Pkcs7) };
    EXPECT_EQ(cipher.size(), cokacenc::crypto::g_aesBlockBytes);

    std::vector<std::uint8_t> plain{};
    ASSERT_TRUE(decryptAll(*m_crypto, g_kNistKey, g_kNistIv, cipher, CbcPadding::Pkcs7, plain));
    EXPECT_TRUE(plain.empty());
}

TEST_F(OpenSslCryptoProviderTest, UnpaddedFinishRejectsPartialBlock)
{
    auto enc{ m_crypto->makeChunkEncryptor(g_kNistKey, g_kNistIv) };
    std::vector<std::uint8_t> out{};
    enc->update(std::span{ g_kNistPlain }.first(20U), out);
    EXPECT_THROW(enc->finish(CbcPadding::None, out), std::invalid_argument);
}

TEST_F(OpenSslCryptoProviderTest, UpdateAfterFinishThrows)
{
    auto enc{ m_crypto->makeChunkEncryptor(g_kNistKey, g_kNistIv) };
    std::vector<std::uint8_t> out{};
    enc->finish(CbcPadding::Pkcs7, out);
    EXPECT_THROW(enc->update(g_kNistPlain, out), std::runtime_error);
}

TEST_F(OpenSslCryptoProviderTest, WrongKeyFailsPaddingCheckOrGarbles)
{
    const auto data{ cokacenc::test_utils::patternBytes(100U) };
    const auto cipher{ encryptAll(*m_crypto, g_kNistKey, g_kNistIv, data, CbcPadding::Pkcs7) };

    auto otherKey{ g_kNistKey };
    otherKey[0] ^= 0x01U;
    std::vector<std::uint8_t> plain{};
    const bool ok{ decryptAll(*m_crypto, otherKey, g_kNistIv, cipher, CbcPadding::Pkcs7, plain) };
    if (ok)
    {
        EXPECT_NE(plain, data);
    }
}

TEST_F(OpenSslCryptoProviderTest, InvalidPaddingIsReported)
{
    // The NIST plaintext ends in 0x51, which is not a PKCS7 pad byte.
    const auto cipher{ encryptAll(*m_crypto, g_kNistKey, g_kNistIv, g_kNistPlain, CbcPadding::None) };

    std::vector<std::uint8_t> plain{};
    EXPECT_FALSE(decryptAll(*m_crypto, g_kNistKey, g_kNistIv, cipher, CbcPadding::Pkcs7, plain));
}

TEST_F(OpenSslCryptoProviderTest, TruncatedCiphertextFailsFinish)
{
    const auto data{ cokacenc::test_utils::patternBytes(64U) };
    const auto cipher{ encryptAll(*m_crypto, g_kNistKey, g_kNistIv, data, CbcPadding::Pkcs7) };

    std::vector<std::uint8_t> plain{};
    EXPECT_FALSE(decryptAll(*m_crypto, g_kNistKey, g_kNistIv, std::span{ cipher }.first(cipher.size() - 5U),
                            CbcPadding::Pkcs7, plain));
    EXPECT_FALSE(decryptAll(*m_crypto, g_kNistKey, g_kNistIv, std::span{ cipher }.first(cipher.size() - 5U),
                            CbcPadding::None, plain));
}

TEST_F(OpenSslCryptoProviderTest, RejectsWrongKeyAndIvSizes)
{
    const std::array<std::uint8_t, 16> shortKey{};
    const std::array<std::uint8_t, 12> shortIv{};
    EXPECT_THROW((void)m_crypto->makeChunkEncryptor(shortKey, g_kNistIv), std::invalid_argument);
    EXPECT_THROW((void)m_crypto->makeChunkEncryptor(g_kNistKey, shortIv), std::invalid_argument);
    EXPECT_THROW((void)m_crypto->makeChunkDecryptor(shortKey, g_kNistIv, CbcPadding::Pkcs7), std::invalid_argument);
}

TEST_F(OpenSslCryptoProviderTest, DeriveChunkKeyUsesPbkdf2)
{
    std::array<std::uint8_t, cokacenc::crypto::g_pbkdf2SaltBytes> salt{};
    for (std::size_t i{}; i < salt.size(); ++i)
    {
        salt[i] = static_cast<std::uint8_t>(i);
    }
    constexpr std::string_view kSecret{ "password" };
    const std::span<const std::byte> secret{ reinterpret_cast<const std::byte*>(kSecret.data()), kSecret.size() };

    const auto key{ m_crypto->deriveChunkKey(secret, salt, cokacenc::test_utils::g_kFastKdf) };
    EXPECT_EQ(cokacenc::crypto::toLowerHex(key), "c74e4080d0fbb41fee5868c0ff60fd75acae2638215987e5ff54f8eae211339b");
}

TEST_F(OpenSslCryptoProviderTest, RandomBytesFillsBuffer)
{
    std::array<std::uint8_t, 32> a{};
    std::array<std::uint8_t, 32> b{};
    ASSERT_TRUE(m_crypto->randomBytes(a));
    ASSERT_TRUE(m_crypto->randomBytes(b));
    EXPECT_NE(a, b);
}
