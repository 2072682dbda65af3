#include "cokacenc/crypto/providers/OpenSslProviderFactory.hpp"
#include "cokacenc/crypto/KeyDerivation.hpp"
#include "cokacenc/security/SecureMemory.hpp"
#include "cokacenc/security/SecureRandom.hpp"
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <openssl/evp.h>
#include <span>
#include <stdexcept>
#include <vector>

namespace cokacenc::crypto::providers
{
namespace
{

using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

void requireExactSize(std::span<const std::uint8_t> s, std::size_t expected, const char* what)
{
    if (s.size() != expected)
    {
        throw std::invalid_argument(what);
    }
}

void requireIntSized(std::span<const std::uint8_t> s, const char* what)
{
    if (s.size() > static_cast<std::size_t>(std::numeric_limits<int>::max() - static_cast<int>(g_aesBlockBytes)))
    {
        throw std::invalid_argument(what);
    }
}

EvpCipherCtxPtr makeCbcContext(std::span<const std::uint8_t> key, std::span<const std::uint8_t> iv, bool encrypt)
{
    requireExactSize(key, g_aesKeyBytes, "makeCbcContext: key");
    requireExactSize(iv, g_aesIvBytes, "makeCbcContext: iv");

    EvpCipherCtxPtr ctx{ EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free };
    if (!ctx)
    {
        throw std::runtime_error("makeCbcContext: EVP_CIPHER_CTX_new failed");
    }
    if (EVP_CipherInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv.data(), encrypt ? 1 : 0) != 1)
    {
        throw std::runtime_error("makeCbcContext: EVP_CipherInit_ex failed");
    }
    return ctx;
}

class OpenSslChunkEncryptor final : public cokacenc::crypto::IChunkEncryptor
{
public:
    OpenSslChunkEncryptor(std::span<const std::uint8_t> key, std::span<const std::uint8_t> iv)
        : m_ctx{ makeCbcContext(key, iv, true) }
    {
    }

    void update(std::span<const std::uint8_t> plainText, std::vector<std::uint8_t>& out) override
    {
        requireActive();
        requireIntSized(plainText, "OpenSslChunkEncryptor::update: input too large");

        out.resize(plainText.size() + g_aesBlockBytes);
        int outLen{ 0 };
        if (!plainText.empty() && EVP_EncryptUpdate(m_ctx.get(), out.data(), &outLen, plainText.data(),
                                                    static_cast<int>(plainText.size())) != 1)
        {
            throw std::runtime_error("OpenSslChunkEncryptor::update: EVP_EncryptUpdate failed");
        }
        if (outLen < 0 || static_cast<std::size_t>(outLen) > out.size())
        {
            throw std::runtime_error("OpenSslChunkEncryptor::update: invalid output length");
        }
        out.resize(static_cast<std::size_t>(outLen));
        m_pendingBytes = (m_pendingBytes + plainText.size()) % g_aesBlockBytes;
    }

    void finish(CbcPadding padding, std::vector<std::uint8_t>& out) override
    {
        requireActive();
        if (padding == CbcPadding::None)
        {
            if (m_pendingBytes != 0U)
            {
                throw std::invalid_argument("OpenSslChunkEncryptor::finish: unpadded chunk is not block aligned");
            }
            EVP_CIPHER_CTX_set_padding(m_ctx.get(), 0);
        }

        out.resize(g_aesBlockBytes);
        int finalLen{ 0 };
        if (EVP_EncryptFinal_ex(m_ctx.get(), out.data(), &finalLen) != 1)
        {
            throw std::runtime_error("OpenSslChunkEncryptor::finish: EVP_EncryptFinal_ex failed");
        }
        if (finalLen < 0 || static_cast<std::size_t>(finalLen) > out.size())
        {
            throw std::runtime_error("OpenSslChunkEncryptor::finish: invalid output length");
        }
        out.resize(static_cast<std::size_t>(finalLen));
        m_finished = true;
    }

private:
    void requireActive() const
    {
        if (m_finished)
        {
            throw std::runtime_error("OpenSslChunkEncryptor: stream already finished");
        }
    }

    EvpCipherCtxPtr m_ctx;
    std::size_t m_pendingBytes{ 0U };
    bool m_finished{ false };
};

class OpenSslChunkDecryptor final : public cokacenc::crypto::IChunkDecryptor
{
public:
    OpenSslChunkDecryptor(std::span<const std::uint8_t> key, std::span<const std::uint8_t> iv, CbcPadding padding)
        : m_ctx{ makeCbcContext(key, iv, false) }
    {
        // Must be decided before the first update: with padding on, OpenSSL holds back the last block.
        if (padding == CbcPadding::None)
        {
            EVP_CIPHER_CTX_set_padding(m_ctx.get(), 0);
        }
    }

    void update(std::span<const std::uint8_t> cipherText, std::vector<std::uint8_t>& out) override
    {
        requireActive();
        requireIntSized(cipherText, "OpenSslChunkDecryptor::update: input too large");

        out.resize(cipherText.size() + g_aesBlockBytes);
        int outLen{ 0 };
        if (!cipherText.empty() && EVP_DecryptUpdate(m_ctx.get(), out.data(), &outLen, cipherText.data(),
                                                     static_cast<int>(cipherText.size())) != 1)
        {
            throw std::runtime_error("OpenSslChunkDecryptor::update: EVP_DecryptUpdate failed");
        }
        if (outLen < 0 || static_cast<std::size_t>(outLen) > out.size())
        {
            throw std::runtime_error("OpenSslChunkDecryptor::update: invalid output length");
        }
        out.resize(static_cast<std::size_t>(outLen));
    }

    [[nodiscard]] bool finish(std::vector<std::uint8_t>& out) override
    {
        requireActive();
        m_finished = true;

        out.resize(g_aesBlockBytes);
        int finalLen{ 0 };
        if (EVP_DecryptFinal_ex(m_ctx.get(), out.data(), &finalLen) != 1)
        {
            out.clear();
            return false;
        }
        if (finalLen < 0 || static_cast<std::size_t>(finalLen) > out.size())
        {
            out.clear();
            return false;
        }
        out.resize(static_cast<std::size_t>(finalLen));
        return true;
    }

private:
    void requireActive() const
    {
        if (m_finished)
        {
            throw std::runtime_error("OpenSslChunkDecryptor: stream already finished");
        }
    }

    EvpCipherCtxPtr m_ctx;
    bool m_finished{ false };
};

class OpenSslCryptoProvider final : public cokacenc::crypto::ICryptoProvider
{
public:
    [[nodiscard]] cokacenc::security::SecureBuffer deriveChunkKey(std::span<const std::byte> secret,
                                                                  std::span<const std::uint8_t> salt,
                                                                  const Pbkdf2Params& params) const override
    {
        return cokacenc::crypto::deriveChunkKeyPbkdf2Sha512(secret, salt, params);
    }

    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        return cokacenc::security::secureRandomFill(out);
    }

    [[nodiscard]] std::unique_ptr<IChunkEncryptor> makeChunkEncryptor(std::span<const std::uint8_t> key,
                                                                      std::span<const std::uint8_t> iv) override
    {
        return std::make_unique<OpenSslChunkEncryptor>(key, iv);
    }

    [[nodiscard]] std::unique_ptr<IChunkDecryptor> makeChunkDecryptor(std::span<const std::uint8_t> key,
                                                                      std::span<const std::uint8_t> iv,
                                                                      CbcPadding padding) override
    {
        return std::make_unique<OpenSslChunkDecryptor>(key, iv, padding);
    }
};

} // namespace

[[nodiscard]] std::unique_ptr<cokacenc::crypto::ICryptoProvider> makeOpenSslCryptoProvider()
{
    return std::make_unique<OpenSslCryptoProvider>();
}

} // namespace cokacenc::crypto::providers
