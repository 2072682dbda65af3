#include "cokacenc/crypto/KeyDerivation.hpp"

#include <array>
#include <cstring>
#include <limits>
#include <memory>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <stdexcept>

namespace cokacenc::crypto
{
namespace
{

using EvpKdfPtr = std::unique_ptr<EVP_KDF, decltype(&EVP_KDF_free)>;
using EvpKdfCtxPtr = std::unique_ptr<EVP_KDF_CTX, decltype(&EVP_KDF_CTX_free)>;

} // namespace

[[nodiscard]] cokacenc::security::SecureBuffer deriveChunkKeyPbkdf2Sha512(std::span<const std::byte> secret,
                                                                         std::span<const std::uint8_t> salt,
                                                                         Pbkdf2Params params)
{
    if (secret.empty())
    {
        throw std::invalid_argument("deriveChunkKeyPbkdf2Sha512: empty secret");
    }
    if (salt.size() != g_pbkdf2SaltBytes)
    {
        throw std::invalid_argument("deriveChunkKeyPbkdf2Sha512: invalid salt size");
    }
    if (params.iterations == 0U)
    {
        throw std::invalid_argument("deriveChunkKeyPbkdf2Sha512: invalid iteration count");
    }
    if (params.iterations > g_kPbkdf2MaxIterations)
    {
        throw std::invalid_argument("deriveChunkKeyPbkdf2Sha512: unsafe iteration count");
    }
    if (secret.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()))
    {
        throw std::invalid_argument("deriveChunkKeyPbkdf2Sha512: secret too large");
    }

    EvpKdfPtr kdf{ EVP_KDF_fetch(nullptr, "PBKDF2", nullptr), &EVP_KDF_free };
    if (!kdf)
    {
        throw std::runtime_error("deriveChunkKeyPbkdf2Sha512: OpenSSL PBKDF2 not available");
    }
    EvpKdfCtxPtr ctx{ EVP_KDF_CTX_new(kdf.get()), &EVP_KDF_CTX_free };
    if (!ctx)
    {
        throw std::runtime_error("deriveChunkKeyPbkdf2Sha512: EVP_KDF_CTX_new failed");
    }

    // OSSL_PARAM takes non-const pointers even for inputs, so hand it private copies.
    cokacenc::security::SecureBuffer secretCopy{};
    secretCopy.resize(secret.size());
    std::memcpy(secretCopy.data(), secret.data(), secret.size());

    std::array<std::uint8_t, g_pbkdf2SaltBytes> saltCopy{};
    std::memcpy(saltCopy.data(), salt.data(), saltCopy.size());

    std::uint64_t iterations{ params.iterations };
    // pkcs5=1 keeps the classic PKCS5_PBKDF2_HMAC semantics (no SP 800-132 lower bounds on iterations).
    int pkcs5Mode{ 1 };
    char digestName[]{ "SHA512" };

    OSSL_PARAM kdfParams[]{
        OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_PASSWORD, secretCopy.data(), secretCopy.size()),
        OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT, saltCopy.data(), saltCopy.size()),
        OSSL_PARAM_construct_uint64(OSSL_KDF_PARAM_ITER, &iterations),
        OSSL_PARAM_construct_utf8_string(OSSL_KDF_PARAM_DIGEST, digestName, 0),
        OSSL_PARAM_construct_int(OSSL_KDF_PARAM_PKCS5, &pkcs5Mode),
        OSSL_PARAM_construct_end(),
    };

    cokacenc::security::SecureBuffer key{};
    key.resize(g_chunkKeyBytes);
    const int rc{ EVP_KDF_derive(ctx.get(), key.data(), key.size(), kdfParams) };
    cokacenc::security::secureRelease(secretCopy);
    if (rc <= 0)
    {
        cokacenc::security::secureRelease(key);
        throw std::runtime_error("deriveChunkKeyPbkdf2Sha512: EVP_KDF_derive failed");
    }
    return key;
}

} // namespace cokacenc::crypto
