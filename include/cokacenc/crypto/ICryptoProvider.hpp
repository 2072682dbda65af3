#ifndef INCLUDE_COKACENC_CRYPTO_ICRYPTOPROVIDER_HPP
#define INCLUDE_COKACENC_CRYPTO_ICRYPTOPROVIDER_HPP

#include "cokacenc/crypto/KdfParams.hpp"
#include "cokacenc/security/SecureMemory.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace cokacenc::crypto
{

constexpr std::size_t g_aesKeyBytes{ 32 };
constexpr std::size_t g_aesIvBytes{ 16 };
constexpr std::size_t g_aesBlockBytes{ 16 };

// Whether a CBC stream ends with PKCS7 padding. Only the last chunk of a logical file is padded.
enum class CbcPadding : std::uint8_t
{
    Pkcs7,
    None,
};

// One AES-256-CBC encryption stream covering a single chunk.
class IChunkEncryptor
{
public:
    IChunkEncryptor() = default;
    IChunkEncryptor(const IChunkEncryptor&) = delete;
    IChunkEncryptor& operator=(const IChunkEncryptor&) = delete;
    IChunkEncryptor(IChunkEncryptor&&) = delete;
    IChunkEncryptor& operator=(IChunkEncryptor&&) = delete;
    virtual ~IChunkEncryptor() = default;

    // Replaces `out` with the ciphertext produced for `plainText`. Throws std::runtime_error on library failure.
    virtual void update(std::span<const std::uint8_t> plainText, std::vector<std::uint8_t>& out) = 0;

    // Flushes the stream. With CbcPadding::None the plaintext fed so far must be a whole number of blocks,
    // otherwise std::invalid_argument is thrown.
    virtual void finish(CbcPadding padding, std::vector<std::uint8_t>& out) = 0;
};

// One AES-256-CBC decryption stream covering a single chunk. Padding mode is fixed at construction.
class IChunkDecryptor
{
public:
    IChunkDecryptor() = default;
    IChunkDecryptor(const IChunkDecryptor&) = delete;
    IChunkDecryptor& operator=(const IChunkDecryptor&) = delete;
    IChunkDecryptor(IChunkDecryptor&&) = delete;
    IChunkDecryptor& operator=(IChunkDecryptor&&) = delete;
    virtual ~IChunkDecryptor() = default;

    virtual void update(std::span<const std::uint8_t> cipherText, std::vector<std::uint8_t>& out) = 0;

    // Returns false when the ciphertext is not a whole number of blocks or the PKCS7 padding is invalid.
    [[nodiscard]] virtual bool finish(std::vector<std::uint8_t>& out) = 0;
};

class ICryptoProvider
{
public:
    ICryptoProvider() = default;
    ICryptoProvider(const ICryptoProvider&) = delete;
    ICryptoProvider& operator=(const ICryptoProvider&) = delete;
    ICryptoProvider(ICryptoProvider&&) = delete;
    ICryptoProvider& operator=(ICryptoProvider&&) = delete;
    virtual ~ICryptoProvider() = default;

    // Derives the per-chunk AES key from the shared secret and the chunk's salt.
    // Contract violations (empty secret, wrong salt size, bad iteration count) throw std::invalid_argument.
    [[nodiscard]] virtual cokacenc::security::SecureBuffer
    deriveChunkKey(std::span<const std::byte> secret, std::span<const std::uint8_t> salt,
                   const Pbkdf2Params& params) const = 0;

    [[nodiscard]] virtual bool randomBytes(std::span<std::uint8_t> out) noexcept = 0;

    [[nodiscard]] virtual std::unique_ptr<IChunkEncryptor> makeChunkEncryptor(std::span<const std::uint8_t> key,
                                                                              std::span<const std::uint8_t> iv) = 0;

    [[nodiscard]] virtual std::unique_ptr<IChunkDecryptor>
    makeChunkDecryptor(std::span<const std::uint8_t> key, std::span<const std::uint8_t> iv, CbcPadding padding) = 0;
};

} // namespace cokacenc::crypto

#endif // INCLUDE_COKACENC_CRYPTO_ICRYPTOPROVIDER_HPP
