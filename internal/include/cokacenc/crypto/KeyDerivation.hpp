#ifndef INTERNAL_COKACENC_CRYPTO_KEYDERIVATION_HPP
#define INTERNAL_COKACENC_CRYPTO_KEYDERIVATION_HPP

#include "cokacenc/crypto/KdfParams.hpp"
#include "cokacenc/security/SecureMemory.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

namespace cokacenc::crypto
{

// PBKDF2-HMAC-SHA512 producing a g_chunkKeyBytes key.
[[nodiscard]] cokacenc::security::SecureBuffer deriveChunkKeyPbkdf2Sha512(std::span<const std::byte> secret,
                                                                         std::span<const std::uint8_t> salt,
                                                                         Pbkdf2Params params);

} // namespace cokacenc::crypto

#endif // INTERNAL_COKACENC_CRYPTO_KEYDERIVATION_HPP
