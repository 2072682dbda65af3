#ifndef INCLUDE_COKACENC_CRYPTO_KDFPARAMS_HPP
#define INCLUDE_COKACENC_CRYPTO_KDFPARAMS_HPP

#include <cstddef>
#include <cstdint>

namespace cokacenc::crypto
{

constexpr std::size_t g_pbkdf2SaltBytes{ 16 };
constexpr std::size_t g_chunkKeyBytes{ 32 };

constexpr std::uint32_t g_kPbkdf2DefaultIterations{ 100'000U };

// Upper bound accepted from callers; keeps a typo from turning one chunk into an hour of hashing.
constexpr std::uint32_t g_kPbkdf2MaxIterations{ 10'000'000U };

// PBKDF2-HMAC-SHA512. Chunk headers do not record these values, so pack and unpack must agree on them.
struct Pbkdf2Params final
{
    std::uint32_t iterations;
};

constexpr Pbkdf2Params g_kPbkdf2DefaultParams{ .iterations = g_kPbkdf2DefaultIterations };

} // namespace cokacenc::crypto

#endif // INCLUDE_COKACENC_CRYPTO_KDFPARAMS_HPP
