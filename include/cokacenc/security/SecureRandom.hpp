#ifndef INCLUDE_COKACENC_SECURITY_SECURERANDOM_HPP
#define INCLUDE_COKACENC_SECURITY_SECURERANDOM_HPP

#include <cstdint>
#include <span>

namespace cokacenc::security
{

// Fills `out` from the OS CSPRNG. Returns false if the kernel source fails or runs dry.
[[nodiscard]] bool secureRandomFill(std::span<std::uint8_t> out) noexcept;

} // namespace cokacenc::security

#endif // INCLUDE_COKACENC_SECURITY_SECURERANDOM_HPP
