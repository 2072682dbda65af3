#ifndef COKACENC_UI_CLI_KEYFILE_HPP
#define COKACENC_UI_CLI_KEYFILE_HPP

#include "cokacenc/security/SecureMemory.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>

namespace cokacenc::ui::cli
{

constexpr std::size_t g_kDefaultKeyBytes{ 64U };
constexpr std::size_t g_kMaxKeyFileBytes{ 1024U * 1024U };

// Reads the key file and trims surrounding ASCII whitespace. Throws std::runtime_error if it cannot be read,
// is larger than g_kMaxKeyFileBytes, or is empty after trimming.
[[nodiscard]] cokacenc::security::SecureString loadKeyFile(const std::filesystem::path& path);

// Standard alphabet, no '=' padding.
[[nodiscard]] cokacenc::security::SecureString encodeBase64(std::span<const std::uint8_t> bytes);

// Writes `length` random bytes as Base64 to `path` and returns the number of characters written.
// Refuses to replace an existing file unless `force`.
std::size_t generateKeyFile(const std::filesystem::path& path, std::size_t length, bool force);

} // namespace cokacenc::ui::cli

#endif // COKACENC_UI_CLI_KEYFILE_HPP
