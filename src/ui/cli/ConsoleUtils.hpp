#ifndef COKACENC_UI_CLI_CONSOLEUTILS_HPP
#define COKACENC_UI_CLI_CONSOLEUTILS_HPP

namespace cokacenc::ui::cli
{

struct MemoryLockStatus final
{
    bool coreDumpsDisabled{ false };
    // Usually false for unprivileged users with a small RLIMIT_MEMLOCK.
    bool memoryLocked{ false };
};

// Keeps the key and derived keys out of core dumps and, where allowed, out of swap.
[[nodiscard]] MemoryLockStatus lockProcessMemory() noexcept;

} // namespace cokacenc::ui::cli

#endif // COKACENC_UI_CLI_CONSOLEUTILS_HPP
