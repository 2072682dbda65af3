#include "ConsoleUtils.hpp"

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#elif defined(__linux__)
#include <sys/mman.h>
#include <sys/resource.h>
#else
#error "Unsupported platform"
#endif

namespace cokacenc::ui::cli
{

MemoryLockStatus lockProcessMemory() noexcept
{
    MemoryLockStatus status{};
#if defined(_WIN32)
    // TODO: VirtualLock the key buffers once they come from a dedicated arena.
    status.coreDumpsDisabled = true;
#elif defined(__linux__)
    struct rlimit lim
    {
        0, 0
    };
    status.coreDumpsDisabled = setrlimit(RLIMIT_CORE, &lim) == 0;
    status.memoryLocked = mlockall(MCL_CURRENT | MCL_FUTURE) == 0;
#endif
    return status;
}

} // namespace cokacenc::ui::cli
