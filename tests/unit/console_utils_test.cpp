#include "ConsoleUtils.hpp"
#include <gtest/gtest.h>

#if defined(__linux__)
#include <sys/mman.h>
#include <sys/resource.h>
#endif

TEST(ConsoleUtilsTest, LockProcessMemoryDisablesCoreDumps)
{
    const auto status{ cokacenc::ui::cli::lockProcessMemory() };

#if defined(__linux__)
    EXPECT_TRUE(status.coreDumpsDisabled);
    rlimit limit{};
    ASSERT_EQ(getrlimit(RLIMIT_CORE, &limit), 0);
    EXPECT_EQ(limit.rlim_cur, 0U);

    if (status.memoryLocked)
    {
        munlockall();
    }
#else
    (void)status;
#endif
}
