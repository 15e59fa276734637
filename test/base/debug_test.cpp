#include <gtest/gtest.h>

#include "toymd/base/debug.hpp"


TEST(DebugAssertDeathTest, ReportsMessageAndCondition) {
#ifdef NDEBUG
	GTEST_SKIP() << "TMD_ASSERT is compiled out under NDEBUG";
#else
	EXPECT_DEATH(TMD_ASSERT(1 + 1 == 3, "arithmetic is broken"), "assertion failed: arithmetic is broken");
#endif
}

TEST(DebugAssertTest, PassingConditionIsSilent) {
	int evaluated = 0;
	TMD_ASSERT(++evaluated == 1, "unreachable");
#ifdef NDEBUG
	EXPECT_EQ(evaluated, 0);
#else
	EXPECT_EQ(evaluated, 1);
#endif
}
