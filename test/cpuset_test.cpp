#include <gtest/gtest.h>
#include <ferris/cpuset.h>

TEST(Cpuset, Ranges) {
  cpu_set_t set;
  ASSERT_TRUE(CpusetParse("0-2,5,8-12:2", &set, 64));
  EXPECT_EQ(CPU_COUNT(&set), 7);
  for (int i : {0, 1, 2, 5, 8, 10, 12}) EXPECT_TRUE(CPU_ISSET(i, &set)) << i;
  EXPECT_FALSE(CPU_ISSET(3, &set));
  EXPECT_FALSE(CPU_ISSET(9, &set));
}

TEST(Cpuset, Keywords) {
  cpu_set_t set;
  ASSERT_TRUE(CpusetParse("all", &set, 4));
  EXPECT_EQ(CPU_COUNT(&set), 4);
  ASSERT_TRUE(CpusetParse("none", &set, 4));
  EXPECT_EQ(CPU_COUNT(&set), 0);
}

TEST(Cpuset, ClampedToCpuCount) {
  cpu_set_t set;
  ASSERT_TRUE(CpusetParse("2-7", &set, 4));
  EXPECT_EQ(CPU_COUNT(&set), 2);
}

TEST(Cpuset, Invalid) {
  cpu_set_t set;
  EXPECT_FALSE(CpusetParse("", &set, 4));
  EXPECT_FALSE(CpusetParse("3-1", &set, 4));
  EXPECT_FALSE(CpusetParse("1,x", &set, 4));
  EXPECT_FALSE(CpusetParse("0-3:0", &set, 4));
  EXPECT_FALSE(CpusetParse("1a", &set, 4));
}
