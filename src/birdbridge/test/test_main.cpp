/**
 * @file test_main.cpp
 * @brief GoogleTest entry point for the birdbridge test suite.
 */

#include <gtest/gtest.h>
#include <cstdlib>
#include <ctime>

int main(int argc, char** argv) {
    // Calendar statistics are computed in local time; pin it.
    setenv("TZ", "UTC", 1);
    tzset();
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
