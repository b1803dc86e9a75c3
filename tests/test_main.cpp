#include <gtest/gtest.h>

#include "../src/core/Log.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    // keep test output readable; solver progress goes to debug/info
    pour::setLogLevel("warn");
    return RUN_ALL_TESTS();
}
