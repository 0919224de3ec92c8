#include <gtest/gtest.h>

// Single test binary; every *_test.cpp in tests/ is linked in.
int main(int argc, char** argv){
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
