#include <gtest/gtest.h>

// top-level test entrypoint: the library's tests are placed beside the sources
// that they test (`*.tests.cpp`)

int main(int argc, char** argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
