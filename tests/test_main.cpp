/**
 * @file test_main.cpp
 * @brief GoogleTest main entry point
 *
 * Provides main() and the easylogging++ storage for the core test suite.
 * Each test file registers its tests automatically via the TEST() macro.
 *
 * Build: cmake --build . --target trimerge_tests
 * Run:   ./trimerge_tests
 */

#include <gtest/gtest.h>
#include "trimerge/Logging.hpp"

INITIALIZE_EASYLOGGINGPP

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    trimerge::configure_logging("error");
    return RUN_ALL_TESTS();
}
