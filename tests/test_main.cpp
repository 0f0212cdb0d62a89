#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <iostream>

// Test categories can be run individually using:
// ./unit_tests --gtest_filter="AnchorDetectorTest*"
// ./unit_tests --gtest_filter="RecommendationEngineTest*"
// etc.

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    std::cout << "Running StrokeCoach Test Suite" << std::endl;
    std::cout << "==============================" << std::endl;

    // Fallback warnings are expected in several tests
    spdlog::set_level(spdlog::level::err);

    int result = RUN_ALL_TESTS();

    if (result == 0) {
        std::cout << "\nAll tests passed!" << std::endl;
    } else {
        std::cout << "\nTests failed!" << std::endl;
    }

    return result;
}
