// test_main.cpp -- GoogleTest entry point.
// The engine logs through a global spdlog logger that must exist before any
// component is constructed; tests run with console output at warn and no file sink.

#include <gtest/gtest.h>

#include "logging.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    core::logging::initialize("matchedge_test", spdlog::level::warn, spdlog::level::off, "");
    return RUN_ALL_TESTS();
}
