#include "core/Log.hpp"

#include <gtest/gtest.h>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    // Console only; warnings (e.g. random tie-breaks) stay visible
    splitwindow::Log::Init("", splitwindow::Log::Level::Warn);
    int result = RUN_ALL_TESTS();
    splitwindow::Log::Shutdown();

    return result;
}
