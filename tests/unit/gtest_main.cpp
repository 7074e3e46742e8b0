#include <gtest/gtest.h>

#include <iostream>
#include <sstream>

#include "sift/logger.h"
#include "sift/perf.h"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    // Scan diagnostics go to a sink so test output stays readable.
    static std::ostringstream log_sink;
    sift::Logger::instance().set_output(&log_sink);
    sift::Logger::instance().set_level(sift::Logger::Level::Error);
    sift::perf::Manager::Instance().set_enabled(false);

    return RUN_ALL_TESTS();
}
