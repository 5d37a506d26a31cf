#include <gtest/gtest.h>
#include "local_time.h"

int main(int argc, char** argv) {
    // Every suite reasons in Warsaw local time, as the firmware does
    configureTimeZone(ZTM_TIMEZONE_POSIX);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
