#include <gtest/gtest.h>

#include <sharemirror/logging.h>

int main (int argc, char *argv[])
{
    // Keep test output readable.
    sharemirror::SimpleLogger::setLogLevel(sharemirror::logError);

    testing::InitGoogleTest(&argc, argv);
    int rc = RUN_ALL_TESTS();
    return rc;
}
