#include <gtest/gtest.h>
#include <cstdlib>

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);

    // Config tests set their own values, nothing from the shell may leak in
    unsetenv("BREAKWATCH_WARN_THRESHOLD_SECONDS");
    unsetenv("BREAKWATCH_ALERT_THRESHOLD_SECONDS");
    unsetenv("BREAKWATCH_START_UNPAUSED");
    unsetenv("BREAKWATCH_STORE_LAST_SESSION");

    return RUN_ALL_TESTS();
}
