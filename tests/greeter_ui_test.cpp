#include "greeter/Ui.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <ctime>
#include <optional>
#include <string>

class GreeterClockTest : public ::testing::Test {
  protected:
    void SetUp() override {
        if (const auto TZ = getenv("TZ"); TZ)
            m_savedTz = TZ;
        setenv("TZ", "UTC", 1);
        tzset();
    }

    void TearDown() override {
        if (m_savedTz)
            setenv("TZ", m_savedTz->c_str(), 1);
        else
            unsetenv("TZ");
        tzset();
    }

    std::optional<std::string> m_savedTz;
};

TEST_F(GreeterClockTest, libc_clock_formats_like_the_zoned_one) {
    EXPECT_EQ(GreeterUi::clockTextLibc(0), "Thursday, January 01  00:00");
    EXPECT_EQ(GreeterUi::clockTextLibc(1709388300), "Saturday, March 02  14:05");
}

TEST_F(GreeterClockTest, clock_never_throws) {
    std::string text;
    EXPECT_NO_THROW(text = GreeterUi::clockText(std::chrono::system_clock::now()));
    EXPECT_FALSE(text.empty());
}
