#include <gtest/gtest.h>
#include "utils/logger.h"

using strata::utils::Logger;
using strata::utils::ScopedLogContext;

TEST(LoggerTest, LevelFromString) {
    EXPECT_EQ(Logger::levelFromString("debug"), Logger::Level::DEBUG);
    EXPECT_EQ(Logger::levelFromString("WARNING"), Logger::Level::WARN);
    EXPECT_EQ(Logger::levelFromString("err"), Logger::Level::ERROR);
    EXPECT_EQ(Logger::levelFromString("loud"), Logger::Level::INFO);
}

TEST(LoggerTest, ContextNestsAndRestores) {
    EXPECT_EQ(Logger::context(), "");
    {
        ScopedLogContext outer("site1", "");
        EXPECT_EQ(Logger::context(), "site1");
        {
            ScopedLogContext inner("site2", "job-7");
            EXPECT_EQ(Logger::context(), "site2 job-7");
        }
        EXPECT_EQ(Logger::context(), "site1");
    }
    EXPECT_EQ(Logger::context(), "");
}

TEST(LoggerTest, LoggingWithoutInitIsANoop) {
    ScopedLogContext ctx("site1", "job-1");
    EXPECT_NO_THROW(STRATA_INFO("job {} ran {} times", "x", 3));
}
