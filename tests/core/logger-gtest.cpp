#include "rangepart/core/logger.h"
#include <gtest/gtest.h>
#include <sstream>
#include <string>

using namespace rangepart;

namespace {

class Partitioned
{
public:
    static LogPartition&
    get_log_partition()
    {
        static LogPartition partition("widget", LogLevel::INHERIT);
        return partition;
    }

    void
    warn(const std::string& text) const
    {
        OLOGW("widget says ", text);
    }

    void
    debug(const std::string& text) const
    {
        OLOGD("widget debug ", text);
    }
};

class LoggerTest : public ::testing::Test
{
protected:
    void
    SetUp() override
    {
        saved_level_ = Logger::get_level();
        Logger::set_output_stream(&out_);
        Logger::set_error_stream(&err_);
    }

    void
    TearDown() override
    {
        Logger::reset_streams();
        Logger::set_level(saved_level_);
        Partitioned::get_log_partition().set_level(LogLevel::INHERIT);
    }

    std::ostringstream out_;
    std::ostringstream err_;
    LogLevel saved_level_ = LogLevel::ERROR;
};

}  // namespace

TEST_F(LoggerTest, SetLevelFromString)
{
    EXPECT_TRUE(Logger::set_level("warn"));
    EXPECT_EQ(Logger::get_level(), LogLevel::WARNING);
    EXPECT_TRUE(Logger::set_level("DEBUG"));
    EXPECT_EQ(Logger::get_level(), LogLevel::DEBUG);
    EXPECT_TRUE(Logger::set_level("none"));
    EXPECT_EQ(Logger::get_level(), LogLevel::NONE);
    EXPECT_FALSE(Logger::set_level("verbose"));
    EXPECT_EQ(Logger::get_level(), LogLevel::NONE);
}

TEST_F(LoggerTest, RoutesByLevel)
{
    Logger::set_level(LogLevel::INFO);
    out_.str("");
    LOGI("info line ", 42);
    LOGW("warning line");
    LOGD("debug line");

    EXPECT_NE(out_.str().find("[INFO]  info line 42"), std::string::npos);
    EXPECT_NE(err_.str().find("[WARN]  warning line"), std::string::npos);
    EXPECT_EQ(out_.str().find("debug line"), std::string::npos);
}

TEST_F(LoggerTest, NoneSilencesErrors)
{
    Logger::set_level(LogLevel::NONE);
    LOGE("should not appear");
    EXPECT_TRUE(err_.str().empty());
}

TEST_F(LoggerTest, PartitionPrefixAndOwnLevel)
{
    Logger::set_level(LogLevel::ERROR);
    Partitioned widget;

    widget.warn("hello");
    EXPECT_TRUE(err_.str().empty());

    Partitioned::get_log_partition().set_level(LogLevel::DEBUG);
    widget.warn("hello");
    widget.debug("details");

    EXPECT_NE(err_.str().find("[widget] widget says hello"), std::string::npos);
    EXPECT_NE(out_.str().find("[widget] widget debug details"), std::string::npos);
}

TEST_F(LoggerTest, PartitionInheritsGlobalLevel)
{
    auto& partition = Partitioned::get_log_partition();
    Logger::set_level(LogLevel::WARNING);
    EXPECT_EQ(partition.level(), LogLevel::WARNING);
    EXPECT_TRUE(partition.should_log(LogLevel::ERROR));
    EXPECT_FALSE(partition.should_log(LogLevel::INFO));
}
