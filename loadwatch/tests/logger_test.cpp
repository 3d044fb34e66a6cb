#include <gtest/gtest.h>

#include "loadwatch/utils/logger.h"

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

using namespace loadwatch;

namespace {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        sink_ = std::make_shared<MemorySink>();
        logger_ = std::make_unique<Logger>("test");
        logger_->add_sink(sink_);
        logger_->set_level(LogLevel::DEBUG);
    }

    std::shared_ptr<MemorySink> sink_;
    std::unique_ptr<Logger> logger_;
};

TEST_F(LoggerTest, TextFormatIncludesLevelComponentAndMessage) {
    logger_->info("server started");

    auto lines = sink_->lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("[INFO ]"), std::string::npos);
    EXPECT_NE(lines[0].find("[test]"), std::string::npos);
    EXPECT_NE(lines[0].find("server started"), std::string::npos);
    EXPECT_EQ(lines[0].front(), '[');
    EXPECT_NE(lines[0].find("Z]"), std::string::npos);
}

TEST_F(LoggerTest, LevelFilterDropsLowerLevels) {
    logger_->set_level(LogLevel::WARN);
    logger_->debug("hidden");
    logger_->info("hidden");
    logger_->warn("shown");
    logger_->error("shown too");

    EXPECT_EQ(sink_->lines().size(), 2u);
    EXPECT_FALSE(logger_->is_enabled(LogLevel::INFO));
    EXPECT_TRUE(logger_->is_enabled(LogLevel::ERROR));
}

TEST_F(LoggerTest, OffSilencesEverything) {
    logger_->set_level(LogLevel::OFF);
    logger_->fatal("nothing");
    EXPECT_TRUE(sink_->lines().empty());
}

TEST_F(LoggerTest, FieldsAreSortedAndConsumedByNextMessage) {
    logger_->with_field("zeta", "1").with_field("alpha", 2).info("first");
    logger_->info("second");

    auto lines = sink_->lines();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[0].find("first {alpha=2, zeta=1}"), std::string::npos);
    EXPECT_EQ(lines[1].find('{'), std::string::npos);
}

TEST_F(LoggerTest, FieldsDroppedWhenMessageFiltered) {
    logger_->set_level(LogLevel::INFO);
    logger_->with_field("k", "v").debug("filtered");
    logger_->info("kept");

    auto lines = sink_->lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].find("k=v"), std::string::npos);
}

TEST_F(LoggerTest, ExplicitFieldsLeavePendingFieldsAlone) {
    logger_->with_field("pending", "yes");
    logger_->log(LogLevel::INFO, "explicit", {{"route", "/health"}});
    logger_->info("later");

    auto lines = sink_->lines();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[0].find("{route=/health}"), std::string::npos);
    EXPECT_NE(lines[1].find("{pending=yes}"), std::string::npos);
}

TEST_F(LoggerTest, JsonFormatterEscapesMessage) {
    logger_->set_formatter(std::make_shared<JsonFormatter>());
    logger_->with_field("status", 200).warn("quote \" and\nnewline");

    auto lines = sink_->lines();
    ASSERT_EQ(lines.size(), 1u);
    auto j = nlohmann::json::parse(lines[0]);
    EXPECT_EQ(j["level"], "WARN");
    EXPECT_EQ(j["component"], "test");
    EXPECT_EQ(j["message"], "quote \" and\nnewline");
    EXPECT_EQ(j["fields"]["status"], "200");
}

TEST(LogLevelTest, ParsesCaseInsensitively) {
    EXPECT_EQ(log_level_from_string("debug"), LogLevel::DEBUG);
    EXPECT_EQ(log_level_from_string("Warning"), LogLevel::WARN);
    EXPECT_EQ(log_level_from_string("OFF"), LogLevel::OFF);
    EXPECT_EQ(log_level_from_string("nonsense"), LogLevel::INFO);
    EXPECT_EQ(to_string(LogLevel::ERROR), "ERROR");
}

TEST(LoggerFactoryTest, ReturnsSameLoggerPerComponent) {
    auto& a = LoggerFactory::get_logger("factory-test");
    auto& b = LoggerFactory::get_logger("factory-test");
    EXPECT_EQ(&a, &b);
    EXPECT_EQ(a.component(), "factory-test");
}

TEST(LoggerFactoryTest, GlobalLevelAppliesToExistingLoggers) {
    auto& logger = LoggerFactory::get_logger("factory-level-test");
    LoggerFactory::set_global_level(LogLevel::ERROR);
    EXPECT_EQ(logger.get_level(), LogLevel::ERROR);
    LoggerFactory::set_global_level(LogLevel::INFO);
    EXPECT_EQ(logger.get_level(), LogLevel::INFO);
}

} // namespace
