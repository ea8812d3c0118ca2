#include <gtest/gtest.h>
#include "security_logger.hpp"
#include <iostream>
#include <sstream>

using namespace confshield;

class SecurityLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        SecurityLogger::set_min_level(SecurityLogger::Level::INFO);
    }

    void TearDown() override {
        SecurityLogger::set_min_level(SecurityLogger::Level::INFO);
    }
};

TEST_F(SecurityLoggerTest, LineFormat) {
    testing::internal::CaptureStdout();
    SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::SECRET_REGISTERED,
                        "configuration.yaml", "new PASSWORD as <<SECRET_PASSWORD_0001>>");
    std::string out = testing::internal::GetCapturedStdout();

    EXPECT_NE(out.find("[INFO] [SECRET_REGISTERED] at=configuration.yaml"), std::string::npos);
    EXPECT_NE(out.find("msg=\"new PASSWORD as <<SECRET_PASSWORD_0001>>\""), std::string::npos);
    EXPECT_NE(out.find(" UTC] "), std::string::npos);
}

TEST_F(SecurityLoggerTest, ErrorsGoToStderr) {
    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    SecurityLogger::log(SecurityLogger::Level::CRITICAL, SecurityLogger::EventType::INTEGRITY_FAILURE,
                        "vault.enc", "tag mismatch");
    std::string out = testing::internal::GetCapturedStdout();
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_TRUE(out.empty());
    EXPECT_NE(err.find("[CRIT] [INTEGRITY] at=vault.enc"), std::string::npos);
}

TEST_F(SecurityLoggerTest, MinLevelFilters) {
    SecurityLogger::set_min_level(SecurityLogger::Level::WARNING);
    EXPECT_EQ(SecurityLogger::min_level(), SecurityLogger::Level::WARNING);

    testing::internal::CaptureStdout();
    SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::STORE_OPENED, "vault.enc");
    SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::PLACEHOLDER_UNRESOLVED,
                        "a.yaml:3", "<<SECRET_IPV4_0009>>");
    std::string out = testing::internal::GetCapturedStdout();

    EXPECT_EQ(out.find("STORE_OPENED"), std::string::npos);
    EXPECT_NE(out.find("[WARN] [UNRESOLVED] at=a.yaml:3"), std::string::npos);
}

TEST_F(SecurityLoggerTest, Sanitization) {
    EXPECT_EQ(SecurityLogger::sanitize_log_message("plain text"), "plain text");
    EXPECT_EQ(SecurityLogger::sanitize_log_message("quote\" and\nnewline"), "quote  and newline");
    EXPECT_EQ(SecurityLogger::sanitize_log_message(std::string("bell\x07tab\t")), "belltab");
    EXPECT_EQ(SecurityLogger::sanitize_log_message("back\\slash\r"), "back slash ");
}

TEST_F(SecurityLoggerTest, ParseLevel) {
    EXPECT_EQ(SecurityLogger::parse_level("info"), SecurityLogger::Level::INFO);
    EXPECT_EQ(SecurityLogger::parse_level("WARN"), SecurityLogger::Level::WARNING);
    EXPECT_EQ(SecurityLogger::parse_level("warning"), SecurityLogger::Level::WARNING);
    EXPECT_EQ(SecurityLogger::parse_level("Error"), SecurityLogger::Level::ERROR);
    EXPECT_EQ(SecurityLogger::parse_level("crit"), SecurityLogger::Level::CRITICAL);
    EXPECT_EQ(SecurityLogger::parse_level("verbose"), SecurityLogger::Level::INFO);
}
