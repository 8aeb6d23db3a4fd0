#include <gtest/gtest.h>
#include "security_logger.hpp"
#include <iostream>
#include <sstream>

using namespace powgate;

namespace {

// Captures std::cout for the lifetime of the object.
class StdoutCapture {
public:
    StdoutCapture() : previous_(std::cout.rdbuf(buffer_.rdbuf())) {}
    ~StdoutCapture() { std::cout.rdbuf(previous_); }
    std::string str() const { return buffer_.str(); }

private:
    std::stringstream buffer_;
    std::streambuf* previous_;
};

}

class SecurityLoggerTest : public ::testing::Test {
protected:
    void TearDown() override {
        SecurityLogger::set_min_level(SecurityLogger::Level::INFO);
    }
};

TEST_F(SecurityLoggerTest, Sanitization) {
    EXPECT_EQ(SecurityLogger::sanitize_log_message("Malicious \" quote and \n newline"),
              "Malicious   quote and   newline");
    EXPECT_EQ(SecurityLogger::sanitize_log_message(std::string("a\x01\x7f" "b")), "ab");
}

TEST_F(SecurityLoggerTest, AddressesAreBlinded) {
    StdoutCapture capture;
    SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::CHALLENGE_ISSUED, "203.0.113.7", "difficulty=4");

    std::string out = capture.str();
    EXPECT_EQ(out.find("203.0.113.7"), std::string::npos);
    EXPECT_NE(out.find("ip=anon_"), std::string::npos);
    EXPECT_NE(out.find("[CHALLENGE]"), std::string::npos);
    EXPECT_NE(out.find("msg=\"difficulty=4\""), std::string::npos);
}

TEST_F(SecurityLoggerTest, InternalSourceVerbatim) {
    StdoutCapture capture;
    SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::LANE_FAILURE, "internal", "Lane 2: exhausted");
    EXPECT_NE(capture.str().find("[WARN] [LANE_FAILURE] ip=internal"), std::string::npos);
}

TEST_F(SecurityLoggerTest, MinimumLevelFilters) {
    SecurityLogger::set_min_level(SecurityLogger::Level::WARNING);
    StdoutCapture capture;
    SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::SOLVER, "internal", "dropped");
    EXPECT_TRUE(capture.str().empty());
}

TEST_F(SecurityLoggerTest, LevelNames) {
    EXPECT_EQ(SecurityLogger::level_from_string("warn"), SecurityLogger::Level::WARNING);
    EXPECT_EQ(SecurityLogger::level_from_string("critical"), SecurityLogger::Level::CRITICAL);
    EXPECT_THROW(SecurityLogger::level_from_string("verbose"), std::invalid_argument);
    EXPECT_EQ(SecurityLogger::event_to_string(SecurityLogger::EventType::REPLAY_ATTEMPT), "REPLAY_ATTEMPT");
}
