// tests/test_env.cpp
#include <cstdio>
#include <cstdlib>
#include <gtest/gtest.h>
#include <string>

#include "util/constants.hpp"
#include "util/log.hpp"

// ENV guard
struct EnvGuard
{
    std::string key, old_val;
    bool        had = false;
    explicit EnvGuard(const char *k) : key(k)
    {
        const char *v = std::getenv(k);
        if (v)
        {
            had     = true;
            old_val = v;
        }
    }
    void set(const std::string &v) const { ::setenv(key.c_str(), v.c_str(), 1); }
    void unset() const { ::unsetenv(key.c_str()); }
    ~EnvGuard()
    {
        if (had)
            ::setenv(key.c_str(), old_val.c_str(), 1);
        else
            ::unsetenv(key.c_str());
    }
};

// Restores the global log level after a test changes it.
struct LevelGuard
{
    tchan::Level saved = tchan::log_level();
    ~LevelGuard() { tchan::set_log_level(saved); }
};

TEST(Env_MaxFrameSize, DefaultWhenUnset)
{
    EnvGuard g(constants::ENV_MAX_FRAME_SIZE);
    g.unset();
    EXPECT_EQ(constants::max_frame_size(), constants::MAX_FRAME_SIZE);
}

TEST(Env_MaxFrameSize, FromEnv)
{
    EnvGuard g(constants::ENV_MAX_FRAME_SIZE);
    g.set("4096");

    testing::internal::CaptureStderr();
    auto        got = constants::max_frame_size();
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_EQ(got, 4096u);
    EXPECT_TRUE(err.empty());
}

TEST(Env_MaxFrameSize, ClampedAndLogged)
{
    LevelGuard lg;
    tchan::set_log_level(tchan::Level::Warning);
    EnvGuard g(constants::ENV_MAX_FRAME_SIZE);

    g.set("10");
    testing::internal::CaptureStderr();
    EXPECT_EQ(constants::max_frame_size(), constants::MIN_FRAME_SIZE);
    EXPECT_NE(testing::internal::GetCapturedStderr().find("below minimum"), std::string::npos);

    g.set("70000");
    testing::internal::CaptureStderr();
    EXPECT_EQ(constants::max_frame_size(), constants::MAX_FRAME_SIZE);
    EXPECT_NE(testing::internal::GetCapturedStderr().find("above maximum"), std::string::npos);

    g.set("64k");
    testing::internal::CaptureStderr();
    EXPECT_EQ(constants::max_frame_size(), constants::MAX_FRAME_SIZE);
    EXPECT_NE(testing::internal::GetCapturedStderr().find("not a number"), std::string::npos);
}

TEST(Env_LogLevel, FromEnv)
{
    LevelGuard lg;
    EnvGuard   g(constants::ENV_LOG_LEVEL);

    g.set("Debug");
    constants::init_log_from_env();
    EXPECT_EQ(tchan::log_level(), tchan::Level::Debug);

    g.set("off");
    constants::init_log_from_env();
    EXPECT_EQ(tchan::log_level(), tchan::Level::Off);

    // unset keeps whatever is current
    g.unset();
    constants::init_log_from_env();
    EXPECT_EQ(tchan::log_level(), tchan::Level::Off);
}

TEST(Env_LogLevel, UnknownFallsBackToInfo)
{
    LevelGuard lg;
    EnvGuard   g(constants::ENV_LOG_LEVEL);
    tchan::set_log_level(tchan::Level::Debug);
    g.set("verbose");

    testing::internal::CaptureStderr();
    constants::init_log_from_env();
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_EQ(tchan::log_level(), tchan::Level::Info);
    EXPECT_NE(err.find("verbose"), std::string::npos);
}

TEST(LogLevel, FiltersByThreshold)
{
    using namespace tchan;
    LevelGuard lg;

    // ERROR-only: WARN should be suppressed, ERROR should appear
    set_log_level_by_name("ERROR");
    testing::internal::CaptureStderr();
    LOG_WARN("should_not_print_warn");
    std::string out1 = testing::internal::GetCapturedStderr();
    EXPECT_TRUE(out1.find("should_not_print_warn") == std::string::npos);

    testing::internal::CaptureStderr();
    LOG_ERROR("should_print_error");
    std::string out2 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out2.find("should_print_error"), std::string::npos);
    EXPECT_NE(out2.find("[ERROR]"), std::string::npos);

    set_log_level_by_name("off");
    testing::internal::CaptureStderr();
    LOG_SYSTEM("silenced");
    EXPECT_TRUE(testing::internal::GetCapturedStderr().empty());

    // DEBUG: DEBUG should appear
    set_log_level_by_name("DEBUG");
    testing::internal::CaptureStderr();
    LOG_DEBUG("debug_visible");
    std::string out3 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out3.find("debug_visible"), std::string::npos);
}

TEST(LogLevel, ParseNames)
{
    using tchan::Level;
    EXPECT_EQ(tchan::parse_level("WARN"), Level::Warning);
    EXPECT_EQ(tchan::parse_level("warning"), Level::Warning);
    EXPECT_EQ(tchan::parse_level("err"), Level::Error);
    EXPECT_EQ(tchan::parse_level("none"), Level::Off);
    EXPECT_FALSE(tchan::parse_level("loud").has_value());
    EXPECT_FALSE(tchan::parse_level(nullptr).has_value());
}

TEST(LogLevel, Sink)
{
    LevelGuard lg;
    tchan::set_log_level(tchan::Level::Info);

    FILE *f = std::tmpfile();
    ASSERT_NE(f, nullptr);
    tchan::set_log_sink(f);
    testing::internal::CaptureStderr();
    LOG_INFO("to_the_sink %d", 7);
    std::string err = testing::internal::GetCapturedStderr();
    tchan::set_log_sink(nullptr);

    EXPECT_TRUE(err.empty());
    std::rewind(f);
    char line[256] = {0};
    ASSERT_NE(std::fgets(line, sizeof line, f), nullptr);
    std::fclose(f);
    std::string s(line);
    EXPECT_NE(s.find("tchan [INFO]"), std::string::npos);
    EXPECT_NE(s.find("to_the_sink 7"), std::string::npos);
}
