#include "dbjob/config/config.h"
#include "dbjob/config/ini_defines.h"
#include "dbjob/engine.h"
#include "dbjob/log/log.h"

#include <fstream>
#include <sstream>

#include <gtest/gtest.h>

#include <cstdio>

class ParseToMap
    : public ::testing::TestWithParam<std::tuple<std::string, key_value_map_t>>
{
protected:
    inline void parse_and_compare(const std::string & str, const key_value_map_t & map_expected) {
        const auto map = readSettingsString(str);

        EXPECT_EQ(map.size(), map_expected.size());

        for (const auto & pair : map) {
            const auto it = map_expected.find(pair.first);
            ASSERT_NE(it, map_expected.end()) << "unexpected key: " << pair.first;
            EXPECT_EQ(pair.second, it->second);
        }
    }
};

TEST_P(ParseToMap, Compare) { parse_and_compare(std::get<0>(GetParam()), std::get<1>(GetParam())); }

INSTANTIATE_TEST_SUITE_P(SettingsString, ParseToMap,
    ::testing::ValuesIn(std::initializer_list<std::tuple<std::string, key_value_map_t>>{
        { "", { } },
        { "   ", { } },
        { ";;;", { } },
        { "  ; ; ;", { } },
        { "x=", {
            { "x", "" }
        } },
        { " ;  x  =  y  ; ", {
            { "x", "y" }
        } },
        { "Timeout=30;MaxAttempts=3", {
            { "timeout", "30" }, { "MAXATTEMPTS", "3" }
        } },
        { "key1=value1; key2 = value 2 ; key 3 = {; v{a= lu ;e3 = }", {
            { "key1", "value1" },
            { "key2", "value 2" },
            { "key 3", "; v{a= lu ;e3 = " }
        } },
        { "PoolSize=4; poolsize=16;", {
            { "PoolSize", "4" }
        } },
        { "key==1=value; ==key2 = value ; key1== = value ;== ===value", {
            { "key=1", "value" },
            { "=key2", "value" },
            { "key1=", "value" },
            { "= =", "value" }
        } },
    })
);

class MalformedSettingsString
    : public ::testing::TestWithParam<std::string>
{
};

TEST_P(MalformedSettingsString, Throws) {
    try {
        readSettingsString(GetParam());
        FAIL() << "no exception for: " << GetParam();
    }
    catch (const JobException & ex) {
        EXPECT_EQ(ex.getKind(), ErrorKind::ConfigurationError);
        EXPECT_EQ(ex.getSQLState(), "HY024");
    }
}

INSTANTIATE_TEST_SUITE_P(SettingsString, MalformedSettingsString,
    ::testing::Values(
        "x",
        "=y",
        "  = y;",
        "x={unterminated",
        "x={a}b"
    )
);

TEST(EngineSettings, Defaults) {
    const EngineSettings settings;

    EXPECT_EQ(settings.timeout.count(), 0);
    EXPECT_EQ(settings.max_attempts, 1u);
    EXPECT_EQ(settings.retry_delay.count(), 0);
    EXPECT_TRUE(settings.buffered);
    EXPECT_EQ(settings.pool_size, 8u);
    EXPECT_EQ(settings.pool_timeout.count(), 30000);
    EXPECT_EQ(settings.isolation, IsolationLevel::Unspecified);
    EXPECT_TRUE(settings.plan_cache);
    EXPECT_EQ(settings.driver_log_file, INI_DRIVERLOGFILE_DEFAULT);
}

TEST(EngineSettings, ReadAllKeys) {
    const auto settings = readEngineSettings(
        "DriverLog=off; DriverLogFile={/var/log/my;jobs.log}; Timeout=15; MaxAttempts=3; RetryDelay=250;"
        "Buffered=no; PoolSize=2; PoolTimeout=100; Isolation=read committed; PlanCache=false"
    );

    EXPECT_FALSE(settings.driver_log);
    EXPECT_EQ(settings.driver_log_file, "/var/log/my;jobs.log");
    EXPECT_EQ(settings.timeout.count(), 15);
    EXPECT_EQ(settings.max_attempts, 3u);
    EXPECT_EQ(settings.retry_delay.count(), 250);
    EXPECT_FALSE(settings.buffered);
    EXPECT_EQ(settings.pool_size, 2u);
    EXPECT_EQ(settings.pool_timeout.count(), 100);
    EXPECT_EQ(settings.isolation, IsolationLevel::ReadCommitted);
    EXPECT_FALSE(settings.plan_cache);
}

TEST(EngineSettings, UnknownKeysAreIgnored) {
    const auto settings = readEngineSettings("Colour=blue;MaxAttempts=2");
    EXPECT_EQ(settings.max_attempts, 2u);
}

TEST(EngineSettings, InvalidValuesThrow) {
    EXPECT_THROW(readEngineSettings("MaxAttempts=0"), JobException);
    EXPECT_THROW(readEngineSettings("PoolSize=many"), JobException);
    EXPECT_THROW(readEngineSettings("Buffered=maybe"), JobException);
    EXPECT_THROW(readEngineSettings("Isolation=chaos"), JobException);
    EXPECT_THROW(readEngineSettings("Timeout=-5"), JobException);
}

TEST(EngineSettings, ToStringReadsBack) {
    EngineSettings settings;
    settings.max_attempts = 4;
    settings.isolation = IsolationLevel::Serializable;
    settings.driver_log_file = "/tmp/a;b.log";

    const auto read_back = readEngineSettings(toString(settings));
    EXPECT_EQ(read_back.max_attempts, 4u);
    EXPECT_EQ(read_back.isolation, IsolationLevel::Serializable);
    EXPECT_EQ(read_back.driver_log_file, "/tmp/a;b.log");
}

TEST(EngineLogging, ConfigureFromSettingsString) {
    auto & engine = Engine::getInstance();
    const std::string log_file = "/tmp/dbjob-ut-engine.log";
    std::remove(log_file.c_str());

    engine.configure("DriverLog=on;DriverLogFile={" + log_file + "}");
    EXPECT_TRUE(engine.isLoggingEnabled());
    EXPECT_EQ(engine.getLogFile(), log_file);

    LOG("engine log line for the test");

    engine.configure("DriverLog=off");
    EXPECT_FALSE(engine.isLoggingEnabled());

    std::ifstream stream(log_file);
    std::stringstream content;
    content << stream.rdbuf();
    EXPECT_NE(content.str().find("engine log line for the test"), std::string::npos);

    std::remove(log_file.c_str());
}

TEST(EngineLogging, RunIdsIncrease) {
    auto & engine = Engine::getInstance();
    const auto first = engine.nextRunId();
    EXPECT_GT(engine.nextRunId(), first);
}
