// tests/test_errors_config.cpp
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>
#include "config.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "util.hpp"

using namespace tessera;

TEST(Errors, CategoryAndMessages)
{
    std::error_code ec = errc::insufficient_symbols;
    EXPECT_EQ(&ec.category(), &tessera_category());
    EXPECT_STREQ(ec.category().name(), "tessera");
    EXPECT_EQ(ec.message(), "insufficient symbols");
    EXPECT_TRUE(static_cast<bool>(ec));
    EXPECT_FALSE(static_cast<bool>(make_error_code(errc::ok)));
    EXPECT_EQ(std::error_code(errc::session_closed).message(), "session closed");
}

TEST(Errors, OnlyResourcePressureIsRetriable)
{
    EXPECT_TRUE(is_retriable(errc::memory_budget_exceeded));
    EXPECT_TRUE(is_retriable(errc::concurrency_limit_exceeded));
    EXPECT_FALSE(is_retriable(errc::insufficient_symbols));
    EXPECT_FALSE(is_retriable(errc::integrity_violation));
    EXPECT_FALSE(is_retriable(std::error_code()));
    EXPECT_FALSE(is_retriable(std::make_error_code(std::errc::not_enough_memory)));
}

TEST(Config, DefaultsAreValid)
{
    SessionConfig cfg;
    std::string   why;
    EXPECT_TRUE(validate(cfg, why)) << why;
    EXPECT_EQ(cfg.symbol_size, 65535);
    EXPECT_EQ(cfg.redundancy_factor, 4);
    EXPECT_EQ(cfg.memory_budget, 16ull << 30);
    EXPECT_EQ(cfg.concurrency_limit, 4u);
    EXPECT_NE(describe(cfg).find("symbol_size=65535"), std::string::npos);

    cfg.memory_budget = kMemoryBudget4GiB;
    EXPECT_TRUE(validate(cfg, why)) << why;
    EXPECT_EQ(kMemoryBudget4GiB, 4ull << 30);
}

TEST(Config, RejectsZeroFields)
{
    std::string why;
    SessionConfig a;
    a.symbol_size = 0;
    EXPECT_FALSE(validate(a, why));
    EXPECT_FALSE(why.empty());

    SessionConfig b;
    b.redundancy_factor = 0;
    EXPECT_FALSE(validate(b, why));

    SessionConfig c;
    c.memory_budget = 0;
    EXPECT_FALSE(validate(c, why));

    SessionConfig d;
    d.concurrency_limit = 0;
    EXPECT_FALSE(validate(d, why));
}

TEST(Util, ParseSize)
{
    uint64_t v = 0;
    ASSERT_TRUE(parse_size("1234", v));
    EXPECT_EQ(v, 1234u);
    ASSERT_TRUE(parse_size("64K", v));
    EXPECT_EQ(v, 64u * 1024);
    ASSERT_TRUE(parse_size("3MiB", v));
    EXPECT_EQ(v, 3u * 1024 * 1024);
    ASSERT_TRUE(parse_size("16G", v));
    EXPECT_EQ(v, 16ull << 30);

    EXPECT_FALSE(parse_size("", v));
    EXPECT_FALSE(parse_size("K", v));
    EXPECT_FALSE(parse_size("12X", v));
    EXPECT_FALSE(parse_size("-5", v));
    EXPECT_FALSE(parse_size("99999999999999999999G", v));
}

TEST(Util, HexAndDivCeil)
{
    const uint8_t b[] = {0x00, 0x0f, 0xa5, 0xff};
    EXPECT_EQ(bytes_to_hex(b, sizeof(b)), "000fa5ff");
    EXPECT_EQ(div_ceil(10, 3), 4u);
    EXPECT_EQ(div_ceil(9, 3), 3u);
    EXPECT_EQ(div_ceil(0, 3), 0u);
}

TEST(Logging, LevelByName)
{
    Logger &log = Logger::instance();
    const LogLevel saved = log.level();
    log.set_level_by_name("debug");
    EXPECT_EQ(log.level(), LogLevel::DEBUG);
    log.set_level_by_name("ERROR");
    EXPECT_EQ(log.level(), LogLevel::ERROR);
    log.set_level_by_name("nonsense");
    EXPECT_EQ(log.level(), LogLevel::INFO);
    log.set_level(saved);
}

TEST(Logging, LevelChangesWhileLogging)
{
    Logger &log = Logger::instance();
    const LogLevel saved = log.level();
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t)
    {
        threads.emplace_back([&log, t] {
            for (int i = 0; i < 200; ++i)
            {
                if (t == 0)
                    log.set_level(i % 2 ? LogLevel::ERROR : LogLevel::TRACE);
                else
                    log.log(LogLevel::TRACE, "worker %d line %d", t, i);
            }
        });
    }
    for (auto &th : threads)
        th.join();
    log.set_level(LogLevel::WARN);
    EXPECT_EQ(log.level(), LogLevel::WARN);
    log.set_level(saved);
}
