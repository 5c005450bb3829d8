/**
 * @file test_telemetry.cpp
 * @brief Unit tests for the logger, NDJSON sinks and the event recorder.
 */

#include "core/logger.hpp"
#include "support/memory_sink.hpp"
#include "telemetry/event_recorder.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

using namespace kube_balance;

// ─── Logger ──────────────────────────────────

TEST(LoggerTest, FiltersBelowMinimumLevel) {
    auto lines = std::make_shared<test::CapturedLines>();
    Logger logger(std::make_unique<test::MemorySink>(lines), LogLevel::Warn);

    logger.debug("d");
    logger.info("i");
    logger.warn("w");
    logger.error("e");
    EXPECT_EQ(lines->lines().size(), 2u);

    logger.set_level(LogLevel::Debug);
    logger.debug("now visible");
    EXPECT_TRUE(lines->contains(R"("level":"debug")"));
    EXPECT_EQ(logger.level(), LogLevel::Debug);
}

TEST(LoggerTest, EmitsOneJsonObjectPerLine) {
    auto lines = std::make_shared<test::CapturedLines>();
    Logger logger(std::make_unique<test::MemorySink>(lines));
    logger.info("pod \"a\"\nmoved");

    auto written = lines->lines();
    ASSERT_EQ(written.size(), 1u);
    EXPECT_EQ(written[0].front(), '{');
    EXPECT_EQ(written[0].back(), '}');
    EXPECT_EQ(written[0].find('\n'), std::string::npos);
    EXPECT_NE(written[0].find(R"("msg":"pod \"a\"\nmoved")"), std::string::npos);
}

TEST(LoggerTest, AppendsFieldsAfterMessage) {
    auto lines = std::make_shared<test::CapturedLines>();
    Logger logger(std::make_unique<test::MemorySink>(lines));
    logger.log(LogLevel::Info, "evicted", {{"node", "node-b"}, {"pod", "shop/\"x\""}, {"msg", "ignored"}});

    auto written = lines->lines();
    ASSERT_EQ(written.size(), 1u);
    EXPECT_NE(written[0].find(R"("msg":"evicted","node":"node-b","pod":"shop/\"x\""})"),
              std::string::npos);
    EXPECT_EQ(lines->count_containing(R"("msg")"), 1u);
    EXPECT_EQ(written[0].find("ignored"), std::string::npos);
}

TEST(LoggerTest, JsonEscape) {
    EXPECT_EQ(json_escape(R"(a"b\c)"), R"(a\"b\\c)");
    EXPECT_EQ(json_escape("tab\there"), R"(tab\there)");
    EXPECT_EQ(json_escape(std::string{"\x01", 1}), R"(\u0001)");
}

// ─── JsonFileSink ────────────────────────────

class JsonFileSinkTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;

    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "kb_test_sink";
        std::filesystem::remove_all(dir_);
    }

    void TearDown() override { std::filesystem::remove_all(dir_); }

    static size_t line_count(const std::filesystem::path& path) {
        std::ifstream in(path);
        size_t n = 0;
        for (std::string line; std::getline(in, line);) ++n;
        return n;
    }
};

TEST_F(JsonFileSinkTest, CreatesDirectoryAndAppends) {
    {
        JsonFileSink sink(dir_, "app");
        sink.write(R"({"n":1})");
        sink.write(R"({"n":2})");
        sink.flush();
        EXPECT_EQ(sink.current_path().string(), (dir_ / "app.ndjson").string());
    }
    {
        JsonFileSink reopened(dir_, "app");
        reopened.write(R"({"n":3})");
    }
    EXPECT_EQ(line_count(dir_ / "app.ndjson"), 3u);
}

TEST_F(JsonFileSinkTest, RotatesWhenSizeExceeded) {
    const std::string line(1023, 'x');
    {
        JsonFileSink sink(dir_, "app", 1, 2);
        for (int i = 0; i < 1024 + 10; ++i) sink.write(line);
    }
    EXPECT_TRUE(std::filesystem::exists(dir_ / "app.1.ndjson"));
    EXPECT_EQ(line_count(dir_ / "app.1.ndjson"), 1024u);
    EXPECT_EQ(line_count(dir_ / "app.ndjson"), 10u);
    EXPECT_FALSE(std::filesystem::exists(dir_ / "app.3.ndjson"));
}

// ─── EventRecorder ───────────────────────────

TEST(EventRecorderTest, WritesNdjsonAndCountsByReason) {
    auto lines = std::make_shared<test::CapturedLines>();
    EventRecorder recorder(std::make_unique<test::MemorySink>(lines));

    recorder.warning({"Node", "", "node-b"}, reason::kNodeDegraded, "node is degraded");
    recorder.normal({"Pod", "shop", "web-0"}, reason::kPodEvicted, "evicted");
    recorder.normal({"Pod", "shop", "web-1"}, reason::kPodEvicted, "evicted");

    EXPECT_EQ(recorder.count(reason::kPodEvicted), 2u);
    EXPECT_EQ(recorder.count(reason::kNodeDegraded), 1u);
    EXPECT_EQ(recorder.count(reason::kEvictionFailed), 0u);

    auto written = lines->lines();
    ASSERT_EQ(written.size(), 3u);
    EXPECT_NE(written[0].find(R"("event":"NodeDegraded")"), std::string::npos);
    EXPECT_NE(written[0].find(R"("type":"Warning")"), std::string::npos);
    EXPECT_EQ(written[0].find(R"("namespace")"), std::string::npos);
    EXPECT_NE(written[1].find(R"("namespace":"shop")"), std::string::npos);
    EXPECT_NE(written[1].find(R"("name":"web-0")"), std::string::npos);
}

TEST(EventRecorderTest, HistoryIsBounded) {
    EventRecorder recorder(std::make_unique<NullSink>(), 3);
    for (int i = 0; i < 5; ++i) {
        recorder.normal({"Pod", "default", "p" + std::to_string(i)}, reason::kPodEvicted, "");
    }
    auto recent = recorder.recent();
    ASSERT_EQ(recent.size(), 3u);
    EXPECT_EQ(recent.front().object.name, "p2");
    EXPECT_EQ(recent.back().object.name, "p4");
    EXPECT_EQ(recorder.count(reason::kPodEvicted), 5u);
}
