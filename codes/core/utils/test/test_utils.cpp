// =============================================================================
//  JSON-RPC Snoop - Utils Module
//  文件: test_utils.cpp
//  描述: Utils模块完整单元测试
//  版权: Copyright (c) 2026
// =============================================================================

#include <gtest/gtest.h>
#include <thread>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <unistd.h>
#include "utils/error.hpp"
#include "utils/time.hpp"
#include "utils/buffer.hpp"
#include "utils/logger.hpp"
#include "utils/color.hpp"

using namespace rpc_snoop::utils;

// =============================================================================
// Error模块测试用例
// =============================================================================

TEST(ErrorTest, ErrorCodeToString) {
    EXPECT_STREQ(error_code_to_string(ErrorCode::SUCCESS), "SUCCESS");
    EXPECT_STREQ(error_code_to_string(ErrorCode::INVALID_ARGUMENT), "INVALID_ARGUMENT");
    EXPECT_STREQ(error_code_to_string(ErrorCode::CONFIG_INVALID_URI), "CONFIG_INVALID_URI");
    EXPECT_STREQ(error_code_to_string(ErrorCode::NETWORK_CLOSED), "NETWORK_CLOSED");
}

TEST(ErrorTest, ErrorCodeToDescription) {
    EXPECT_STREQ(error_code_to_description(ErrorCode::CONFIG_INVALID_URI), "Invalid endpoint URI");
    EXPECT_STRNE(error_code_to_description(ErrorCode::UNKNOWN_ERROR), nullptr);
}

TEST(ErrorTest, IsSuccessAndIsError) {
    EXPECT_TRUE(is_success(ErrorCode::SUCCESS));
    EXPECT_FALSE(is_success(ErrorCode::NETWORK_READ_ERROR));
    EXPECT_FALSE(is_error(ErrorCode::SUCCESS));
    EXPECT_TRUE(is_error(ErrorCode::NETWORK_READ_ERROR));
}

TEST(ErrorTest, ResultSuccess) {
    Result<int> r = make_ok(42);
    EXPECT_TRUE(r.is_ok());
    EXPECT_FALSE(r.is_err());
    EXPECT_EQ(r.value(), 42);
    EXPECT_EQ(r.error_code(), ErrorCode::SUCCESS);
}

TEST(ErrorTest, ResultFailureUsesDescription) {
    Result<int> r = make_err<int>(ErrorCode::CONFIG_INVALID_URI);
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.error_code(), ErrorCode::CONFIG_INVALID_URI);
    EXPECT_EQ(r.error_message(), "Invalid endpoint URI");
    EXPECT_EQ(r.value_or(100), 100);
}

TEST(ErrorTest, ResultTakeMovesValue) {
    Result<std::string> r = make_ok(std::string("payload"));
    std::string taken = r.take();
    EXPECT_EQ(taken, "payload");
}

TEST(ErrorTest, ResultVoid) {
    Result<void> ok = make_ok();
    EXPECT_TRUE(ok.is_ok());

    Result<void> err = make_err(ErrorCode::PROTOCOL_INVALID_HEADER, "bad header");
    EXPECT_TRUE(err.is_err());
    EXPECT_EQ(err.error_code(), ErrorCode::PROTOCOL_INVALID_HEADER);
    EXPECT_EQ(err.error_message(), "bad header");
}

// =============================================================================
// Time模块测试用例
// =============================================================================

TEST(TimeTest, GetCurrentTimeMs) {
    uint64_t time1 = get_current_time_ms();
    EXPECT_GT(time1, 0u);
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
    EXPECT_GE(get_current_time_ms(), time1);
}

TEST(TimeTest, GetMonotonicTimeMs) {
    uint64_t time1 = get_monotonic_time_ms();
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
    EXPECT_GE(get_monotonic_time_ms(), time1);
}

TEST(TimeTest, StopWatch) {
    StopWatch sw;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    EXPECT_GE(sw.elapsed_ms(), 5u);  // 允许误差
    sw.reset();
    EXPECT_LT(sw.elapsed_ms(), 5u);
}

TEST(TimeTest, FormatTimeMillisHasMillisAndYear) {
    // 时区无关的部分：毫秒字段与年份位置
    std::string text = format_time_millis(1700000000042ULL);
    ASSERT_GE(text.size(), 20u);
    EXPECT_NE(text.find(".042 "), std::string::npos);
    EXPECT_EQ(text.size(), std::string("Nov 14 22:13:20.042 2023").size());
    EXPECT_EQ(text[text.size() - 5], ' ');
}

TEST(TimeTest, FormatTimeMillisPadsMillis) {
    std::string text = format_time_millis(1700000000007ULL);
    EXPECT_NE(text.find(".007 "), std::string::npos);
}

TEST(TimeTest, DefaultTimeSource) {
    uint64_t before = get_current_time_ms();
    uint64_t now = DefaultTimeSource::instance().get_current_time_ms();
    EXPECT_GE(now, before);
}

// =============================================================================
// Buffer模块测试用例
// =============================================================================

TEST(BufferTest, CreateDefault) {
    Buffer buf;
    EXPECT_EQ(buf.readable_bytes(), 0u);
    EXPECT_EQ(buf.capacity(), Buffer::DEFAULT_INITIAL_CAPACITY);
}

TEST(BufferTest, CreateMinCapacity) {
    Buffer buf(512);
    EXPECT_EQ(buf.capacity(), Buffer::MIN_CAPACITY);
}

TEST(BufferTest, WriteReadString) {
    Buffer buf;
    EXPECT_EQ(buf.write(std::string("Hello, World!")), 13u);
    EXPECT_EQ(buf.readable_bytes(), 13u);

    std::string out;
    EXPECT_EQ(buf.read_to_string(&out, 5), 5u);
    EXPECT_EQ(out, "Hello");
    EXPECT_EQ(buf.read_to_string(&out), 8u);
    EXPECT_EQ(out, ", World!");
    EXPECT_EQ(buf.readable_bytes(), 0u);
}

TEST(BufferTest, FindCrlf) {
    Buffer buf;
    buf.write(std::string("GET / HTTP/1.1\r\nHost: x\r\n"));
    EXPECT_EQ(buf.find_crlf(), 14u);
    buf.skip(16);
    EXPECT_EQ(buf.find_crlf(), 7u);

    Buffer partial;
    partial.write(std::string("no line end\r"));
    EXPECT_EQ(partial.find_crlf(), Buffer::npos);
}

TEST(BufferTest, GrowsBeyondInitialCapacity) {
    Buffer buf(Buffer::MIN_CAPACITY);
    std::string big(Buffer::MIN_CAPACITY * 3, 'x');
    EXPECT_EQ(buf.write(big), big.size());
    EXPECT_GE(buf.capacity(), big.size());
    EXPECT_EQ(buf.readable_bytes(), big.size());
}

TEST(BufferTest, ReserveCommit) {
    Buffer buf;
    uint8_t* ptr = buf.reserve(100);
    ASSERT_NE(ptr, nullptr);
    std::memcpy(ptr, "abc", 3);
    buf.commit(3);
    EXPECT_EQ(buf.readable_bytes(), 3u);
    std::string out;
    buf.read_to_string(&out);
    EXPECT_EQ(out, "abc");
}

TEST(BufferTest, Compact) {
    Buffer buf(1024);
    buf.write(std::string("0123456789"));
    buf.skip(4);
    buf.compact();
    EXPECT_EQ(buf.readable_bytes(), 6u);
    std::string out;
    buf.read_to_string(&out);
    EXPECT_EQ(out, "456789");
}

TEST(BufferTest, ClearAndMove) {
    Buffer buf1;
    buf1.write(std::string("data"));
    Buffer buf2(std::move(buf1));
    EXPECT_EQ(buf2.readable_bytes(), 4u);
    buf2.clear();
    EXPECT_EQ(buf2.readable_bytes(), 0u);
}

// =============================================================================
// Logger模块测试用例
// =============================================================================

TEST(LoggerTest, ParseLogLevel) {
    LogLevel level = LogLevel::ERROR;
    EXPECT_TRUE(parse_log_level("debug", &level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(parse_log_level("Info", &level));
    EXPECT_EQ(level, LogLevel::INFO);
    EXPECT_TRUE(parse_log_level("WARNING", &level));
    EXPECT_EQ(level, LogLevel::WARN);
    EXPECT_TRUE(parse_log_level("error", &level));
    EXPECT_EQ(level, LogLevel::ERROR);

    // 无法识别时保持原值
    EXPECT_FALSE(parse_log_level("verbose", &level));
    EXPECT_EQ(level, LogLevel::ERROR);
}

TEST(LoggerTest, LogLevelToString) {
    EXPECT_STREQ(log_level_to_string(LogLevel::DEBUG), "DEBUG");
    EXPECT_STREQ(log_level_to_string(LogLevel::INFO), "INFO");
    EXPECT_STREQ(log_level_to_string(LogLevel::WARN), "WARN");
    EXPECT_STREQ(log_level_to_string(LogLevel::ERROR), "ERROR");
}

TEST(LoggerTest, LevelFiltering) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::WARN);
    EXPECT_FALSE(logger.is_level_enabled(LogLevel::INFO));
    EXPECT_TRUE(logger.is_level_enabled(LogLevel::WARN));
    EXPECT_TRUE(logger.is_level_enabled(LogLevel::ERROR));
}

TEST(LoggerTest, WritesToFile) {
    char path[] = "/tmp/rpc_snoop_log_XXXXXX";
    int fd = mkstemp(path);
    ASSERT_GE(fd, 0);
    close(fd);

    Logger& logger = Logger::instance();
    ASSERT_EQ(logger.init(LogLevel::INFO, path), 0);
    logger.set_console_output(false);
    LOG_INFO("Test", "hello %d", 7);
    LOG_DEBUG("Test", "hidden");
    logger.flush();

    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_NE(content.str().find("[INFO] [Test] hello 7"), std::string::npos);
    EXPECT_EQ(content.str().find("hidden"), std::string::npos);

    ASSERT_EQ(logger.init(LogLevel::WARN, ""), 0);
    logger.set_console_output(true);
    std::remove(path);
}

TEST(LoggerTest, InitFailsForUnwritablePath) {
    Logger& logger = Logger::instance();
    EXPECT_NE(logger.init(LogLevel::WARN, "/nonexistent-dir/rpc_snoop.log"), 0);
    EXPECT_EQ(logger.init(LogLevel::WARN, ""), 0);
}

// =============================================================================
// Color模块测试用例
// =============================================================================

TEST(ColorTest, PaletteDisabledIsEmpty) {
    ColorPalette palette(false);
    EXPECT_TRUE(palette.info.empty());
    EXPECT_TRUE(palette.success.empty());
    EXPECT_TRUE(palette.error.empty());
    EXPECT_TRUE(palette.muted.empty());
    EXPECT_TRUE(palette.reset.empty());
}

TEST(ColorTest, PaletteEnabled) {
    ColorPalette palette(true);
    EXPECT_EQ(palette.info, ANSI_FG_CYAN);
    EXPECT_EQ(palette.success, ANSI_FG_GREEN);
    EXPECT_EQ(palette.error, ANSI_FG_RED);
    EXPECT_EQ(palette.reset, ANSI_FG_RESET);
}

TEST(ColorTest, ColorTreatWrapsEachLine) {
    std::string out = color_treat("a\nbc", "<", ">");
    EXPECT_EQ(out, "<a>\n<bc>\n");
}

TEST(ColorTest, ColorTreatTrailingNewlineGivesEmptyLine) {
    std::string out = color_treat("a\n", "<", ">");
    EXPECT_EQ(out, "<a>\n<>\n");
}

TEST(ColorTest, ColorTreatWithoutColors) {
    EXPECT_EQ(color_treat("x\ny", "", ""), "x\ny\n");
}

TEST(ColorTest, StripAnsi) {
    std::string colored = color_treat("{\n  \"id\": 1\n}", ANSI_FG_GREEN, ANSI_FG_RESET);
    EXPECT_EQ(strip_ansi(colored), "{\n  \"id\": 1\n}\n");
    EXPECT_EQ(strip_ansi("plain"), "plain");
    EXPECT_EQ(strip_ansi("\x1b[1;31mbold\x1b[0m"), "bold");
}

// 文件结束
