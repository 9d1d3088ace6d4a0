//! # Logger Unit Tests
//!
//! Tests for the logging layer: LogFilter parsing, text and JSON rendering,
//! FileSink I/O, the Logger singleton with its macros, and flag parsing.

#include "log/log.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace pdl::log;
namespace fs = std::filesystem;

// Collects records in memory
class CaptureSink : public LogSink {
public:
    std::vector<LogRecord> records;

    void write(const LogRecord& record) override {
        records.push_back(record);
    }
    void flush() override {}
};

// ============================================================================
// LogFilter Parsing
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ParseModuleAndDefault) {
    filter.parse("parser=debug,*=info");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "parser"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "parser"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "parser"));

    // Unmatched modules use the default
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "lexer"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "lexer"));
}

TEST_F(LogFilterTest, ParseAllTrace) {
    filter.parse("*=trace");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "parser"));
    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "anything"));
}

TEST_F(LogFilterTest, ParseModuleOff) {
    filter.parse("lexer=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "lexer"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "parser"));
}

TEST_F(LogFilterTest, ParseBareModuleName) {
    filter.parse("format");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "format"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "parser"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "parser"));
}

TEST_F(LogFilterTest, ParseMultipleModules) {
    filter.parse("parser=trace,lexer=info,format=warn,*=error");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "parser"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "lexer"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "lexer"));
    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "format"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "format"));
    EXPECT_FALSE(filter.should_log(LogLevel::Warn, "cli"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "cli"));
}

TEST_F(LogFilterTest, ReparseClearsModules) {
    filter.parse("parser=trace");
    filter.parse("lexer=trace");

    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "parser"));
    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "lexer"));
}

TEST_F(LogFilterTest, MinLevel) {
    EXPECT_EQ(filter.min_level(), LogLevel::Info);

    filter.parse("parser=debug,*=error");
    EXPECT_EQ(filter.min_level(), LogLevel::Debug);
}

TEST_F(LogFilterTest, WhitespaceAroundEntries) {
    filter.parse(" parser = debug , lexer ,, *=error ");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "parser"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "parser"));
    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "lexer"));
    EXPECT_FALSE(filter.should_log(LogLevel::Warn, "cli"));
}

TEST(LogLevelTest, ParseAndName) {
    EXPECT_EQ(parse_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parse_level("Warn"), LogLevel::Warn);
    EXPECT_EQ(parse_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_level("off"), LogLevel::Off);
    EXPECT_EQ(parse_level("nonsense"), LogLevel::Info);
    EXPECT_EQ(parse_level("nonsense", LogLevel::Error), LogLevel::Error);

    EXPECT_STREQ(level_name(LogLevel::Error), "ERROR");
    EXPECT_STREQ(level_name(LogLevel::Off), "OFF");
}

// ============================================================================
// Record Rendering
// ============================================================================

TEST(LogFormatTest, TextLine) {
    LogRecord record;
    record.level = LogLevel::Warn;
    record.module = "parser";
    record.message = "docs before extend dropped";

    std::string line = format_text(record);
    EXPECT_NE(line.find("WARN "), std::string::npos);
    EXPECT_NE(line.find("[parser] docs before extend dropped"), std::string::npos);
    EXPECT_EQ(line.find('\033'), std::string::npos);
    EXPECT_EQ(line.find('\n'), std::string::npos);
}

TEST(LogFormatTest, TextLineWithSource) {
    LogRecord record;
    record.level = LogLevel::Debug;
    record.module = "parser";
    record.source = "component.profile";
    record.message = "provide foo at 0..11";

    std::string line = format_text(record);
    // HH:MM:SS.mmm prefix
    ASSERT_GE(line.size(), 13u);
    EXPECT_EQ(line[2], ':');
    EXPECT_EQ(line[5], ':');
    EXPECT_EQ(line[8], '.');
    EXPECT_EQ(line.substr(12), " DEBUG [parser] component.profile: provide foo at 0..11");
}

TEST(LogFormatTest, JsonLine) {
    LogRecord record;
    record.level = LogLevel::Error;
    record.module = "lexer";
    record.message = "bad \"escape\"\n";
    record.timestamp_ms = 42;

    EXPECT_EQ(format_json(record),
              "{\"ts\":42,\"level\":\"ERROR\",\"module\":\"lexer\","
              "\"msg\":\"bad \\\"escape\\\"\\n\"}");
}

TEST(LogFormatTest, JsonLineWithSource) {
    LogRecord record;
    record.level = LogLevel::Info;
    record.module = "cli";
    record.source = "a.profile";
    record.message = "done";
    record.timestamp_ms = 7;

    EXPECT_EQ(format_json(record),
              "{\"ts\":7,\"level\":\"INFO\",\"module\":\"cli\","
              "\"source\":\"a.profile\",\"msg\":\"done\"}");
}

TEST(ConsoleSinkTest, WritesToStream) {
    std::ostringstream out;
    ConsoleSink sink(true, out);

    LogRecord record;
    record.level = LogLevel::Warn;
    record.module = "lexer";
    record.message = "first";
    sink.write(record);

    sink.set_format(LogFormat::JSON);
    record.message = "second";
    record.timestamp_ms = 1;
    sink.write(record);

    std::string text = out.str();
    auto newline = text.find('\n');
    ASSERT_NE(newline, std::string::npos);
    std::string first = text.substr(0, newline);
    EXPECT_NE(first.find("WARN  [lexer] first"), std::string::npos);
    // Colors are only used on a terminal
    EXPECT_EQ(first.find('\033'), std::string::npos);
    EXPECT_EQ(text.substr(newline + 1),
              "{\"ts\":1,\"level\":\"WARN\",\"module\":\"lexer\",\"msg\":\"second\"}\n");
}

// ============================================================================
// FileSink
// ============================================================================

class FileSinkTest : public ::testing::Test {
protected:
    fs::path temp_file;

    void SetUp() override {
        temp_file = fs::temp_directory_path() / "pdl_log_test.log";
        fs::remove(temp_file);
    }

    void TearDown() override {
        fs::remove(temp_file);
    }

    auto read_file(const fs::path& path) -> std::string {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    auto make_record(LogLevel level, std::string_view module, const std::string& message)
        -> LogRecord {
        LogRecord record;
        record.level = level;
        record.module = module;
        record.message = message;
        record.file = __FILE__;
        record.line = __LINE__;
        record.timestamp_ms = epoch_ms();
        return record;
    }
};

TEST_F(FileSinkTest, WritesTextLines) {
    {
        FileSink sink(temp_file.string(), false);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "cli", "file sink test"));
        sink.flush();
    }

    ASSERT_TRUE(fs::exists(temp_file));
    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("INFO"), std::string::npos);
    EXPECT_NE(content.find("[cli]"), std::string::npos);
    EXPECT_NE(content.find("file sink test"), std::string::npos);
}

TEST_F(FileSinkTest, AppendsToExistingFile) {
    {
        FileSink sink(temp_file.string(), true);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "m1", "first"));
    }
    {
        FileSink sink(temp_file.string(), true);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Warn, "m2", "second"));
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("first"), std::string::npos);
    EXPECT_NE(content.find("second"), std::string::npos);
}

TEST_F(FileSinkTest, JsonFormat) {
    {
        FileSink sink(temp_file.string(), false);
        sink.set_format(LogFormat::JSON);
        ASSERT_TRUE(sink.is_open());

        auto record = make_record(LogLevel::Error, "format", "tab\there");
        record.timestamp_ms = 9999999;
        sink.write(record);
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("{\"ts\":9999999,"), std::string::npos);
    EXPECT_NE(content.find("\"level\":\"ERROR\""), std::string::npos);
    EXPECT_NE(content.find("\"module\":\"format\""), std::string::npos);
    EXPECT_NE(content.find("\"msg\":\"tab\\there\""), std::string::npos);
}

TEST_F(FileSinkTest, UnopenablePathIsNotOpen) {
    FileSink sink((temp_file.parent_path() / "pdl-missing-dir" / "x" / "log.txt").string());
    EXPECT_FALSE(sink.is_open());
    sink.write(make_record(LogLevel::Error, "cli", "dropped"));
}

// ============================================================================
// Logger Singleton
// ============================================================================

class LoggerTest : public ::testing::Test {
protected:
    CaptureSink* capture = nullptr;

    void SetUp() override {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        auto sink = std::make_unique<CaptureSink>();
        capture = sink.get();
        logger.add_sink(std::move(sink));
    }

    void TearDown() override {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        logger.set_filter("");
        logger.set_level(LogLevel::Warn);
    }
};

TEST_F(LoggerTest, LevelGatesMacros) {
    Logger::instance().set_level(LogLevel::Info);

    PDL_LOG_DEBUG("parser", "hidden");
    PDL_LOG_INFO("parser", "shown " << 3);
    PDL_LOG_ERROR("lexer", "also shown");

    ASSERT_EQ(capture->records.size(), 2u);
    EXPECT_EQ(capture->records[0].level, LogLevel::Info);
    EXPECT_EQ(capture->records[0].module, "parser");
    EXPECT_EQ(capture->records[0].message, "shown 3");
    EXPECT_NE(capture->records[0].line, 0);
    EXPECT_EQ(capture->records[1].message, "also shown");
}

TEST_F(LoggerTest, FilterSelectsModules) {
    auto& logger = Logger::instance();
    logger.set_filter("parser=debug,*=error");
    EXPECT_EQ(logger.level(), LogLevel::Debug);

    PDL_LOG_DEBUG("parser", "parser debug");
    PDL_LOG_DEBUG("lexer", "lexer debug");
    PDL_LOG_WARN("lexer", "lexer warn");
    PDL_LOG_ERROR("lexer", "lexer error");

    ASSERT_EQ(capture->records.size(), 2u);
    EXPECT_EQ(capture->records[0].message, "parser debug");
    EXPECT_EQ(capture->records[1].message, "lexer error");
}

TEST_F(LoggerTest, SetLevelKeepsModuleThresholds) {
    auto& logger = Logger::instance();
    logger.set_filter("parser=trace");
    logger.set_level(LogLevel::Warn);

    EXPECT_EQ(logger.level(), LogLevel::Trace);
    EXPECT_TRUE(logger.should_log(LogLevel::Trace, "parser"));
    EXPECT_FALSE(logger.should_log(LogLevel::Info, "lexer"));
    EXPECT_TRUE(logger.should_log(LogLevel::Warn, "lexer"));

    PDL_LOG_TRACE("parser", "kept");
    PDL_LOG_INFO("lexer", "dropped");
    ASSERT_EQ(capture->records.size(), 1u);
    EXPECT_EQ(capture->records[0].message, "kept");
}

TEST_F(LoggerTest, SourceScopeTagsRecords) {
    Logger::instance().set_level(LogLevel::Info);

    PDL_LOG_INFO("cli", "outside");
    {
        SourceScope outer("a.profile");
        PDL_LOG_INFO("cli", "in a");
        {
            SourceScope inner("b.profile");
            PDL_LOG_INFO("parser", "in b");
        }
        PDL_LOG_INFO("cli", "back in a");
    }
    EXPECT_TRUE(SourceScope::current().empty());

    ASSERT_EQ(capture->records.size(), 4u);
    EXPECT_EQ(capture->records[0].source, "");
    EXPECT_EQ(capture->records[1].source, "a.profile");
    EXPECT_EQ(capture->records[2].source, "b.profile");
    EXPECT_EQ(capture->records[3].source, "a.profile");
}

TEST_F(LoggerTest, OffDropsEverything) {
    Logger::instance().set_level(LogLevel::Off);
    PDL_LOG_FATAL("cli", "nothing");
    EXPECT_TRUE(capture->records.empty());
}

TEST_F(LoggerTest, InitWithoutConsoleKeepsNoSinks) {
    LogConfig config;
    config.console = false;
    config.level = LogLevel::Trace;
    Logger::init(config);

    // init replaced the capture sink
    capture = nullptr;
    EXPECT_EQ(Logger::instance().level(), LogLevel::Trace);
    EXPECT_TRUE(Logger::instance().should_log(LogLevel::Trace, "parser"));
}

TEST_F(LoggerTest, ConcurrentLogging) {
    auto& logger = Logger::instance();
    logger.set_level(LogLevel::Trace);

    const int num_threads = 8;
    const int messages_per_thread = 100;

    std::vector<std::thread> threads;
    threads.reserve(num_threads);
    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < messages_per_thread; i++) {
                std::ostringstream oss;
                oss << "thread-" << t << "-msg-" << i;
                logger.log(LogLevel::Info, "parser", oss.str(), __FILE__, __LINE__);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(static_cast<int>(capture->records.size()), num_threads * messages_per_thread);
}

// ============================================================================
// Flag Parsing
// ============================================================================

class LogOptionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("PDL_LOG");
    }

    void TearDown() override {
        unsetenv("PDL_LOG");
    }

    auto parse(std::vector<std::string> args) -> LogConfig {
        args.insert(args.begin(), "pdl");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return parse_log_options(static_cast<int>(argv.size()), argv.data());
    }
};

TEST_F(LogOptionsTest, Defaults) {
    auto config = parse({"parse", "a.profile"});
    EXPECT_EQ(config.level, LogLevel::Warn);
    EXPECT_EQ(config.format, LogFormat::Text);
    EXPECT_TRUE(config.filter_spec.empty());
    EXPECT_TRUE(config.log_file.empty());
}

TEST_F(LogOptionsTest, Verbosity) {
    EXPECT_EQ(parse({"-v"}).level, LogLevel::Info);
    EXPECT_EQ(parse({"-vv"}).level, LogLevel::Debug);
    EXPECT_EQ(parse({"-vvv"}).level, LogLevel::Trace);
    EXPECT_EQ(parse({"-q"}).level, LogLevel::Error);
    EXPECT_EQ(parse({"--quiet"}).level, LogLevel::Error);
}

TEST_F(LogOptionsTest, ExplicitLevelBeatsVerbosity) {
    EXPECT_EQ(parse({"-vvv", "--log-level=error"}).level, LogLevel::Error);
}

TEST_F(LogOptionsTest, FilterFileAndFormat) {
    auto config = parse({"--log-filter=parser=trace", "--log-file=out.log", "--log-format=json"});
    EXPECT_EQ(config.filter_spec, "parser=trace");
    EXPECT_EQ(config.log_file, "out.log");
    EXPECT_EQ(config.format, LogFormat::JSON);
}

TEST_F(LogOptionsTest, EnvironmentLevel) {
    setenv("PDL_LOG", "debug", 1);
    EXPECT_EQ(parse({}).level, LogLevel::Debug);
}

TEST_F(LogOptionsTest, EnvironmentFilter) {
    setenv("PDL_LOG", "lexer=trace,parser", 1);
    auto config = parse({});
    EXPECT_EQ(config.filter_spec, "lexer=trace,parser");
    EXPECT_EQ(config.level, LogLevel::Warn);
}

TEST_F(LogOptionsTest, FlagsOverrideEnvironment) {
    setenv("PDL_LOG", "trace", 1);
    EXPECT_EQ(parse({"-q"}).level, LogLevel::Error);
}

TEST(IsLogOptionTest, Recognized) {
    EXPECT_TRUE(is_log_option("-v"));
    EXPECT_TRUE(is_log_option("-vvv"));
    EXPECT_TRUE(is_log_option("-q"));
    EXPECT_TRUE(is_log_option("--log-level=debug"));
    EXPECT_TRUE(is_log_option("--log-file=x"));

    EXPECT_FALSE(is_log_option("--verbose"));
    EXPECT_FALSE(is_log_option("-V"));
    EXPECT_FALSE(is_log_option("-vx"));
    EXPECT_FALSE(is_log_option("parse"));
}
