#include <gtest/gtest.h>
#include "core/logging.hh"
#include <filesystem>
#include <fstream>
#include <thread>
#include <unistd.h>

namespace qx {
namespace {

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger& logger = Logger::instance();
        logger.clear_sinks();
        logger.clear_component_levels();
        logger.set_level(LogLevel::INFO);
        sink_ = std::make_shared<MemorySink>();
        logger.add_sink(sink_);
    }

    void TearDown() override {
        Logger& logger = Logger::instance();
        logger.clear_sinks();
        logger.clear_component_levels();
        logger.set_level(LogLevel::INFO);
        logger.add_sink(std::make_shared<ConsoleSink>(false));
    }

    std::shared_ptr<MemorySink> sink_;
};

TEST_F(LoggingTest, LogLevelNames) {
    EXPECT_EQ(log_level_name(LogLevel::TRACE), "TRACE");
    EXPECT_EQ(log_level_name(LogLevel::DEBUG), "DEBUG");
    EXPECT_EQ(log_level_name(LogLevel::INFO), "INFO");
    EXPECT_EQ(log_level_name(LogLevel::WARN), "WARN");
    EXPECT_EQ(log_level_name(LogLevel::ERROR), "ERROR");
    EXPECT_EQ(log_level_name(LogLevel::FATAL), "FATAL");
    EXPECT_EQ(log_level_name(LogLevel::OFF), "OFF");
}

TEST_F(LoggingTest, ParseLogLevel) {
    LogLevel level = LogLevel::OFF;
    EXPECT_TRUE(parse_log_level("debug", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(parse_log_level("WARN", level));
    EXPECT_EQ(level, LogLevel::WARN);
    EXPECT_TRUE(parse_log_level("warning", level));
    EXPECT_EQ(level, LogLevel::WARN);

    level = LogLevel::INFO;
    EXPECT_FALSE(parse_log_level("verbose", level));
    EXPECT_EQ(level, LogLevel::INFO);
}

TEST_F(LoggingTest, LoggerSingleton) {
    EXPECT_EQ(&Logger::instance(), &Logger::instance());
}

TEST_F(LoggingTest, LevelFiltering) {
    ComponentLogger logger("test");

    logger.info("kept info");
    logger.debug() << "dropped debug";
    logger.warn() << "kept warn " << 7;

    EXPECT_TRUE(sink_->contains("kept info"));
    EXPECT_TRUE(sink_->contains("kept warn 7"));
    EXPECT_FALSE(sink_->contains("dropped debug"));
}

TEST_F(LoggingTest, EntryCarriesComponentAndLevel) {
    ComponentLogger logger("chunker");
    logger.error("disk on fire");

    auto entries = sink_->entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].component, "chunker");
    EXPECT_EQ(entries[0].level, LogLevel::ERROR);
    EXPECT_EQ(entries[0].message, "disk on fire");
    EXPECT_GT(entries[0].line, 0u);
}

TEST_F(LoggingTest, ComponentLevelOverride) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::WARN);
    logger.set_component_level("fec", LogLevel::DEBUG);

    EXPECT_TRUE(logger.is_enabled(LogLevel::DEBUG, "fec"));
    EXPECT_FALSE(logger.is_enabled(LogLevel::DEBUG, "chunker"));
    EXPECT_TRUE(logger.is_enabled(LogLevel::WARN, "chunker"));
}

TEST_F(LoggingTest, ChildComponentsInheritParentLevel) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::WARN);
    logger.set_component_level("rendezvous", LogLevel::DEBUG);

    EXPECT_TRUE(log::sweeper.is_debug_enabled());
    EXPECT_TRUE(log::service.is_debug_enabled());
    EXPECT_TRUE(log::rendezvous.is_debug_enabled());
    EXPECT_FALSE(log::fec.is_debug_enabled());

    // A more specific entry wins over the parent
    logger.set_component_level("rendezvous.sweeper", LogLevel::ERROR);
    EXPECT_FALSE(log::sweeper.is_info_enabled());
    EXPECT_TRUE(log::service.is_debug_enabled());
}

TEST_F(LoggingTest, MacrosSkipDisabledLevels) {
    int evaluated = 0;
    auto side_effect = [&evaluated] { return ++evaluated; };

    QX_LOG_DEBUG(log::core) << "not formatted " << side_effect();
    EXPECT_EQ(evaluated, 0);

    QX_LOG_INFO(log::core) << "formatted " << side_effect();
    EXPECT_EQ(evaluated, 1);
    EXPECT_TRUE(sink_->contains("formatted 1"));
}

TEST_F(LoggingTest, MemorySinkCapacity) {
    auto small = std::make_shared<MemorySink>(2);
    Logger::instance().add_sink(small);

    log::core.info("one");
    log::core.info("two");
    log::core.info("three");

    auto entries = small->entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].message, "two");
    EXPECT_EQ(entries[1].message, "three");

    small->clear();
    EXPECT_TRUE(small->entries().empty());
}

TEST_F(LoggingTest, RemoveSink) {
    Logger::instance().remove_sink(sink_);
    log::core.info("after removal");
    EXPECT_FALSE(sink_->contains("after removal"));
}

TEST_F(LoggingTest, FormatLogEntry) {
    LogEntry entry;
    entry.level = LogLevel::WARN;
    entry.timestamp = std::chrono::system_clock::now();
    entry.component = "fec";
    entry.message = "parity raised";
    entry.file = "/src/fec/policy.cc";
    entry.line = 42;

    FormatOptions opts;
    opts.thread_id = false;
    opts.source_location = true;
    std::string line = format_log_entry(entry, opts);

    EXPECT_NE(line.find("[ WARN]"), std::string::npos);
    EXPECT_NE(line.find("[fec]"), std::string::npos);
    EXPECT_NE(line.find("parity raised"), std::string::npos);
    EXPECT_NE(line.find("(policy.cc:42)"), std::string::npos);
    EXPECT_EQ(line.find("\033["), std::string::npos);
}

TEST_F(LoggingTest, FileSinkWritesLines) {
    auto path = std::filesystem::temp_directory_path() /
                ("qx_logging_test_" + std::to_string(::getpid()) + ".log");
    std::filesystem::remove(path);

    {
        auto file = std::make_shared<FileSink>(path.string());
        ASSERT_TRUE(file->is_open());
        Logger::instance().add_sink(file);
        log::core.info("written to file");
        Logger::instance().flush();
        Logger::instance().remove_sink(file);
    }

    std::ifstream in(path);
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(contents.find("written to file"), std::string::npos);
    std::filesystem::remove(path);
}

TEST_F(LoggingTest, LogConfigDefaults) {
    LogConfig config;

    EXPECT_EQ(config.default_level, LogLevel::INFO);
    EXPECT_TRUE(config.console_enabled);
    EXPECT_TRUE(config.console_colors);
    EXPECT_FALSE(config.console_thread_id);
    EXPECT_FALSE(config.file_enabled);
    EXPECT_EQ(config.file_path, "quantarax.log");
}

TEST_F(LoggingTest, InitLoggingAppliesComponentLevels) {
    LogConfig config;
    config.default_level = LogLevel::ERROR;
    config.console_enabled = false;
    config.component_levels["chunker"] = LogLevel::DEBUG;
    init_logging(config);

    EXPECT_EQ(Logger::instance().level(), LogLevel::ERROR);
    EXPECT_TRUE(log::chunker.is_debug_enabled());
    EXPECT_FALSE(log::fec.is_info_enabled());
}

TEST_F(LoggingTest, ThreadSafety) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([] {
            ComponentLogger thread_logger("thread");
            for (int i = 0; i < 100; ++i) {
                thread_logger.info() << "Thread message " << i;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(sink_->entries().size(), 400u);
}

}  // namespace
}  // namespace qx
