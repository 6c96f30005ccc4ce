#include "Logger.h"
#include <gtest/gtest.h>

#include <memory>
#include <vector>

namespace {

class CaptureHandler : public hr::logging::Handler {
public:
  void emit(hr::logging::Level level, const std::string &message) override {
    if (level < level_) {
      return;
    }
    lines.push_back(message);
  }

  std::vector<std::string> lines;
};

} // namespace

TEST(LoggerTest, RootLoggerWorks) {
    auto rootLogger = hr::logging::getRootLogger();
    EXPECT_NO_THROW({
        rootLogger.debug << "Debug message";
        rootLogger.info << "Info message";
        rootLogger.critical << "Critical message";
    });
    EXPECT_EQ(rootLogger.getFullName(), "");
}

TEST(LoggerTest, NamedLoggerHasCorrectName) {
    auto logger = hr::logging::getLogger("lt_named.child");
    EXPECT_EQ(logger.getName(), "child");
    EXPECT_EQ(logger.getFullName(), "lt_named.child");
}

TEST(LoggerTest, SameNameSharesNode) {
    auto a = hr::logging::getLogger("lt_shared");
    auto b = hr::logging::getLogger(".lt_shared");
    EXPECT_EQ(a, b);
}

TEST(LoggerTest, LevelFiltersMessages) {
    auto logger = hr::logging::getLogger("lt_level");
    auto capture = std::make_shared<CaptureHandler>();
    logger.addHandler(capture);
    logger.setPropagate(false);
    logger.setLevel(hr::logging::Level::WARNING);

    logger.debug << "dropped";
    logger.info << "dropped";
    logger.warning << "kept " << 1;
    logger.error << "kept " << 2;

    ASSERT_EQ(capture->lines.size(), 2u);
    EXPECT_NE(capture->lines[0].find("[WARNING] [lt_level] kept 1"), std::string::npos);
    EXPECT_NE(capture->lines[1].find("[ERROR] [lt_level] kept 2"), std::string::npos);
}

TEST(LoggerTest, MessagesPropagateWithOriginName) {
    auto parent = hr::logging::getLogger("lt_tree");
    auto child = hr::logging::getLogger("lt_tree.engine");
    auto capture = std::make_shared<CaptureHandler>();
    parent.addHandler(capture);
    parent.setPropagate(false);

    child.info << "hello";

    ASSERT_EQ(capture->lines.size(), 1u);
    EXPECT_NE(capture->lines[0].find("[lt_tree.engine] hello"), std::string::npos);
}

TEST(LoggerTest, SwitchToRebindsHandle) {
    auto logger = hr::logging::getLogger("lt_switch_a");
    logger.switchTo("lt_switch_b.sub");
    EXPECT_EQ(logger.getFullName(), "lt_switch_b.sub");
    EXPECT_EQ(logger, hr::logging::getLogger("lt_switch_b.sub"));
}

TEST(LoggerTest, CopiedLoggerLogsThroughOwnProxies) {
    auto capture = std::make_shared<CaptureHandler>();
    hr::logging::Logger copy = hr::logging::getLogger("lt_copy");
    {
        auto original = hr::logging::getLogger("lt_copy");
        copy = original;
    }
    copy.addHandler(capture);
    copy.setPropagate(false);
    copy.info << "after original is gone";
    EXPECT_EQ(capture->lines.size(), 1u);
}

TEST(LoggerTest, ParseLevelNames) {
    EXPECT_EQ(hr::logging::parseLevel("debug"), hr::logging::Level::DEBUG);
    EXPECT_EQ(hr::logging::parseLevel("WARN"), hr::logging::Level::WARNING);
    EXPECT_EQ(hr::logging::parseLevel("Critical"), hr::logging::Level::CRITICAL);
    EXPECT_EQ(hr::logging::parseLevel("bogus"), hr::logging::Level::INFO);
}

TEST(LoggerTest, FileHandlerRejectsBadPath) {
    auto logger = hr::logging::getLogger("lt_file");
    EXPECT_THROW(logger.addFileHandler("/nonexistent-dir/x/y.log"), std::runtime_error);
}
