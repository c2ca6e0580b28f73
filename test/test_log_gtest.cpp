#include <gtest/gtest.h>
#include "../lib/log.h"
#include <stdio.h>
#include <string.h>
#include <string>

// Test suite for the log library using GTest

class LogTest : public ::testing::Test {
protected:
    FILE* sink;

    void SetUp() override {
        sink = tmpfile();
        ASSERT_NE(sink, nullptr);
        log_set_output(nullptr, sink);
        log_set_level(nullptr, LOG_LEVEL_DEBUG);
        log_enable_timestamps(0);
    }

    void TearDown() override {
        log_set_output(nullptr, nullptr);
        log_set_level(nullptr, LOG_LEVEL_INFO);
        fclose(sink);
    }

    std::string captured() {
        fflush(sink);
        std::string text;
        rewind(sink);
        char buf[256];
        size_t n;
        while ((n = fread(buf, 1, sizeof(buf), sink)) > 0) text.append(buf, n);
        return text;
    }
};

TEST_F(LogTest, WritesLevelAndMessage) {
    EXPECT_EQ(log_warn("flow_layout: %d frames", 3), LOG_OK);
    EXPECT_EQ(captured(), "[WARN] flow_layout: 3 frames\n");
}

TEST_F(LogTest, FiltersBelowLevel) {
    log_set_level(nullptr, LOG_LEVEL_ERROR);
    log_debug("hidden");
    log_info("hidden");
    log_error("shown");
    EXPECT_EQ(captured(), "[ERROR] shown\n");
}

TEST_F(LogTest, LevelEnabled) {
    log_set_level(nullptr, LOG_LEVEL_WARN);
    EXPECT_FALSE(log_level_enabled(nullptr, LOG_LEVEL_INFO));
    EXPECT_TRUE(log_level_enabled(nullptr, LOG_LEVEL_WARN));
    EXPECT_TRUE(log_level_enabled(nullptr, LOG_LEVEL_FATAL));
}

TEST_F(LogTest, LevelNames) {
    EXPECT_STREQ(log_level_to_string(LOG_LEVEL_DEBUG), "DEBUG");
    EXPECT_STREQ(log_level_to_string(LOG_LEVEL_NOTICE), "NOTICE");
    EXPECT_STREQ(log_level_to_string(7), "UNKNOWN");
    EXPECT_EQ(log_level_from_string("warn"), LOG_LEVEL_WARN);
    EXPECT_EQ(log_level_from_string("verbose"), -1);
    EXPECT_EQ(log_level_from_string(nullptr), -1);
}

TEST_F(LogTest, CategoriesAreShared) {
    log_category_t* a = log_get_category("flow");
    log_category_t* b = log_get_category("flow");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a, b);
    EXPECT_STREQ(a->name, "flow");
    EXPECT_EQ(log_get_category(""), log_default_category);
}

TEST_F(LogTest, CategoryLevelFromConfig) {
    EXPECT_EQ(log_parse_config_string("# flow logging\nflow_cache.level = error\n"), LOG_OK);
    log_category_t* cat = log_get_category("flow_cache");
    ASSERT_NE(cat, nullptr);
    EXPECT_EQ(cat->level, LOG_LEVEL_ERROR);

    log_set_output(cat, sink);
    clog_warn(cat, "dropped");
    clog_error(cat, "kept %s", "entry");
    EXPECT_EQ(captured(), "[ERROR] kept entry\n");
    log_set_output(cat, nullptr);
}

TEST_F(LogTest, MalformedConfigIsReported) {
    EXPECT_EQ(log_parse_config_string("level debug\n"), LOG_WRONG_FORMAT);
    EXPECT_EQ(log_parse_config_string("level = loud\n"), LOG_WRONG_FORMAT);
    EXPECT_EQ(log_parse_config_string("flow.colour = red\n"), LOG_WRONG_FORMAT);
    EXPECT_EQ(log_parse_config_string(nullptr), LOG_OK);
}

TEST_F(LogTest, MissingConfigFileKeepsDefaults) {
    EXPECT_EQ(log_init("/nonexistent/quire/log.conf"), LOG_OK);
    EXPECT_EQ(log_parse_config_file("/nonexistent/quire/log.conf"), LOG_INIT_FAIL);
}

int main(int argc, char** argv) {
    log_init("log.conf");
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
