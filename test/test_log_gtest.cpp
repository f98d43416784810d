#include <gtest/gtest.h>

#include "../lib/log.h"

#include <cstdio>
#include <string>

class LogTest : public ::testing::Test {
protected:
    FILE* capture = nullptr;

    void SetUp() override {
        log_fini();
        log_init(NULL);
        capture = tmpfile();
        ASSERT_NE(capture, nullptr);
    }

    void TearDown() override {
        // detach the capture file so log_fini() leaves it open
        log_set_output(log_default_category, stderr);
        log_set_output(log_get_category("qre"), stderr);
        log_fini();
        if (capture) fclose(capture);
        log_init(NULL);
    }

    std::string captured() {
        fflush(capture);
        rewind(capture);
        std::string text;
        char buf[256];
        size_t n;
        while ((n = fread(buf, 1, sizeof(buf), capture)) > 0) text.append(buf, n);
        return text;
    }
};

TEST_F(LogTest, DefaultLevelIsWarn) {
    ASSERT_NE(log_default_category, nullptr);
    EXPECT_FALSE(log_level_enabled(log_default_category, LOG_LEVEL_DEBUG));
    EXPECT_FALSE(log_level_enabled(log_default_category, LOG_LEVEL_INFO));
    EXPECT_TRUE(log_level_enabled(log_default_category, LOG_LEVEL_WARN));
    EXPECT_TRUE(log_level_enabled(log_default_category, LOG_LEVEL_ERROR));
}

TEST_F(LogTest, LevelFiltering) {
    log_set_output(log_default_category, capture);
    log_debug("hidden %d", 1);
    log_warn("shown %d", 2);
    log_set_level(log_default_category, LOG_LEVEL_DEBUG);
    log_debug("now visible");

    std::string text = captured();
    EXPECT_EQ(text.find("hidden"), std::string::npos) << "debug is below the default level";
    EXPECT_NE(text.find("WARN"), std::string::npos);
    EXPECT_NE(text.find("shown 2"), std::string::npos);
    EXPECT_NE(text.find("now visible"), std::string::npos);
}

TEST_F(LogTest, NamedCategory) {
    log_category_t* cat = log_get_category("qre");
    ASSERT_NE(cat, nullptr);
    EXPECT_EQ(log_get_category("qre"), cat) << "same name, same category";
    EXPECT_STREQ(cat->name, "qre");

    log_set_output(cat, capture);
    log_set_level(cat, LOG_LEVEL_INFO);
    clog_info(cat, "compiled %s", "pattern");
    std::string text = captured();
    EXPECT_NE(text.find("[qre]"), std::string::npos) << "named categories are tagged";
    EXPECT_NE(text.find("compiled pattern"), std::string::npos);
}

TEST_F(LogTest, ConfigString) {
    const char* config =
        "[global]\n"
        "timestamps = off\n"
        "colors = off\n"
        "\n"
        "[rules]\n"
        "# comment\n"
        "default.ERROR >stderr\n"
        "qre.DEBUG >stdout\n";
    EXPECT_EQ(log_parse_config_string(config), LOG_OK);
    EXPECT_FALSE(log_level_enabled(log_default_category, LOG_LEVEL_WARN));

    log_category_t* cat = log_get_category("qre");
    ASSERT_NE(cat, nullptr);
    EXPECT_TRUE(log_level_enabled(cat, LOG_LEVEL_DEBUG));
    EXPECT_EQ(cat->output, stdout);
}

TEST_F(LogTest, ConfigErrors) {
    EXPECT_EQ(log_parse_config_string("[rules]\ndefault.LOUD >stderr\n"), LOG_WRONG_FORMAT);
    EXPECT_EQ(log_parse_config_string("[rules]\ndefault.INFO >nowhere\n"), LOG_WRONG_FORMAT);
    EXPECT_EQ(log_parse_config_file("/nonexistent/log.conf"), LOG_INIT_FAIL);
}

TEST_F(LogTest, LevelNames) {
    EXPECT_STREQ(log_level_to_string(LOG_LEVEL_NOTICE), "NOTICE");
    EXPECT_EQ(log_level_from_string("warn"), LOG_LEVEL_WARN);
    EXPECT_EQ(log_level_from_string("*"), LOG_LEVEL_DEBUG);
    EXPECT_EQ(log_level_from_string("verbose"), -1);
}
