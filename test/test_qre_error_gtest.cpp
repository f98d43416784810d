#include <gtest/gtest.h>

#include "../qre/qre_error.hpp"

#include <cstring>

using namespace qre;

TEST(QreErrorTest, CodeRanges) {
    EXPECT_TRUE(QRE_ERR_IS_SYNTAX(ERR_UNTERMINATED_GROUP));
    EXPECT_TRUE(QRE_ERR_IS_SEMANTIC(ERR_UNKNOWN_TYPE));
    EXPECT_TRUE(QRE_ERR_IS_RUNTIME(ERR_CONVERSION_FAILED));
    EXPECT_FALSE(QRE_ERR_IS_SYNTAX(ERR_OK));

    EXPECT_STREQ(err_category_name(ERR_INVALID_REGEX), "syntax");
    EXPECT_STREQ(err_category_name(ERR_DUPLICATE_GROUP_NAME), "semantic");
    EXPECT_STREQ(err_category_name(ERR_INVALID_REPLACEMENT), "runtime");
    EXPECT_STREQ(err_category_name(ERR_OK), "ok");
}

TEST(QreErrorTest, CodeNamesAndMessages) {
    const QreErrorCode codes[] = {
        ERR_OK, ERR_PATTERN_SYNTAX, ERR_UNTERMINATED_GROUP, ERR_DUPLICATE_ALTERNATION,
        ERR_INVALID_GROUP_NAME, ERR_INVALID_REGEX, ERR_SEMANTIC_ERROR, ERR_UNKNOWN_TYPE,
        ERR_DUPLICATE_GROUP_NAME, ERR_INVALID_TYPE, ERR_RUNTIME_ERROR, ERR_CONVERSION_FAILED,
        ERR_INVALID_REPLACEMENT,
    };
    for (QreErrorCode code : codes) {
        EXPECT_STRNE(err_code_name(code), "UNKNOWN") << "code " << (int)code << " has no name";
        EXPECT_STRNE(err_code_message(code), "unknown error") << "code " << (int)code << " has no message";
    }
    EXPECT_STREQ(err_code_name(ERR_UNKNOWN_TYPE), "UNKNOWN_TYPE");
}

TEST(QreErrorTest, PatternErrorMessage) {
    PatternError e(ERR_UNTERMINATED_GROUP, "unterminated group", "[abc", 5);
    EXPECT_EQ(e.code(), ERR_UNTERMINATED_GROUP);
    EXPECT_EQ(e.position(), 5u);
    EXPECT_EQ(e.fragment(), "[abc");
    EXPECT_STREQ(e.what(), "unterminated group at offset 5: '[abc'");
}

TEST(QreErrorTest, Hierarchy) {
    try {
        throw UnknownTypeError("money", 3);
    } catch (const PatternError& e) {
        EXPECT_EQ(e.code(), ERR_UNKNOWN_TYPE) << "unknown types are pattern errors";
        EXPECT_EQ(e.position(), 3u);
        EXPECT_NE(std::strstr(e.what(), "money"), nullptr);
    }

    try {
        throw ConversionError("when", "2021-13-45", "date out of range");
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ERR_CONVERSION_FAILED);
        EXPECT_NE(std::strstr(e.what(), "when"), nullptr);
        EXPECT_NE(std::strstr(e.what(), "2021-13-45"), nullptr);
    }

    try {
        throw ReplaceError("nothing to replace");
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "nothing to replace");
    }
}
