/**
 * @file test_error_codes.cpp
 * @brief Error catalogue and validation_error behaviour
 */

#include <gtest/gtest.h>
#include <checkkit/error_codes.hpp>
#include <set>

using namespace checkkit;

TEST(ErrorCodesTest, SuccessIsFalse) {
    EXPECT_FALSE(static_cast<bool>(error::SUCCESS));
    EXPECT_EQ(error::SUCCESS.code(), 0u);
    EXPECT_TRUE(static_cast<bool>(error::NOT_FOUND));
}

TEST(ErrorCodesTest, ComparesByCodeOnly) {
    error_code a(1100, "not found");
    error_code b(1100, "something else");
    EXPECT_EQ(a, b);
    EXPECT_EQ(a, error::NOT_FOUND);
    EXPECT_NE(a, error::ALREADY_EXISTS);
}

TEST(ErrorCodesTest, CataloguedCodesAreDistinct) {
    std::set<uint32_t> codes;
    for (const error_code *ec : {&error::SUCCESS, &error::NULL_INPUT, &error::INVALID_INPUT,
            &error::NOT_FOUND, &error::ALREADY_EXISTS, &error::INVALID_EXTENSION,
            &error::UNSUPPORTED_TYPE, &error::JSON_PARSE_ERROR,
            &error::JSON_TYPE_ERROR, &error::UNKNOWN_COMMAND, &error::MISSING_ARGUMENT}) {
        EXPECT_TRUE(codes.insert(ec->code()).second) << ec->what();
    }
}

TEST(ErrorCodesTest, ValidationErrorCarriesCodeAndDetail) {
    try {
        throw validation_error(error::INVALID_EXTENSION, "Invalid extension: is '.md'");
    } catch (const std::runtime_error &e) {
        EXPECT_STREQ(e.what(), "Invalid extension: is '.md'");
        const auto *ve = dynamic_cast<const validation_error*>(&e);
        ASSERT_NE(ve, nullptr);
        EXPECT_EQ(ve->code(), error::INVALID_EXTENSION);
        EXPECT_EQ(ve->code().what(), "invalid extension");
    }
}
