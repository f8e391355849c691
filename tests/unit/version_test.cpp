#include <gtest/gtest.h>

#include <memory>

#include "ger/ger.hpp"

TEST(VersionTest, MajorMinorPatch) {
    EXPECT_EQ(ger::Version::major, 0);
    EXPECT_EQ(ger::Version::minor, 3);
    EXPECT_EQ(ger::Version::patch, 1);
}

TEST(VersionTest, VersionString) {
    EXPECT_STREQ(ger::Version::string, "0.3.1");
}

TEST(ResultTest, OkValue) {
    auto result = ger::Result<int>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorValue) {
    auto result = ger::Result<int>::err(ger::Error("something failed"));
    EXPECT_FALSE(result.hasValue());
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().message, "something failed");
    EXPECT_EQ(result.error().code, -1);
}

TEST(ResultTest, ErrorWithCode) {
    auto result = ger::Result<int>::err(ger::Error(404, "not found"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, 404);
    EXPECT_EQ(result.error().message, "not found");
}

TEST(ResultTest, ValueOr) {
    auto ok = ger::Result<int>::ok(10);
    auto err = ger::Result<int>::err(ger::Error("fail"));
    EXPECT_EQ(ok.valueOr(0), 10);
    EXPECT_EQ(err.valueOr(0), 0);
}

TEST(ResultTest, BoolConversion) {
    auto ok = ger::Result<int>::ok(1);
    auto err = ger::Result<int>::err(ger::Error("fail"));
    EXPECT_TRUE(static_cast<bool>(ok));
    EXPECT_FALSE(static_cast<bool>(err));
}

TEST(ResultTest, MoveOnlyValue) {
    auto result = ger::Result<std::unique_ptr<int>>::ok(std::make_unique<int>(5));
    ASSERT_TRUE(result.hasValue());
    auto owned = std::move(result).value();
    ASSERT_NE(owned, nullptr);
    EXPECT_EQ(*owned, 5);
}

TEST(ResultVoidTest, Ok) {
    auto result = ger::Result<void>::ok();
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
}

TEST(ResultVoidTest, Error) {
    auto result = ger::Result<void>::err(ger::Error("void error"));
    EXPECT_FALSE(result.hasValue());
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().message, "void error");
}
