#include <gtest/gtest.h>

#include <string>

#include "cgc/core/result.hpp"
#include "cgc/version.hpp"

TEST(VersionTest, MajorMinorPatch) {
    EXPECT_EQ(cgc::Version::major, 0);
    EXPECT_EQ(cgc::Version::minor, 3);
    EXPECT_EQ(cgc::Version::patch, 0);
}

TEST(VersionTest, VersionString) {
    EXPECT_STREQ(cgc::Version::string, "0.3.0");
}

TEST(ResultTest, OkValue) {
    auto result = cgc::Result<int>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorValue) {
    auto result = cgc::Result<int>::err(cgc::Error("handshake failed"));
    EXPECT_FALSE(result.hasValue());
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().message, "handshake failed");
    EXPECT_EQ(result.error().code, -1);
}

TEST(ResultTest, ErrorWithCode) {
    auto result = cgc::Result<int>::err(cgc::Error(404, "not found"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, 404);
    EXPECT_EQ(result.error().message, "not found");
}

TEST(ResultTest, ValueOr) {
    auto ok = cgc::Result<int>::ok(10);
    auto err = cgc::Result<int>::err(cgc::Error("fail"));
    EXPECT_EQ(ok.valueOr(0), 10);
    EXPECT_EQ(err.valueOr(0), 0);
}

TEST(ResultTest, BoolConversion) {
    auto ok = cgc::Result<int>::ok(1);
    auto err = cgc::Result<int>::err(cgc::Error("fail"));
    EXPECT_TRUE(static_cast<bool>(ok));
    EXPECT_FALSE(static_cast<bool>(err));
}

TEST(ResultTest, MoveOnlyValue) {
    auto result = cgc::Result<std::string>::ok(std::string("payload"));
    std::string taken = std::move(result).value();
    EXPECT_EQ(taken, "payload");
}

TEST(ResultVoidTest, Ok) {
    auto result = cgc::Result<void>::ok();
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
}

TEST(ResultVoidTest, Error) {
    auto result = cgc::Result<void>::err(cgc::Error("void error"));
    EXPECT_FALSE(result.hasValue());
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().message, "void error");
}
