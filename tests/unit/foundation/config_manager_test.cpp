#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "cgc/foundation/config_manager.hpp"

using namespace cgc::foundation;

namespace {

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("cgc_config_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path write(const std::string& name, const std::string& content) {
        auto path = dir_ / name;
        std::ofstream out(path);
        out << content;
        return path;
    }

    std::filesystem::path dir_;
};

} // namespace

TEST_F(ConfigFileTest, LoadsNestedKeysFromFile) {
    auto path = write("client.yaml",
                      "network:\n"
                      "  ServerAddress: \"10.0.0.4:4000\"\n"
                      "  MaxRetryAttempts: 5\n"
                      "  EnableJitter: true\n");

    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    EXPECT_EQ(config.get<std::string>("network.ServerAddress").value(), "10.0.0.4:4000");
    EXPECT_EQ(config.get<int>("network.MaxRetryAttempts").value(), 5);
    EXPECT_TRUE(config.get<bool>("network.EnableJitter").value());
    EXPECT_EQ(config.size(), 3u);
}

TEST_F(ConfigFileTest, MissingFileFails) {
    ConfigManager config;
    auto result = config.load(dir_ / "absent.yaml");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigFileTest, MalformedYamlFails) {
    auto path = write("broken.yaml", "network: [unclosed\n");
    ConfigManager config;
    auto result = config.load(path);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST(ConfigManagerTest, NonMappingRootIsRejected) {
    ConfigManager config;
    auto result = config.loadString("- a\n- b\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST(ConfigManagerTest, EmptyDocumentLoadsNothing) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("").hasValue());
    EXPECT_EQ(config.size(), 0u);
}

TEST(ConfigManagerTest, ReloadReplacesEntries) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("a: 1\nb: 2\n").hasValue());
    ASSERT_TRUE(config.loadString("c: 3\n").hasValue());
    EXPECT_FALSE(config.hasKey("a"));
    EXPECT_TRUE(config.hasKey("c"));
}

TEST(ConfigManagerTest, MissingKeyAndTypeMismatch) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("network:\n  Transport: stream\n").hasValue());

    auto missing = config.get<int>("network.Port");
    ASSERT_TRUE(missing.hasError());
    EXPECT_EQ(missing.error().code(), ErrorCode::ConfigKeyNotFound);

    auto mismatch = config.get<int>("network.Transport");
    ASSERT_TRUE(mismatch.hasError());
    EXPECT_EQ(mismatch.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(ConfigManagerTest, GetOrFallsBackOnlyWhenAbsent) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("x: word\n").hasValue());
    EXPECT_EQ(config.getOr<int>("y", 7).value(), 7);
    EXPECT_TRUE(config.getOr<int>("x", 7).hasError());
}

TEST(ConfigManagerTest, SetNotifiesWatchers) {
    ConfigManager config;
    std::vector<std::string> seen;
    config.watch("network.KeepaliveIntervalMs", [&](std::string_view key) {
        seen.emplace_back(key);
        // Reading back from inside the callback must not deadlock.
        EXPECT_EQ(config.get<int>("network.KeepaliveIntervalMs").value(), 1500);
    });

    config.set("network.KeepaliveIntervalMs", 1500);
    config.set("network.Other", 1);

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "network.KeepaliveIntervalMs");
}
