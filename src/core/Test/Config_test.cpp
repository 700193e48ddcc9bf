/**
 * Config_test.cpp
 */

#include "../Config.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

using downpour::core::Config;
using downpour::core::json;

namespace {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::instance().setDefaults();
        dir_ = std::filesystem::temp_directory_path()
            / ("downpour-config-" + std::to_string(
                   std::chrono::steady_clock::now().time_since_epoch().count()));
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
        Config::instance().setDefaults();
    }

    std::string writeFile(const std::string& name, const std::string& content) {
        auto path = dir_ / name;
        std::ofstream(path) << content;
        return path.string();
    }

    std::filesystem::path dir_;
};

TEST_F(ConfigTest, Defaults)
{
    auto& config = Config::instance();

    EXPECT_EQ(config.get<int>("downloads.maxConcurrent"), 3);
    EXPECT_EQ(config.get<std::string>("downloads.directory", "x"), "");
    EXPECT_EQ(config.get<int>("downloads.progressIntervalMs"), 50);
    EXPECT_EQ(config.get<int>("downloads.retryCount"), 3);
    EXPECT_EQ(config.get<int>("downloads.retryDelay"), 1000);
    EXPECT_EQ(config.get<int>("downloads.segments"), 8);
    EXPECT_EQ(config.get<int64_t>("downloads.minSegmentSize"), 1048576);
    EXPECT_EQ(config.get<std::string>("downloads.userAgent"), "Downpour/1.0");
    EXPECT_EQ(config.get<std::string>("logging.level"), "info");
}

TEST_F(ConfigTest, MissingOrMistypedKeyReturnsFallback)
{
    auto& config = Config::instance();

    EXPECT_FALSE(config.has("downloads.nothing"));
    EXPECT_EQ(config.get<int>("downloads.nothing", 42), 42);
    EXPECT_EQ(config.get<int>("downloads.userAgent", 7), 7);
}

TEST_F(ConfigTest, SetCreatesNestedKeys)
{
    auto& config = Config::instance();

    config.set("downloads.maxConcurrent", 5);
    config.set("ui.theme", std::string("dark"));

    EXPECT_EQ(config.get<int>("downloads.maxConcurrent"), 5);
    EXPECT_EQ(config.get<std::string>("ui.theme"), "dark");
    EXPECT_TRUE(config.has("ui.theme"));
}

TEST_F(ConfigTest, LoadMergesOverDefaults)
{
    auto path = writeFile("config.json", R"({"downloads": {"maxConcurrent": 8}})");

    auto& config = Config::instance();
    ASSERT_TRUE(config.load(path));

    EXPECT_EQ(config.get<int>("downloads.maxConcurrent"), 8);
    // Untouched keys keep their default
    EXPECT_EQ(config.get<int>("downloads.retryCount"), 3);
}

TEST_F(ConfigTest, MalformedFileKeepsCurrentValues)
{
    auto path = writeFile("broken.json", "{ not json");

    auto& config = Config::instance();
    config.set("downloads.maxConcurrent", 4);

    EXPECT_FALSE(config.load(path));
    EXPECT_FALSE(config.load((dir_ / "missing.json").string()));
    EXPECT_EQ(config.get<int>("downloads.maxConcurrent"), 4);
}

TEST_F(ConfigTest, SaveThenLoad)
{
    auto& config = Config::instance();
    config.set("downloads.directory", std::string("/data/downloads"));

    auto path = (dir_ / "nested" / "config.json").string();
    ASSERT_TRUE(config.save(path));

    config.setDefaults();
    ASSERT_TRUE(config.load(path));
    EXPECT_EQ(config.get<std::string>("downloads.directory"), "/data/downloads");
}

TEST_F(ConfigTest, MergePatch)
{
    auto& config = Config::instance();
    config.merge({{"logging", {{"level", "debug"}}}});

    EXPECT_EQ(config.get<std::string>("logging.level"), "debug");
    EXPECT_EQ(config.get<std::string>("logging.directory", "x"), "");
}

} // namespace
