#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include "bar_catalog/catalog/catalog_config.hpp"

using namespace bar_catalog;

class CatalogConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "bar_catalog_config_test";
        std::filesystem::create_directories(test_dir_);
        ::unsetenv("BAR_CATALOG_PATH");
    }

    void TearDown() override {
        ::unsetenv("BAR_CATALOG_PATH");
        std::filesystem::remove_all(test_dir_);
    }

    std::filesystem::path test_dir_;
};

TEST_F(CatalogConfigTest, DefaultsAreValid) {
    CatalogConfig config;
    EXPECT_EQ(config.catalog_path, "./catalog");
    EXPECT_EQ(config.requests_per_second, 50u);
    EXPECT_DOUBLE_EQ(config.rate_limit_safety_fraction, 0.9);
    EXPECT_EQ(config.max_attempts, 3u);
    EXPECT_EQ(config.base_delay(), std::chrono::milliseconds(2000));
    EXPECT_EQ(config.fetch_timeout(), std::chrono::seconds(120));
    EXPECT_EQ(config.default_venue, "SIM");
    EXPECT_FALSE(config.synthesize_missing_descriptor);
    EXPECT_TRUE(config.validate().is_ok());
}

TEST_F(CatalogConfigTest, SaveAndLoad) {
    CatalogConfig config;
    config.catalog_path = "/data/catalog";
    config.requests_per_second = 20;
    config.max_attempts = 5;
    config.base_delay_ms = 500;
    config.default_venue = "NASDAQ";
    config.synthesize_missing_descriptor = true;

    const auto path = (test_dir_ / "catalog.json").string();
    ASSERT_TRUE(config.save_to_file(path).is_ok());

    CatalogConfig loaded;
    auto result = loaded.load_from_file(path);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    EXPECT_EQ(loaded.catalog_path, "/data/catalog");
    EXPECT_EQ(loaded.requests_per_second, 20u);
    EXPECT_EQ(loaded.max_attempts, 5u);
    EXPECT_EQ(loaded.base_delay_ms, 500);
    EXPECT_EQ(loaded.default_venue, "NASDAQ");
    EXPECT_TRUE(loaded.synthesize_missing_descriptor);
}

TEST_F(CatalogConfigTest, PartialFileKeepsDefaults) {
    const auto path = test_dir_ / "partial.json";
    {
        std::ofstream file(path);
        file << R"({"catalog_path": "/tmp/bars", "max_attempts": 1})";
    }

    CatalogConfig config;
    ASSERT_TRUE(config.load_from_file(path.string()).is_ok());
    EXPECT_EQ(config.catalog_path, "/tmp/bars");
    EXPECT_EQ(config.max_attempts, 1u);
    EXPECT_EQ(config.requests_per_second, 50u);
    EXPECT_EQ(config.intraday_timeframe, "1-MINUTE-LAST");
}

TEST_F(CatalogConfigTest, ValidateRejectsBadValues) {
    auto expect_invalid = [](const CatalogConfig& config) {
        auto result = config.validate();
        ASSERT_TRUE(result.is_error());
        EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
    };

    CatalogConfig config;
    config.catalog_path.clear();
    expect_invalid(config);

    config = CatalogConfig();
    config.requests_per_second = 0;
    expect_invalid(config);

    config = CatalogConfig();
    config.rate_limit_safety_fraction = 1.5;
    expect_invalid(config);

    config = CatalogConfig();
    config.max_attempts = 0;
    expect_invalid(config);

    config = CatalogConfig();
    config.backoff_multiplier = 0.5;
    expect_invalid(config);

    config = CatalogConfig();
    config.connect_timeout_seconds = 0;
    expect_invalid(config);

    config = CatalogConfig();
    config.day_timeframe = "daily";
    expect_invalid(config);
}

TEST_F(CatalogConfigTest, EnvironmentOverridesCatalogPath) {
    CatalogConfig config;
    EXPECT_FALSE(config.apply_environment());
    EXPECT_EQ(config.catalog_path, "./catalog");

    ::setenv("BAR_CATALOG_PATH", "/mnt/bars", 1);
    EXPECT_TRUE(config.apply_environment());
    EXPECT_EQ(config.catalog_path, "/mnt/bars");

    ::setenv("BAR_CATALOG_PATH", "", 1);
    EXPECT_FALSE(config.apply_environment());
    EXPECT_EQ(config.catalog_path, "/mnt/bars");
}
