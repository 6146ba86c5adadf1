/**
 * @file app_config_test.cpp
 * @brief Unit tests for environment-driven AppConfig
 */

#include <gtest/gtest.h>
#include "infrastructure/app_config.h"

#include <cstdlib>

class AppConfigTest : public ::testing::Test {
protected:
    const std::vector<std::string> vars_ = {
        "DB_HOST", "DB_PORT", "DB_NAME", "DB_USER", "DB_PASSWORD",
        "DB_POOL_MIN", "DB_POOL_MAX", "DB_POOL_TIMEOUT",
        "SERVER_PORT", "THREAD_NUM", "APP_BASE", "UPLOAD_DIR", "LOG_DIR",
        "MAX_FILE_SIZE_MB", "PAGE_SIZE", "PUBLIC_BASE_PATH", "ENFORCE_SIGNATURE_CHECK",
        "LOG_LEVEL", "LOG_TO_FILE", "LOG_FILE"
    };

    void SetUp() override { clearEnv(); }
    void TearDown() override { clearEnv(); }

    void clearEnv() {
        for (const auto& name : vars_) {
            unsetenv(name.c_str());
        }
    }
};

TEST_F(AppConfigTest, Defaults) {
    AppConfig config = AppConfig::fromEnvironment();

    EXPECT_EQ(config.dbHost, "db");
    EXPECT_EQ(config.dbName, "images_db");
    EXPECT_EQ(config.serverPort, 8000);
    EXPECT_EQ(config.uploadDir, "/app/images");
    EXPECT_EQ(config.logDir, "/app/logs");
    EXPECT_EQ(config.logFile, "/app/logs/image-service.log");
    EXPECT_EQ(config.maxFileSizeBytes(), 5 * 1024 * 1024);
    EXPECT_EQ(config.maxRequestBodyBytes(), 5u * 1024 * 1024 + 64 * 1024);
    EXPECT_EQ(config.publicBasePath, "/images");
    EXPECT_TRUE(config.enforceSignatureCheck);
}

TEST_F(AppConfigTest, ReadsEnvironment) {
    // Arrange
    setenv("APP_BASE", "/srv/imghost", 1);
    setenv("DB_PORT", "6543", 1);
    setenv("MAX_FILE_SIZE_MB", "8", 1);
    setenv("PAGE_SIZE", "25", 1);
    setenv("ENFORCE_SIGNATURE_CHECK", "off", 1);
    setenv("LOG_DIR", "/var/log/imghost", 1);

    // Act
    AppConfig config = AppConfig::fromEnvironment();

    // Assert
    EXPECT_EQ(config.uploadDir, "/srv/imghost/images");
    EXPECT_EQ(config.logDir, "/var/log/imghost");
    EXPECT_EQ(config.logFile, "/var/log/imghost/image-service.log");
    EXPECT_EQ(config.dbPort, 6543);
    EXPECT_EQ(config.maxFileSizeMB, 8);
    EXPECT_EQ(config.pageSize, 25);
    EXPECT_FALSE(config.enforceSignatureCheck);
}

TEST_F(AppConfigTest, InvalidAndOutOfRangeValues) {
    setenv("SERVER_PORT", "http", 1);
    setenv("PAGE_SIZE", "1000", 1);
    setenv("DB_POOL_MIN", "50", 1);
    setenv("DB_POOL_MAX", "4", 1);

    AppConfig config = AppConfig::fromEnvironment();

    EXPECT_EQ(config.serverPort, 8000);
    EXPECT_EQ(config.pageSize, 100);
    EXPECT_EQ(config.dbPoolMax, 4);
    EXPECT_EQ(config.dbPoolMin, 4);
}

TEST_F(AppConfigTest, EnvStoi) {
    EXPECT_EQ(AppConfig::envStoi("42", 1, 0, 100), 42);
    EXPECT_EQ(AppConfig::envStoi(" 7 ", 1, 0, 100), 7);
    EXPECT_EQ(AppConfig::envStoi("-5", 1, 0, 100), 0);
    EXPECT_EQ(AppConfig::envStoi("x", 9, 0, 100), 9);
}

TEST_F(AppConfigTest, RequiresPassword) {
    AppConfig config = AppConfig::fromEnvironment();
    EXPECT_THROW(config.validateRequiredCredentials(), common::ConfigException);

    setenv("DB_PASSWORD", "secret", 1);
    config = AppConfig::fromEnvironment();
    EXPECT_NO_THROW(config.validateRequiredCredentials());
    EXPECT_EQ(config.dbPoolConfig().password, "secret");
    EXPECT_EQ(config.dbPoolConfig().database, "images_db");
}
