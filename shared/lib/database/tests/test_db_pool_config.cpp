/**
 * @file test_db_pool_config.cpp
 * @brief Unit tests for DbPoolConfig connection string building
 */

#include <gtest/gtest.h>
#include "db_pool_config.h"

using common::DbPoolConfig;

TEST(DbPoolConfigTest, Defaults) {
    DbPoolConfig config;
    EXPECT_EQ(config.host, "db");
    EXPECT_EQ(config.port, 5432);
    EXPECT_EQ(config.database, "images_db");
    EXPECT_EQ(config.user, "postgres");
    EXPECT_LE(config.minSize, config.maxSize);
}

TEST(DbPoolConfigTest, BuildConnString_QuotesValues) {
    DbPoolConfig config;
    config.host = "localhost";
    config.port = 6543;
    config.password = "secret";

    EXPECT_EQ(config.buildConnString(),
              "host='localhost' port=6543 dbname='images_db' user='postgres' "
              "password='secret' connect_timeout=10");
}

TEST(DbPoolConfigTest, BuildConnString_EscapesQuotesAndBackslashes) {
    DbPoolConfig config;
    config.password = "it's a \\pass word";

    std::string conn = config.buildConnString();
    EXPECT_NE(conn.find("password='it\\'s a \\\\pass word'"), std::string::npos) << conn;
}

TEST(DbPoolConfigTest, Describe_MasksPassword) {
    DbPoolConfig config;
    config.password = "topsecret";
    std::string text = config.describe();
    EXPECT_EQ(text.find("topsecret"), std::string::npos);
    EXPECT_NE(text.find("password=***"), std::string::npos);

    config.password.clear();
    EXPECT_NE(config.describe().find("password=(empty)"), std::string::npos);
}
