/**
 * @file test_db_connection_pool.cpp
 * @brief Unit tests for DbConnectionPool bookkeeping
 *
 * Uses a pool with no minimum connections, so no server is contacted.
 */

#include <gtest/gtest.h>
#include "db_connection_pool.h"
#include "exception/exceptions.h"

using common::DbConnectionPool;

class DbConnectionPoolTest : public ::testing::Test {
protected:
    DbConnectionPool pool_{"host='127.0.0.1' port=1 dbname='none'", 0, 3, 1};
};

TEST_F(DbConnectionPoolTest, StatsOfEmptyPool) {
    // Act
    ASSERT_TRUE(pool_.initialize());
    auto stats = pool_.getStats();

    // Assert
    EXPECT_EQ(stats.availableConnections, 0u);
    EXPECT_EQ(stats.totalConnections, 0u);
    EXPECT_EQ(stats.maxConnections, 3u);
}

TEST_F(DbConnectionPoolTest, AcquireAfterShutdownThrows) {
    pool_.shutdown();
    EXPECT_THROW(pool_.acquire(), common::DatabaseException);
}

TEST(DbConnectionPoolConstructionTest, RejectsInvalidSizes) {
    EXPECT_THROW(DbConnectionPool("", 0, 0, 1), std::invalid_argument);
    EXPECT_THROW(DbConnectionPool("", 5, 2, 1), std::invalid_argument);
}
