/**
 * @file db_connection_pool.h
 * @brief PostgreSQL Connection Pool
 *
 * Thread-safe pool of libpq connections:
 * - minimum connections opened eagerly by initialize()
 * - lazily grows up to maxSize
 * - bounded wait when exhausted
 * - unhealthy connections are dropped on acquire and release
 *
 * @date 2026-10-19
 */

#pragma once

#include <libpq-fe.h>
#include <string>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <atomic>

namespace common {

class DbConnectionPool;

/**
 * @brief RAII lease of a pooled PostgreSQL connection
 *
 * Returns the connection to its pool when destroyed.
 */
class DbConnection {
public:
    DbConnection(PGconn* conn, DbConnectionPool* pool)
        : conn_(conn), pool_(pool) {}

    ~DbConnection() { release(); }

    DbConnection(const DbConnection&) = delete;
    DbConnection& operator=(const DbConnection&) = delete;

    DbConnection(DbConnection&& other) noexcept
        : conn_(other.conn_), pool_(other.pool_) {
        other.conn_ = nullptr;
    }

    DbConnection& operator=(DbConnection&& other) noexcept {
        if (this != &other) {
            release();
            conn_ = other.conn_;
            pool_ = other.pool_;
            other.conn_ = nullptr;
        }
        return *this;
    }

    PGconn* get() const { return conn_; }

    bool isValid() const { return conn_ != nullptr; }

    /**
     * @brief Give the connection back early
     */
    void release();

private:
    PGconn* conn_;
    DbConnectionPool* pool_;  // Non-owning
};

/**
 * @brief PostgreSQL connection pool
 */
class DbConnectionPool {
public:
    struct Stats {
        size_t availableConnections;
        size_t totalConnections;
        size_t maxConnections;
    };

    /**
     * @param connString libpq connection string
     * @param minSize Connections opened by initialize()
     * @param maxSize Upper bound on open connections
     * @param acquireTimeoutSec Wait limit when the pool is exhausted
     * @throws std::invalid_argument if minSize > maxSize or maxSize == 0
     */
    DbConnectionPool(const std::string& connString,
                     size_t minSize = 2,
                     size_t maxSize = 10,
                     int acquireTimeoutSec = 5);

    ~DbConnectionPool();

    DbConnectionPool(const DbConnectionPool&) = delete;
    DbConnectionPool& operator=(const DbConnectionPool&) = delete;

    /**
     * @brief Open the minimum number of connections
     * @return false if any of them could not be opened
     */
    bool initialize();

    /**
     * @brief Lease a connection
     * @throws DatabaseException if the pool is shut down or a connection cannot be opened
     * @throws PoolExhaustedException on acquire timeout
     */
    DbConnection acquire();

    /**
     * @brief Snapshot of idle, open and maximum connections
     */
    Stats getStats() const;

    void shutdown();

private:
    friend class DbConnection;

    PGconn* createConnection();
    static bool isConnectionHealthy(PGconn* conn);
    void releaseConnection(PGconn* conn);

    std::string connString_;
    size_t minSize_;
    size_t maxSize_;
    std::chrono::seconds acquireTimeout_;

    std::queue<PGconn*> available_;
    std::atomic<size_t> total_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool shutdown_;
};

} // namespace common
