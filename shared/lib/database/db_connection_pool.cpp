/**
 * @file db_connection_pool.cpp
 * @brief PostgreSQL Connection Pool implementation
 */

#include "db_connection_pool.h"
#include "../exception/exceptions.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace common {

// =============================================================================
// DbConnection
// =============================================================================

void DbConnection::release() {
    if (!conn_) {
        return;
    }
    if (pool_) {
        pool_->releaseConnection(conn_);
    } else {
        PQfinish(conn_);
    }
    conn_ = nullptr;
}

// =============================================================================
// DbConnectionPool
// =============================================================================

DbConnectionPool::DbConnectionPool(const std::string& connString,
                                   size_t minSize,
                                   size_t maxSize,
                                   int acquireTimeoutSec)
    : connString_(connString)
    , minSize_(minSize)
    , maxSize_(maxSize)
    , acquireTimeout_(acquireTimeoutSec)
    , total_(0)
    , shutdown_(false)
{
    if (maxSize_ == 0) {
        throw std::invalid_argument("maxSize must be positive");
    }
    if (minSize_ > maxSize_) {
        throw std::invalid_argument("minSize cannot exceed maxSize");
    }
    spdlog::info("[DbConnectionPool] Created: min={}, max={}, timeout={}s",
                 minSize_, maxSize_, acquireTimeoutSec);
}

DbConnectionPool::~DbConnectionPool() {
    shutdown();
}

bool DbConnectionPool::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    while (total_ < minSize_) {
        PGconn* conn = createConnection();
        if (!conn) {
            spdlog::error("[DbConnectionPool] Failed to open connection {}/{}", total_.load() + 1, minSize_);
            return false;
        }
        available_.push(conn);
        total_++;
    }

    spdlog::info("[DbConnectionPool] Initialized with {} connections", total_.load());
    return true;
}

DbConnection DbConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    auto deadline = std::chrono::steady_clock::now() + acquireTimeout_;

    while (true) {
        if (shutdown_) {
            throw DatabaseException("connection pool is shut down");
        }

        if (!available_.empty()) {
            PGconn* conn = available_.front();
            available_.pop();
            if (isConnectionHealthy(conn)) {
                return DbConnection(conn, this);
            }
            spdlog::warn("[DbConnectionPool] Dropping unhealthy pooled connection");
            PQfinish(conn);
            total_--;
            continue;
        }

        if (total_ < maxSize_) {
            // Reserve the slot before unlocking so concurrent callers cannot overshoot maxSize
            total_++;
            lock.unlock();
            PGconn* conn = createConnection();
            lock.lock();
            if (!conn) {
                total_--;
                cv_.notify_one();
                throw DatabaseException("failed to open PostgreSQL connection");
            }
            spdlog::debug("[DbConnectionPool] Opened connection (total: {})", total_.load());
            return DbConnection(conn, this);
        }

        if (cv_.wait_until(lock, deadline) == std::cv_status::timeout && available_.empty()) {
            spdlog::warn("[DbConnectionPool] Acquire timed out after {}s", acquireTimeout_.count());
            throw PoolExhaustedException("PostgreSQL");
        }
    }
}

DbConnectionPool::Stats DbConnectionPool::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Stats{available_.size(), total_.load(), maxSize_};
}

void DbConnectionPool::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
        return;
    }
    shutdown_ = true;

    while (!available_.empty()) {
        PQfinish(available_.front());
        available_.pop();
        total_--;
    }
    cv_.notify_all();

    spdlog::info("[DbConnectionPool] Shut down ({} leased connections close on release)", total_.load());
}

PGconn* DbConnectionPool::createConnection() {
    PGconn* conn = PQconnectdb(connString_.c_str());
    if (PQstatus(conn) != CONNECTION_OK) {
        spdlog::error("[DbConnectionPool] Connection failed: {}", PQerrorMessage(conn));
        PQfinish(conn);
        return nullptr;
    }
    return conn;
}

bool DbConnectionPool::isConnectionHealthy(PGconn* conn) {
    if (!conn || PQstatus(conn) != CONNECTION_OK) {
        return false;
    }
    // Leased connections must come back idle; an open transaction means the holder failed mid-way
    return PQtransactionStatus(conn) == PQTRANS_IDLE;
}

void DbConnectionPool::releaseConnection(PGconn* conn) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_ || !isConnectionHealthy(conn)) {
        if (!shutdown_) {
            spdlog::warn("[DbConnectionPool] Released connection is unhealthy, closing");
        }
        PQfinish(conn);
        total_--;
    } else {
        available_.push(conn);
    }
    cv_.notify_one();
}

} // namespace common
