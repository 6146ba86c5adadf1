#pragma once

#include "i_query_executor.h"
#include "db_connection_pool.h"
#include <libpq-fe.h>
#include <memory>

/**
 * @file postgresql_query_executor.h
 * @brief libpq implementation of IQueryExecutor
 *
 * Leases a connection from DbConnectionPool per call, binds parameters with
 * PQexecParams and converts the PGresult into JSON.
 *
 * @date 2026-10-19
 */

namespace common {

class PostgreSQLQueryExecutor : public IQueryExecutor {
public:
    /**
     * @param pool Connection pool (non-owning)
     * @throws std::invalid_argument if pool is nullptr
     */
    explicit PostgreSQLQueryExecutor(DbConnectionPool* pool);

    ~PostgreSQLQueryExecutor() override = default;

    Json::Value executeQuery(
        const std::string& query,
        const std::vector<std::string>& params = {}
    ) override;

    int executeCommand(
        const std::string& query,
        const std::vector<std::string>& params = {}
    ) override;

    Json::Value executeScalar(
        const std::string& query,
        const std::vector<std::string>& params = {}
    ) override;

    std::string getDatabaseType() const override { return "postgres"; }

    /**
     * @brief Convert a single text-format field to JSON by column type OID
     *
     * - INT2/INT4/INT8 -> integer (64-bit)
     * - FLOAT4/FLOAT8  -> double
     * - BOOL           -> boolean
     * - everything else (NUMERIC, TEXT, TIMESTAMP, ...) -> string
     */
    static Json::Value fieldToJson(Oid type, const char* value);

private:
    struct ResultDeleter {
        void operator()(PGresult* res) const { PQclear(res); }
    };
    using ResultPtr = std::unique_ptr<PGresult, ResultDeleter>;

    /**
     * @brief Run a parameterized statement
     * @throws DatabaseException unless status is COMMAND_OK or TUPLES_OK
     */
    ResultPtr execute(const std::string& query, const std::vector<std::string>& params);

    static Json::Value resultToJson(const PGresult* res);

    DbConnectionPool* pool_;
};

} // namespace common
