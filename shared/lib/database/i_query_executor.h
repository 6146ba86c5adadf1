#pragma once

#include <string>
#include <vector>
#include <json/json.h>

/**
 * @file i_query_executor.h
 * @brief Query Executor Interface
 *
 * Repositories run SQL through this interface instead of calling libpq
 * directly. Results come back as JSON so repository code (and its tests)
 * never touch PGresult.
 *
 * @date 2026-10-19
 */

namespace common {

/**
 * @brief Parameterized SQL execution
 *
 * Parameters are positional ($1, $2, ...). A parameter given as an empty
 * string is bound as SQL NULL.
 */
class IQueryExecutor {
public:
    virtual ~IQueryExecutor() = default;

    /**
     * @brief Execute a row-returning statement
     *
     * Also used for INSERT ... RETURNING.
     *
     * @return JSON array of row objects keyed by column name:
     *   [ {"id": 7, "filename": "ab...cd.png"}, ... ]
     * @throws DatabaseException on execution failure
     */
    virtual Json::Value executeQuery(
        const std::string& query,
        const std::vector<std::string>& params = {}
    ) = 0;

    /**
     * @brief Execute INSERT/UPDATE/DELETE/DDL
     * @return Number of affected rows
     * @throws DatabaseException on execution failure
     */
    virtual int executeCommand(
        const std::string& query,
        const std::vector<std::string>& params = {}
    ) = 0;

    /**
     * @brief Execute a query that yields exactly one column of one row
     *
     * Example: executeScalar("SELECT COUNT(*) FROM images") -> 42
     *
     * @throws DatabaseException if the query fails, returns no rows, or returns several columns
     */
    virtual Json::Value executeScalar(
        const std::string& query,
        const std::vector<std::string>& params = {}
    ) = 0;

    /**
     * @brief Backend identifier for diagnostics ("postgres")
     */
    virtual std::string getDatabaseType() const = 0;
};

} // namespace common
