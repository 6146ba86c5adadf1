#include "postgresql_query_executor.h"
#include "../exception/exceptions.h"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <stdexcept>

namespace common {

namespace {

// PostgreSQL built-in type OIDs (pg_type.h)
constexpr Oid kBoolOid = 16;
constexpr Oid kInt8Oid = 20;
constexpr Oid kInt2Oid = 21;
constexpr Oid kInt4Oid = 23;
constexpr Oid kFloat4Oid = 700;
constexpr Oid kFloat8Oid = 701;

} // namespace

PostgreSQLQueryExecutor::PostgreSQLQueryExecutor(DbConnectionPool* pool)
    : pool_(pool)
{
    if (!pool_) {
        throw std::invalid_argument("PostgreSQLQueryExecutor: pool cannot be nullptr");
    }
}

Json::Value PostgreSQLQueryExecutor::executeQuery(
    const std::string& query,
    const std::vector<std::string>& params)
{
    ResultPtr res = execute(query, params);
    return resultToJson(res.get());
}

int PostgreSQLQueryExecutor::executeCommand(
    const std::string& query,
    const std::vector<std::string>& params)
{
    ResultPtr res = execute(query, params);

    const char* affected = PQcmdTuples(res.get());
    int rows = (affected && affected[0] != '\0') ? std::atoi(affected) : 0;
    spdlog::debug("[PostgreSQLQueryExecutor] Command affected {} rows", rows);
    return rows;
}

Json::Value PostgreSQLQueryExecutor::executeScalar(
    const std::string& query,
    const std::vector<std::string>& params)
{
    ResultPtr res = execute(query, params);

    if (PQntuples(res.get()) == 0) {
        throw DatabaseException("scalar query returned no rows");
    }
    if (PQnfields(res.get()) != 1) {
        throw DatabaseException("scalar query must return exactly one column");
    }
    if (PQgetisnull(res.get(), 0, 0)) {
        return Json::nullValue;
    }
    return fieldToJson(PQftype(res.get(), 0), PQgetvalue(res.get(), 0, 0));
}

PostgreSQLQueryExecutor::ResultPtr PostgreSQLQueryExecutor::execute(
    const std::string& query,
    const std::vector<std::string>& params)
{
    spdlog::debug("[PostgreSQLQueryExecutor] Query: {} ({} params)", query, params.size());

    DbConnection conn = pool_->acquire();

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p.empty() ? nullptr : p.c_str());
    }

    ResultPtr res(PQexecParams(
        conn.get(),
        query.c_str(),
        static_cast<int>(params.size()),
        nullptr,            // infer parameter types
        values.data(),
        nullptr,            // text parameters
        nullptr,
        0                   // text results
    ));

    if (!res) {
        throw DatabaseException(std::string("no result: ") + PQerrorMessage(conn.get()));
    }

    ExecStatusType status = PQresultStatus(res.get());
    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
        throw DatabaseException(PQresultErrorMessage(res.get()));
    }
    return res;
}

Json::Value PostgreSQLQueryExecutor::fieldToJson(Oid type, const char* value)
{
    switch (type) {
        case kInt2Oid:
        case kInt4Oid:
        case kInt8Oid:
            return Json::Value(static_cast<Json::Int64>(std::strtoll(value, nullptr, 10)));
        case kFloat4Oid:
        case kFloat8Oid:
            return Json::Value(std::strtod(value, nullptr));
        case kBoolOid:
            return Json::Value(value[0] == 't');
        default:
            return Json::Value(value);
    }
}

Json::Value PostgreSQLQueryExecutor::resultToJson(const PGresult* res)
{
    Json::Value rows = Json::arrayValue;
    const int nRows = PQntuples(res);
    const int nCols = PQnfields(res);

    for (int i = 0; i < nRows; ++i) {
        Json::Value row(Json::objectValue);
        for (int j = 0; j < nCols; ++j) {
            const char* name = PQfname(res, j);
            if (PQgetisnull(res, i, j)) {
                row[name] = Json::nullValue;
            } else {
                row[name] = fieldToJson(PQftype(res, j), PQgetvalue(res, i, j));
            }
        }
        rows.append(row);
    }
    return rows;
}

} // namespace common
