/**
 * @file postgres_connection.cpp
 * @brief PostgreSQL connection implementation
 */

#include <database/postgres_connection.hpp>
#include <config/build_config.hpp>
#include <cstdlib>

namespace Lexicode {

PostgresConnection::PostgresConnection(const DatabaseConfig& config) {
    connect(config.conninfo());
}

PostgresConnection::PostgresConnection(const std::string& conninfo) {
    connect(conninfo);
}

PostgresConnection::~PostgresConnection() {
    disconnect();
}

PostgresConnection::PostgresConnection(PostgresConnection&& other) noexcept
    : conn_(other.conn_), last_error_(std::move(other.last_error_)) {
    other.conn_ = nullptr;
}

PostgresConnection& PostgresConnection::operator=(PostgresConnection&& other) noexcept {
    if (this != &other) {
        disconnect();
        conn_ = other.conn_;
        last_error_ = std::move(other.last_error_);
        other.conn_ = nullptr;
    }
    return *this;
}

void PostgresConnection::connect(const std::string& conninfo) {
    conn_ = PQconnectdb(conninfo.c_str());

    if (PQstatus(conn_) != CONNECTION_OK) {
        last_error_ = PQerrorMessage(conn_);
        PQfinish(conn_);
        conn_ = nullptr;
        throw DatabaseError("PostgreSQL connection failed: " + last_error_, "");
    }
}

void PostgresConnection::disconnect() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

void PostgresConnection::require_connection() const {
    if (!conn_ || PQstatus(conn_) != CONNECTION_OK) {
        throw DatabaseError("Not connected to database", "");
    }
}

void PostgresConnection::check_result(PGresult* result) {
    ExecStatusType status = PQresultStatus(result);

    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK &&
        status != PGRES_COPY_IN && status != PGRES_COPY_OUT) {
        last_error_ = PQerrorMessage(conn_);
        const char* state = result ? PQresultErrorField(result, PG_DIAG_SQLSTATE) : nullptr;
        std::string sqlstate = state ? state : "";
        PQclear(result);
        throw DatabaseError("PostgreSQL query failed: " + last_error_, sqlstate);
    }
}

PGresult* PostgresConnection::run(const std::string& sql, const std::vector<std::string>& params) {
    require_connection();

    if (params.empty()) {
        PGresult* result = PQexec(conn_, sql.c_str());
        check_result(result);
        return result;
    }

    std::vector<const char*> param_values;
    param_values.reserve(params.size());
    for (const auto& p : params) {
        param_values.push_back(p.c_str());
    }

    PGresult* result = PQexecParams(
        conn_,
        sql.c_str(),
        static_cast<int>(params.size()),
        nullptr,
        param_values.data(),
        nullptr,
        nullptr,
        0  // Text format
    );

    check_result(result);
    return result;
}

void PostgresConnection::execute(const std::string& sql) {
    PQclear(run(sql, {}));
}

void PostgresConnection::execute(const std::string& sql, const std::vector<std::string>& params) {
    PQclear(run(sql, params));
}

long PostgresConnection::execute_count(const std::string& sql, const std::vector<std::string>& params) {
    PGresult* result = run(sql, params);
    const char* tuples = PQcmdTuples(result);
    long count = (tuples && *tuples) ? std::strtol(tuples, nullptr, 10) : 0;
    PQclear(result);
    return count;
}

std::optional<std::string> PostgresConnection::query_single(const std::string& sql,
                                                            const std::vector<std::string>& params) {
    PGresult* result = run(sql, params);

    std::optional<std::string> value;
    if (PQntuples(result) > 0 && PQnfields(result) > 0 && !PQgetisnull(result, 0, 0)) {
        value = PQgetvalue(result, 0, 0);
    }

    PQclear(result);
    return value;
}

void PostgresConnection::query(const std::string& sql, const std::vector<std::string>& params,
                               const RowCallback& callback) {
    PGresult* result = run(sql, params);

    int nrows = PQntuples(result);
    int nfields = PQnfields(result);

    Row row;
    for (int i = 0; i < nrows; ++i) {
        row.clear();
        row.reserve(nfields);
        for (int j = 0; j < nfields; ++j) {
            row.push_back(PQgetvalue(result, i, j));
        }
        try {
            callback(row);
        } catch (...) {
            PQclear(result);
            throw;
        }
    }

    PQclear(result);
}

void PostgresConnection::copy_data(const char* buffer, int nbytes) {
    require_connection();

    if (PQputCopyData(conn_, buffer, nbytes) == -1) {
        last_error_ = PQerrorMessage(conn_);
        throw DatabaseError("COPY data failed: " + last_error_, "");
    }
}

void PostgresConnection::copy_end(const char* error_msg) {
    require_connection();

    if (PQputCopyEnd(conn_, error_msg) == -1) {
        last_error_ = PQerrorMessage(conn_);
        throw DatabaseError("COPY end failed: " + last_error_, "");
    }

    // After sending end, we must get the final result
    PGresult* res = PQgetResult(conn_);
    check_result(res);
    PQclear(res);

    // Drain until the connection is ready for the next command
    while ((res = PQgetResult(conn_)) != nullptr) {
        PQclear(res);
    }
}

void PostgresConnection::begin() {
    execute("BEGIN");
}

void PostgresConnection::commit() {
    execute("COMMIT");
}

void PostgresConnection::rollback() {
    execute("ROLLBACK");
}

} // namespace Lexicode
