/**
 * @file postgres_connection.hpp
 * @brief PostgreSQL connection and query interface
 */

#pragma once

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <libpq-fe.h>

namespace Lexicode {

struct DatabaseConfig;

/**
 * @brief libpq failure carrying the server SQLSTATE (empty for client-side errors)
 */
class DatabaseError : public std::runtime_error {
public:
    DatabaseError(const std::string& message, std::string sqlstate)
        : std::runtime_error(message), sqlstate_(std::move(sqlstate)) {}

    const std::string& sqlstate() const { return sqlstate_; }

private:
    std::string sqlstate_;
};

/**
 * @brief PostgreSQL connection wrapper
 */
class PostgresConnection {
public:
    using Row = std::vector<std::string>;
    using RowCallback = std::function<void(const Row&)>;

    /**
     * @brief Connect with settings gathered by DatabaseConfig::from_env()
     */
    explicit PostgresConnection(const DatabaseConfig& config);

    /**
     * @brief Connect with explicit connection string
     */
    explicit PostgresConnection(const std::string& conninfo);

    ~PostgresConnection();

    // No copy
    PostgresConnection(const PostgresConnection&) = delete;
    PostgresConnection& operator=(const PostgresConnection&) = delete;

    // Move OK
    PostgresConnection(PostgresConnection&& other) noexcept;
    PostgresConnection& operator=(PostgresConnection&& other) noexcept;

    /**
     * @brief Execute query (no results expected)
     */
    void execute(const std::string& sql);

    /**
     * @brief Execute query with parameters (no results)
     */
    void execute(const std::string& sql, const std::vector<std::string>& params);

    /**
     * @brief Execute a parameterised command and return the affected row count
     */
    long execute_count(const std::string& sql, const std::vector<std::string>& params);

    /**
     * @brief Execute query and return the first column of the first row
     */
    std::optional<std::string> query_single(const std::string& sql, const std::vector<std::string>& params = {});

    /**
     * @brief Execute query and iterate rows
     */
    void query(const std::string& sql, const std::vector<std::string>& params, const RowCallback& callback);

    void begin();
    void commit();
    void rollback();

    /**
     * @brief Stream a chunk of COPY ... FROM STDIN data
     */
    void copy_data(const char* buffer, int nbytes);

    /**
     * @brief Finish COPY; a non-null @p error_msg aborts it
     */
    void copy_end(const char* error_msg = nullptr);

private:
    void connect(const std::string& conninfo);
    void disconnect();
    void require_connection() const;
    PGresult* run(const std::string& sql, const std::vector<std::string>& params);
    void check_result(PGresult* result);

    PGconn* conn_ = nullptr;
    std::string last_error_;
};

} // namespace Lexicode
