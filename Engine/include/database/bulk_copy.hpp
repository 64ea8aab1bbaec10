#pragma once

#include <database/postgres_connection.hpp>
#include <atomic>
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

namespace Lexicode {

/**
 * @brief Streams many rows into Postgres using COPY.
 *
 * Usage:
 *   BulkCopy bc(conn, "ON CONFLICT (word, code) DO NOTHING");
 *   bc.begin_table("schema.table", {"col1","col2",...});
 *   for (...) bc.add_row({...});
 *   bc.flush();
 *
 * Rows are COPYed into a temp table shaped like the target and then moved
 * with one INSERT ... SELECT carrying the conflict clause, which gives
 * insert-or-ignore semantics for the whole batch. Not thread-safe; use one
 * instance per connection.
 */
class BulkCopy {
public:
    BulkCopy(PostgresConnection& db, std::string conflict_clause);

    // Prepare for a target table and column list. Call once before add_row.
    void begin_table(const std::string& table_name, const std::vector<std::string>& columns);

    // Add a row. values.size() may be <= columns.size(); missing values become NULL.
    void add_row(const std::vector<std::string>& values);

    // Finish the COPY and insert into the target table. No-op without pending rows.
    void flush();

    // Rows added since begin_table or the last flush
    size_t count() const noexcept { return row_count_; }

    static std::string quote_identifier(const std::string& id);

private:
    void start_copy_if_needed();
    void escape_value_into_buffer(const std::string& value);
    std::string full_table_name() const;
    std::string column_list() const;

    PostgresConnection& db_;
    std::ostringstream buffer_;

    std::string schema_;
    std::string table_name_;
    std::vector<std::string> columns_;
    std::string temp_table_name_;
    std::string conflict_clause_;
    size_t row_count_ = 0;
    bool in_copy_ = false;

    static std::atomic<uint64_t> s_counter_;
    static constexpr size_t DEFAULT_FLUSH_ROWS = 50000;
};

} // namespace Lexicode
