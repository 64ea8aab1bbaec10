#include <database/bulk_copy.hpp>
#include <stdexcept>
#include <utility>

namespace Lexicode {

std::atomic<uint64_t> BulkCopy::s_counter_{0};

BulkCopy::BulkCopy(PostgresConnection& db, std::string conflict_clause)
    : db_(db), conflict_clause_(std::move(conflict_clause)) {
    if (conflict_clause_.empty()) {
        throw std::invalid_argument("BulkCopy: a conflict clause is required");
    }
}

void BulkCopy::begin_table(const std::string& table_name, const std::vector<std::string>& columns) {
    if (in_copy_) {
        throw std::runtime_error("BulkCopy: flush() the current table before starting another");
    }

    // Parse optional schema.table
    auto dot_pos = table_name.find('.');
    if (dot_pos != std::string::npos) {
        schema_ = table_name.substr(0, dot_pos);
        table_name_ = table_name.substr(dot_pos + 1);
    } else {
        schema_.clear();
        table_name_ = table_name;
    }

    columns_ = columns;
    row_count_ = 0;
    buffer_.str("");
    buffer_.clear();

    uint64_t id = ++s_counter_;
    temp_table_name_ = "tmp_" + table_name_ + "_" + std::to_string(id);
}

std::string BulkCopy::quote_identifier(const std::string& id) {
    std::string out;
    out.reserve(id.size() + 2);
    out.push_back('"');
    for (char c : id) {
        if (c == '"') out.append("\"\"");
        else out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string BulkCopy::full_table_name() const {
    if (schema_.empty()) {
        return quote_identifier(table_name_);
    }
    return quote_identifier(schema_) + "." + quote_identifier(table_name_);
}

std::string BulkCopy::column_list() const {
    std::string cols;
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (i) cols += ", ";
        cols += quote_identifier(columns_[i]);
    }
    return cols;
}

void BulkCopy::escape_value_into_buffer(const std::string& value) {
    for (char c : value) {
        if (c == '\0') continue;
        switch (c) {
            case '\\': buffer_ << "\\\\"; break;
            case '\t': buffer_ << "\\t";  break;
            case '\n': buffer_ << "\\n";  break;
            case '\r': buffer_ << "\\r";  break;
            default:   buffer_ << c;      break;
        }
    }
}

void BulkCopy::start_copy_if_needed() {
    if (in_copy_) return;

    if (columns_.empty()) {
        throw std::runtime_error("BulkCopy: columns not set. Call begin_table() first.");
    }

    std::string temp_table = quote_identifier(temp_table_name_);

    std::ostringstream create_sql;
    create_sql << "CREATE TEMP TABLE IF NOT EXISTS " << temp_table
               << " (LIKE " << full_table_name() << " INCLUDING DEFAULTS) ON COMMIT DROP";
    db_.execute(create_sql.str());
    db_.execute("TRUNCATE " + temp_table);

    db_.execute("COPY " + temp_table + " (" + column_list() + ") FROM STDIN");
    in_copy_ = true;
}

void BulkCopy::add_row(const std::vector<std::string>& values) {
    start_copy_if_needed();

    const size_t ncols = columns_.size();
    for (size_t i = 0; i < ncols; ++i) {
        if (i) buffer_ << '\t';
        if (i < values.size() && !values[i].empty() && values[i] != "\\N") {
            escape_value_into_buffer(values[i]);
        } else {
            buffer_ << "\\N";
        }
    }
    buffer_ << '\n';
    ++row_count_;

    if ((row_count_ % DEFAULT_FLUSH_ROWS) == 0) {
        std::string data = buffer_.str();
        if (!data.empty()) {
            db_.copy_data(data.c_str(), static_cast<int>(data.size()));
            buffer_.str("");
            buffer_.clear();
        }
    }
}

void BulkCopy::flush() {
    if (!in_copy_) return;

    std::string data = buffer_.str();
    if (!data.empty()) {
        db_.copy_data(data.c_str(), static_cast<int>(data.size()));
    }
    db_.copy_end(nullptr);
    in_copy_ = false;

    std::string cols = column_list();
    db_.execute("INSERT INTO " + full_table_name() + " (" + cols + ") SELECT " + cols +
                " FROM " + quote_identifier(temp_table_name_) + " " + conflict_clause_);

    buffer_.str("");
    buffer_.clear();
    row_count_ = 0;
}

} // namespace Lexicode
