#include "database/Result.hpp"

#include <sqlite3.h>

namespace re::database {

Field::Field(sqlite3_stmt* stmt, const int col) {
    switch (sqlite3_column_type(stmt, col)) {
        case SQLITE_NULL:
            null_ = true;
            break;
        case SQLITE_INTEGER:
            null_ = false;
            integer_ = sqlite3_column_int64(stmt, col);
            text_ = std::to_string(integer_);
            break;
        default: {
            null_ = false;
            const auto* txt = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
            text_.assign(txt ? txt : "", static_cast<size_t>(sqlite3_column_bytes(stmt, col)));
            integer_ = sqlite3_column_int64(stmt, col);
            break;
        }
    }
}

Row::Row(std::shared_ptr<const std::vector<std::string>> names, std::vector<Field> fields)
    : names_(std::move(names)), fields_(std::move(fields)) {}

const Field& Row::at(const std::string_view column) const {
    for (size_t i = 0; i < names_->size(); ++i)
        if ((*names_)[i] == column) return fields_.at(i);
    throw std::out_of_range("No column named '" + std::string(column) + "' in row");
}

const Row& Result::one_row() const {
    if (rows_.size() != 1)
        throw std::runtime_error("Expected exactly one row, got " + std::to_string(rows_.size()));
    return rows_.front();
}

const Field& Result::one_field() const {
    const auto& row = one_row();
    if (row.size() != 1)
        throw std::runtime_error("Expected exactly one field, got " + std::to_string(row.size()));
    return row[0];
}

}
