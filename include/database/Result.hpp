#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

struct sqlite3_stmt;

namespace re::database {

// One column value copied out of a stepped statement.
class Field {
public:
    Field() = default;
    explicit Field(sqlite3_stmt* stmt, int col);

    [[nodiscard]] bool is_null() const { return null_; }

    template <typename T>
    [[nodiscard]] T as() const {
        if constexpr (std::is_same_v<T, std::string>) {
            if (null_) throw std::runtime_error("Cannot convert NULL field to string");
            return text_;
        } else if constexpr (std::is_same_v<T, bool>) {
            if (null_) throw std::runtime_error("Cannot convert NULL field to bool");
            return integer_ != 0;
        } else if constexpr (std::is_integral_v<T>) {
            if (null_) throw std::runtime_error("Cannot convert NULL field to integer");
            return static_cast<T>(integer_);
        } else {
            static_assert(sizeof(T) == 0, "Unsupported Field conversion");
        }
    }

private:
    bool null_{true};
    int64_t integer_{0};
    std::string text_;
};

class Row {
public:
    Row(std::shared_ptr<const std::vector<std::string>> names, std::vector<Field> fields);

    [[nodiscard]] const Field& at(std::string_view column) const;
    [[nodiscard]] const Field& operator[](size_t idx) const { return fields_.at(idx); }
    [[nodiscard]] size_t size() const { return fields_.size(); }

private:
    std::shared_ptr<const std::vector<std::string>> names_;
    std::vector<Field> fields_;
};

class Result {
public:
    Result() = default;
    Result(std::vector<Row> rows, uint64_t affectedRows) : rows_(std::move(rows)), affected_rows_(affectedRows) {}

    [[nodiscard]] bool empty() const { return rows_.empty(); }
    [[nodiscard]] size_t size() const { return rows_.size(); }
    [[nodiscard]] uint64_t affected_rows() const { return affected_rows_; }

    [[nodiscard]] auto begin() const { return rows_.begin(); }
    [[nodiscard]] auto end() const { return rows_.end(); }

    // Throws unless exactly one row came back.
    [[nodiscard]] const Row& one_row() const;
    [[nodiscard]] const Field& one_field() const;

private:
    std::vector<Row> rows_;
    uint64_t affected_rows_{0};
};

}
