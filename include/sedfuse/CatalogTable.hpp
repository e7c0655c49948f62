#pragma once
#include <ankerl/unordered_dense.h>
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sedfuse {

// A table cell: absent (null), numeric or free text.
using Cell = std::variant<std::monostate, double, std::string>;

/*
 *  Read-only view of one already-parsed catalog response.  Columns are
 *  addressed by name; a missing column, a row past the end and a null cell
 *  all come back as std::nullopt, never as 0.
 */
class CatalogTable {
public:
    CatalogTable() = default;

    // builder used by the loaders (and by tests)
    CatalogTable& add_column(std::string name, std::vector<Cell> cells);

    bool        has_column(const std::string& name) const;
    std::size_t rows()  const { return rows_; }
    bool        empty() const { return rows_ == 0; }
    const std::vector<std::string>& column_names() const { return order_; }

    // Text cells are converted when they hold a complete number.
    std::optional<double>      number(const std::string& column, std::size_t row = 0) const;
    std::optional<std::string> text  (const std::string& column, std::size_t row = 0) const;

private:
    const Cell* cell(const std::string& column, std::size_t row) const;

    ankerl::unordered_dense::map<std::string, std::vector<Cell>> columns_;
    std::vector<std::string> order_;
    std::size_t              rows_ = 0;
};

} // namespace sedfuse
