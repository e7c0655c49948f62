#include "sedfuse/CatalogTable.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace sedfuse {

CatalogTable& CatalogTable::add_column(std::string name, std::vector<Cell> cells)
{
    rows_ = std::max(rows_, cells.size());
    if (auto it = columns_.find(name); it != columns_.end()) {
        it->second = std::move(cells);
        return *this;
    }
    order_.push_back(name);
    columns_.emplace(std::move(name), std::move(cells));
    return *this;
}

bool CatalogTable::has_column(const std::string& name) const
{
    return columns_.find(name) != columns_.end();
}

const Cell* CatalogTable::cell(const std::string& column, std::size_t row) const
{
    auto it = columns_.find(column);
    if (it == columns_.end() || row >= it->second.size()) return nullptr;
    return &it->second[row];
}

std::optional<double> CatalogTable::number(const std::string& column, std::size_t row) const
{
    const Cell* c = cell(column, row);
    if (!c) return std::nullopt;

    if (const auto* d = std::get_if<double>(c)) return *d;

    if (const auto* s = std::get_if<std::string>(c)) {
        const char* begin = s->c_str();
        char*       end   = nullptr;
        const double v = std::strtod(begin, &end);
        if (end == begin) return std::nullopt;
        while (*end && std::isspace(static_cast<unsigned char>(*end))) ++end;
        if (*end) return std::nullopt;
        return v;
    }
    return std::nullopt;
}

std::optional<std::string> CatalogTable::text(const std::string& column, std::size_t row) const
{
    const Cell* c = cell(column, row);
    if (!c) return std::nullopt;

    if (const auto* s = std::get_if<std::string>(c)) return *s;
    if (const auto* d = std::get_if<double>(c)) {
        char buf[32];
        std::snprintf(buf, sizeof buf, "%.17g", *d);
        return std::string(buf);
    }
    return std::nullopt;
}

} // namespace sedfuse
