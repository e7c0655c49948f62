#include "sedfuse/CatalogLoaders.hpp"
#include <CCfits/CCfits>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace fs = std::filesystem;

namespace sedfuse {
namespace {

Cell cell_from_json(const nlohmann::json& v)
{
    if (v.is_null())    return std::monostate{};
    if (v.is_number())  return v.get<double>();
    if (v.is_boolean()) return v.get<bool>() ? 1.0 : 0.0;
    if (v.is_string())  return v.get<std::string>();
    return v.dump();
}

std::string trim(const std::string& s)
{
    auto b = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto e = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return (b < e) ? std::string(b, e) : std::string();
}

// ----------------------------------------------------------------------------
//  split one IPAC header line at its '|' separators
// ----------------------------------------------------------------------------
std::vector<std::string> split_bars(const std::string& line,
                                    const std::vector<std::size_t>& bars)
{
    std::vector<std::string> out;
    for (std::size_t i = 0; i + 1 < bars.size(); ++i) {
        const std::size_t lo = bars[i] + 1;
        const std::size_t hi = bars[i + 1];
        out.push_back(lo < line.size() ? trim(line.substr(lo, hi - lo)) : std::string());
    }
    return out;
}

bool is_text_type(const std::string& t)
{
    return !t.empty() && (t[0] == 'c' || t[0] == 'C');     // char, c
}

} // unnamed namespace
// ============================================================================
//  Public loader implementations
// ============================================================================

CatalogTable load_json_table(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw std::runtime_error("Cannot open '" + path + "'");

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("'" + path + "': " + e.what());
    }

    CatalogTable table;

    /* -------- 1. column form ------------------------------------------- */
    if (j.is_object() && j.contains("columns") && j["columns"].is_object()) {
        for (const auto& [name, values] : j["columns"].items()) {
            std::vector<Cell> cells;
            if (values.is_array())
                for (const auto& v : values) cells.push_back(cell_from_json(v));
            else
                cells.push_back(cell_from_json(values));
            table.add_column(name, std::move(cells));
        }
        return table;
    }

    /* -------- 2. array of rows ----------------------------------------- */
    if (j.is_array()) {
        std::vector<std::string>                                names;
        std::unordered_map<std::string, std::vector<Cell>>      cols;
        for (std::size_t r = 0; r < j.size(); ++r) {
            if (!j[r].is_object())
                throw std::runtime_error("'" + path + "': row " +
                                         std::to_string(r) + " is not an object");
            for (const auto& [name, v] : j[r].items()) {
                auto [it, fresh] = cols.try_emplace(name);
                if (fresh) names.push_back(name);
                it->second.resize(r, std::monostate{});   // pad rows lacking the key
                it->second.push_back(cell_from_json(v));
            }
        }
        for (const auto& n : names) {
            auto& cells = cols[n];
            cells.resize(j.size(), std::monostate{});
            table.add_column(n, std::move(cells));
        }
        return table;
    }

    /* -------- 3. single-row object ------------------------------------- */
    if (j.is_object()) {
        for (const auto& [name, v] : j.items())
            table.add_column(name, {cell_from_json(v)});
        return table;
    }

    throw std::runtime_error("'" + path + "': unsupported JSON table layout");
}

// ----------------------------------------------------------------------------
CatalogTable load_fits_table(const std::string& path)
{
    CatalogTable table;
    try {
        CCfits::FITS f(path, CCfits::Read);
        CCfits::ExtHDU& ext = f.extension(1);
        const long nrows = ext.rows();

        for (const auto& [name, col] : ext.column()) {
            if (col->repeat() != 1 && col->type() != CCfits::Tstring)
                continue;                               // vector column – not a catalog value

            std::vector<Cell> cells;
            cells.reserve(static_cast<std::size_t>(std::max(nrows, 0L)));
            if (nrows > 0) {
                if (col->type() == CCfits::Tstring) {
                    std::vector<std::string> buf;
                    col->read(buf, 1, nrows);
                    for (auto& s : buf) cells.emplace_back(trim(s));
                } else {
                    std::vector<double> buf;
                    col->read(buf, 1, nrows);
                    for (double v : buf)
                        cells.push_back(std::isnan(v) ? Cell{} : Cell{v});
                }
            }
            table.add_column(name, std::move(cells));
        }
    } catch (const CCfits::FitsException& e) {
        // CCfits exceptions do not derive from std::exception
        throw std::runtime_error("'" + path + "': " + e.message());
    }
    return table;
}

// ----------------------------------------------------------------------------
CatalogTable parse_ipac_table(const std::string& content)
{
    std::istringstream in(content);
    std::string line;

    std::vector<std::size_t>               bars;
    std::vector<std::vector<std::string>>  header;     // names, types, units, nulls
    std::vector<std::vector<Cell>>         cols;

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '\\') continue;          // keywords / comments

        if (line[0] == '|') {
            if (header.empty()) {
                for (std::size_t i = 0; i < line.size(); ++i)
                    if (line[i] == '|') bars.push_back(i);
                if (bars.size() < 2)
                    throw std::runtime_error("IPAC table: malformed header");
            }
            header.push_back(split_bars(line, bars));
            continue;
        }

        if (header.empty()) continue;                           // data before header
        if (cols.empty()) cols.resize(header[0].size());

        for (std::size_t c = 0; c < cols.size(); ++c) {
            const std::size_t lo = bars[c] + 1;
            const std::size_t hi = bars[c + 1];
            const std::string raw = lo < line.size() ? trim(line.substr(lo, hi - lo + 1)) : "";

            const std::string null_tok = header.size() > 3 ? header[3][c] : "null";
            if (raw.empty() || raw == null_tok || raw == "null") {
                cols[c].emplace_back();
                continue;
            }
            const bool text = header.size() > 1 && is_text_type(header[1][c]);
            if (!text) {
                char* end = nullptr;
                const double v = std::strtod(raw.c_str(), &end);
                if (end != raw.c_str() && *end == '\0') {
                    cols[c].emplace_back(v);
                    continue;
                }
            }
            cols[c].emplace_back(raw);
        }
    }

    CatalogTable table;
    if (header.empty()) return table;
    for (std::size_t c = 0; c < header[0].size(); ++c)
        table.add_column(header[0][c],
                         c < cols.size() ? std::move(cols[c]) : std::vector<Cell>{});
    return table;
}

CatalogTable load_ipac_table(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw std::runtime_error("Cannot open '" + path + "'");
    std::ostringstream ss;
    ss << in.rdbuf();
    return parse_ipac_table(ss.str());
}

// ----------------------------------------------------------------------------
// Dispatcher / auto-detection
// ----------------------------------------------------------------------------
static const std::unordered_map<std::string, CatalogLoader> kLoaderMap = {
    {"json", load_json_table},
    {"fits", load_fits_table},
    {"ipac", load_ipac_table}
};

static const std::unordered_map<std::string, std::string> kExtensionMap = {
    {".json", "json"},
    {".fits", "fits"},
    {".fit",  "fits"},
    {".tbl",  "ipac"}
};

CatalogTable load_catalog_table(const std::string& path, const std::string& format)
{
    std::string fmt = format;
    if (fmt == "auto") {
        std::string ext = fs::path(path).extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        auto e = kExtensionMap.find(ext);
        if (e == kExtensionMap.end())
            throw std::runtime_error("load_catalog_table(auto): unknown extension '" +
                                     ext + "' for '" + path + "'");
        fmt = e->second;
    }

    auto it = kLoaderMap.find(fmt);
    if (it == kLoaderMap.end())
        throw std::runtime_error("Unsupported catalog format: " + fmt);

    return it->second(path);
}

} // namespace sedfuse
