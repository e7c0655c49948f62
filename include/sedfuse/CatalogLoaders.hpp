// CatalogLoaders.hpp
#pragma once
#include "sedfuse/CatalogTable.hpp"
#include <functional>
#include <string>

namespace sedfuse {

using CatalogLoader = std::function<CatalogTable(const std::string&)>;

// JSON: {"columns": {name: [..]}}, an array of row objects, or one object
// of scalars (single-row response).
CatalogTable load_json_table (const std::string& path);

// First binary-table extension of a FITS file (scalar columns only).
CatalogTable load_fits_table (const std::string& path);

// IRSA / IPAC fixed-width ASCII table (.tbl).
CatalogTable load_ipac_table (const std::string& path);
CatalogTable parse_ipac_table(const std::string& content);

// main entry point ----------------------------------------------------------
// format: "json", "fits", "ipac" or "auto" (by file extension)
CatalogTable load_catalog_table(const std::string& path,
                                const std::string& format = "auto");

} // namespace sedfuse
