#include "sedfuse/ResponseProvider.hpp"
#include "sedfuse/CatalogLoaders.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace sedfuse {

const char* to_string(CatalogKind k)
{
    switch (k) {
        case CatalogKind::NedPosition: return "ned_position";
        case CatalogKind::DustMap:     return "dust_map";
        case CatalogKind::NedSed:      return "ned_sed";
        case CatalogKind::WISE:        return "wise";
        case CatalogKind::TwoMASS:     return "twomass";
        case CatalogKind::GALEX:       return "galex";
    }
    return "unknown";
}

static std::string file_key(const std::string& id)
{
    std::string k = id;
    std::replace_if(k.begin(), k.end(),
                    [](unsigned char c) { return std::isspace(c) || c == '/'; }, '_');
    return k;
}

DirectoryResponseProvider::DirectoryResponseProvider(std::string root) : root_(std::move(root)) {}

std::vector<std::string> DirectoryResponseProvider::lookup_keys(const Source& source)
{
    std::vector<std::string> keys;
    for (const auto& id : {source.ned_name(), source.alt_id(), source.coordinate_name()}) {
        if (id.empty()) continue;
        const std::string k = file_key(id);
        if (std::find(keys.begin(), keys.end(), k) == keys.end()) keys.push_back(k);
    }
    return keys;
}

std::optional<CatalogTable> DirectoryResponseProvider::load_key(CatalogKind kind,
                                                                const std::string& key) const
{
    static const char* kExtensions[] = {".json", ".fits", ".tbl"};

    const fs::path dir = fs::path(root_) / to_string(kind);
    std::error_code ec;
    for (const char* ext : kExtensions) {
        const fs::path p = dir / (key + ext);
        if (fs::exists(p, ec)) return load_catalog_table(p.string());
    }
    return std::nullopt;
}

std::optional<CatalogTable> DirectoryResponseProvider::fetch(CatalogKind kind,
                                                             const Source& source) const
{
    for (const auto& key : lookup_keys(source))
        if (auto t = load_key(kind, key)) return t;
    return std::nullopt;
}

std::optional<CatalogTable> DirectoryResponseProvider::fetch_by_id(CatalogKind kind,
                                                                   const std::string& id) const
{
    if (id.empty()) return std::nullopt;
    return load_key(kind, file_key(id));
}

} // namespace sedfuse
