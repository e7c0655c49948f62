#pragma once
#include "CatalogTable.hpp"
#include "Source.hpp"
#include <optional>
#include <string>
#include <vector>

namespace sedfuse {

enum class CatalogKind { NedPosition, DustMap, NedSed, WISE, TwoMASS, GALEX };

const char* to_string(CatalogKind k);          // directory name, e.g. "ned_sed"

/*
 *  Seam to whatever fetched the catalog data.  nullopt means "nothing was
 *  retrieved"; a response that exists but cannot be read throws.
 */
class ResponseProvider {
public:
    virtual ~ResponseProvider() = default;
    virtual std::optional<CatalogTable> fetch(CatalogKind kind, const Source& source) const = 0;

    // Lookup by one given identifier only; used to retry a name lookup that
    // returned nothing usable with the alternate id.
    virtual std::optional<CatalogTable> fetch_by_id(CatalogKind, const std::string&) const
    {
        return std::nullopt;
    }
};

/*
 *  Pre-fetched responses on disk:
 *
 *      <root>/<catalog>/<key>.json | .fits | .tbl
 *
 *  key = NED name, then alternate id, then coordinate name, each with blanks
 *  replaced by '_'.  The first existing file wins.
 */
class DirectoryResponseProvider : public ResponseProvider {
public:
    explicit DirectoryResponseProvider(std::string root);

    std::optional<CatalogTable> fetch(CatalogKind kind, const Source& source) const override;
    std::optional<CatalogTable> fetch_by_id(CatalogKind kind, const std::string& id) const override;

    static std::vector<std::string> lookup_keys(const Source& source);

private:
    std::optional<CatalogTable> load_key(CatalogKind kind, const std::string& key) const;

    std::string root_;
};

} // namespace sedfuse
