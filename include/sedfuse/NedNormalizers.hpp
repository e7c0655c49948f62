#pragma once
#include "CatalogNormalizer.hpp"
#include <regex>
#include <string>
#include <vector>

namespace sedfuse {

/* --------------------------------------------------------------------- */
/*                 NED object search:  reference position                */
/* --------------------------------------------------------------------- */
class NedPositionNormalizer : public CatalogNormalizer {
public:
    const std::string& label() const override;
    NormalizeResult normalize(Source& source, const CatalogTable& table) const override;
};

/* --------------------------------------------------------------------- */
/*                 IRSA dust map:  line-of-sight E(B−V)                  */
/* --------------------------------------------------------------------- */
class DustMapNormalizer : public CatalogNormalizer {
public:
    // first column present wins
    explicit DustMapNormalizer(std::vector<std::string> columns = default_columns());

    static std::vector<std::string> default_columns();

    const std::string& label() const override;
    NormalizeResult normalize(Source& source, const CatalogTable& table) const override;

private:
    std::vector<std::string> columns_;
};

/* --------------------------------------------------------------------- */
/*                 NED photometry:  quality filter + SED rows            */
/* --------------------------------------------------------------------- */
struct NedSedFilter {
    std::vector<std::string> refcode_denylist  = {"2006AJ....131.1163S"};
    std::vector<std::string> passband_denylist = {"HST", "PSF", "Petrosian", "Kron",
                                                  "isophotal", "aperture", "fiber"};
};

// The text columns of one NED photometry row the filter looks at.
struct NedSedRow {
    std::string passband;
    std::string refcode;
    std::string frequency_mode;
    std::string spatial_mode;
    std::string qualifiers;
    std::string comments;
};

class NedSedNormalizer : public CatalogNormalizer {
public:
    explicit NedSedNormalizer(NedSedFilter filter = {});

    const std::string& label() const override;
    NormalizeResult normalize(Source& source, const CatalogTable& table) const override;

    bool is_reliable(const NedSedRow& row) const;

private:
    bool passband_rejected(const std::string& passband) const;

    NedSedFilter            filter_;
    std::vector<std::regex> entry_res_;      // on every free-text field
    std::vector<std::regex> passband_res_;
};

} // namespace sedfuse
