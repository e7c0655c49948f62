#include "sedfuse/NedNormalizers.hpp"
#include "sedfuse/Errors.hpp"
#include <cmath>

namespace sedfuse {

namespace {

/* NED VOTable column names ------------------------------------------------ */
const std::string kPosRa        = "pos_ra_equ_J2000_d";
const std::string kPosDec       = "pos_dec_equ_J2000_d";
const std::string kFrequency    = "Frequency";
const std::string kFlux         = "NED Photometry Measurement";
const std::string kPassband     = "Observed Passband";
const std::string kRefcode      = "Refcode";
const std::string kFreqMode     = "Frequency Mode";
const std::string kSpatialMode  = "Spatial Mode";
const std::string kQualifiers   = "Qualifiers";
const std::string kComments     = "Comments";

// literature line entries, model values, count-rate derived fluxes
const char* kEntryDenylist[] = {R"(\bline\b)", "model", "count statistics"};

std::regex icase(const std::string& pattern)
{
    try {
        return std::regex(pattern, std::regex::ECMAScript | std::regex::icase);
    } catch (const std::regex_error& e) {
        throw ConfigError("NED filter: invalid pattern '" + pattern + "': " + e.what());
    }
}

bool any_match(const std::vector<std::regex>& res, const std::string& s)
{
    for (const auto& re : res)
        if (std::regex_search(s, re)) return true;
    return false;
}


} // unnamed namespace

/* ===================================================================== */
/*                      N E D   p o s i t i o n                          */
/* ===================================================================== */
const std::string& NedPositionNormalizer::label() const
{
    static const std::string l = "NED position";
    return l;
}

NormalizeResult NedPositionNormalizer::normalize(Source& source, const CatalogTable& table) const
{
    if (table.empty()) return NormalizeResult::failure("empty response");

    const auto ra  = table.number(kPosRa);
    const auto dec = table.number(kPosDec);
    if (!ra || !dec)
        return NormalizeResult::failure("no J2000 position columns");
    if (!std::isfinite(*ra) || !std::isfinite(*dec))
        return NormalizeResult::failure("position is not finite");

    source.set_ned_position({*ra, *dec});
    return NormalizeResult::success(0);
}

/* ===================================================================== */
/*                        D u s t   m a p                                */
/* ===================================================================== */
DustMapNormalizer::DustMapNormalizer(std::vector<std::string> columns)
    : columns_(std::move(columns))
{}

std::vector<std::string> DustMapNormalizer::default_columns()
{
    return {"ext SandF mean", "E_B_V_SandF", "ebv"};
}

const std::string& DustMapNormalizer::label() const
{
    static const std::string l = "dust map";
    return l;
}

NormalizeResult DustMapNormalizer::normalize(Source& source, const CatalogTable& table) const
{
    if (table.empty()) return NormalizeResult::failure("empty response");

    for (const auto& col : columns_) {
        if (!table.has_column(col)) continue;
        const auto ebv = table.number(col);
        if (!ebv || !std::isfinite(*ebv) || *ebv <= 0.0)
            return NormalizeResult::failure("no usable E(B-V) in '" + col + "'");
        source.set_reddening(*ebv);
        return NormalizeResult::success(0);
    }
    return NormalizeResult::failure("no E(B-V) column");
}

/* ===================================================================== */
/*                        N E D   S E D                                  */
/* ===================================================================== */
NedSedNormalizer::NedSedNormalizer(NedSedFilter filter)
    : filter_(std::move(filter))
{
    for (const char* p : kEntryDenylist)          entry_res_.push_back(icase(p));
    for (const auto& p : filter_.passband_denylist) passband_res_.push_back(icase(p));
}

const std::string& NedSedNormalizer::label() const
{
    static const std::string l = "NED SED";
    return l;
}

/*  Passbands from low-quality instruments/apertures are dropped, except SDSS
 *  magnitudes that are not the PSF flavour.                                */
bool NedSedNormalizer::passband_rejected(const std::string& passband) const
{
    if (!any_match(passband_res_, passband)) return false;

    static const std::regex sdss(R"(\(SDSS)", std::regex::icase);
    static const std::regex psf (R"(PSF)",    std::regex::icase);
    const bool sdss_exempt = std::regex_search(passband, sdss) &&
                             !std::regex_search(passband, psf);
    return !sdss_exempt;
}

bool NedSedNormalizer::is_reliable(const NedSedRow& row) const
{
    const std::string* free_text[] = {&row.passband, &row.refcode, &row.frequency_mode,
                                      &row.spatial_mode, &row.qualifiers, &row.comments};
    for (const auto* f : free_text) {
        if (any_match(entry_res_, *f)) return false;
        for (const auto& bad : filter_.refcode_denylist)
            if (!bad.empty() && f->find(bad) != std::string::npos) return false;
    }

    return !passband_rejected(row.passband);
}

NormalizeResult NedSedNormalizer::normalize(Source& source, const CatalogTable& table) const
{
    if (table.empty()) return NormalizeResult::failure("empty response");
    if (!table.has_column(kFrequency) || !table.has_column(kFlux))
        return NormalizeResult::failure("no frequency/flux columns");

    const SkyPosition where = source.ned_position().finite() ? source.ned_position()
                                                             : source.search_position();
    auto text = [&](const std::string& col, std::size_t r) {
        return table.text(col, r).value_or(std::string());
    };

    std::size_t added = 0;
    for (std::size_t r = 0; r < table.rows(); ++r) {
        const NedSedRow row{text(kPassband, r),  text(kRefcode, r),
                            text(kFreqMode, r),  text(kSpatialMode, r),
                            text(kQualifiers, r), text(kComments, r)};
        if (!is_reliable(row)) continue;

        const auto nu   = table.number(kFrequency, r);
        const auto flux = table.number(kFlux, r);
        if (!nu || !flux) continue;

        Detection d;
        d.source    = DataSource::NED;
        d.frequency = *nu;
        d.flux      = *flux;
        d.position  = where;
        if (source.append(d)) ++added;
    }

    if (added == 0) return NormalizeResult::failure("no rows survived filtering");
    return NormalizeResult::success(added);
}

} // namespace sedfuse
