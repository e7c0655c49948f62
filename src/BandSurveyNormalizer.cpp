#include "sedfuse/BandSurveyNormalizer.hpp"
#include <cmath>

namespace sedfuse {

/* --------------------------------------------------------------------- */
/*                   survey presets                                      */
/* --------------------------------------------------------------------- */
SurveyConfig wise_survey(Real tol)
{
    SurveyConfig c;
    c.label  = "WISE";
    c.source = DataSource::WISE;
    c.bands  = {{"w1mpro", 8.856e13, 306.682},
                {"w2mpro", 6.445e13, 170.663},
                {"w3mpro", 2.675e13,  29.045},
                {"w4mpro", 1.346e13,   8.284}};
    c.tolerance_arcsec = tol;
    return c;
}

SurveyConfig twomass_survey(Real tol)
{
    SurveyConfig c;
    c.label  = "2MASS";
    c.source = DataSource::TwoMASS;
    c.bands  = {{"j_m", 2.429e14, 1594.0},
                {"h_m", 1.805e14, 1024.0},
                {"k_m", 1.390e14,  667.0}};
    c.tolerance_arcsec = tol;
    return c;
}

SurveyConfig twomass_inline_survey(Real tol)
{
    SurveyConfig c = twomass_survey(tol);
    c.label = "2MASS (WISE row)";
    for (auto& b : c.bands) b.column += "_2mass";
    return c;
}

SurveyConfig galex_survey(Real tol)
{
    SurveyConfig c;
    c.label   = "GALEX";
    c.source  = DataSource::GALEX;
    c.bands   = {{"fuv_flux", 1.962e15},     // 1528 Å
                 {"nuv_flux", 1.320e15}};    // 2271 Å
    c.unit    = FluxUnit::MicroJansky;
    c.combine = CombineMode::Average;
    c.tolerance_arcsec = tol;
    c.reddening_column = "e_bv";
    return c;
}

bool carries_bands(const CatalogTable& table, const SurveyConfig& cfg)
{
    if (cfg.bands.empty() || table.empty()) return false;
    for (std::size_t r = 0; r < table.rows(); ++r) {
        bool complete = true;
        for (const auto& b : cfg.bands)
            if (!table.number(b.column, r)) { complete = false; break; }
        if (complete) return true;
    }
    return false;
}

Real magnitude_to_jansky(const BandSpec& band, Real magnitude)
{
    if (!std::isfinite(magnitude) || magnitude >= band.no_data_magnitude) return kNaN;
    return band.zero_point * std::pow(10.0, -0.4 * magnitude);
}

/* --------------------------------------------------------------------- */
BandSurveyNormalizer::BandSurveyNormalizer(SurveyConfig cfg) : cfg_(std::move(cfg)) {}

SkyPosition BandSurveyNormalizer::row_position(const CatalogTable& table, std::size_t row) const
{
    return {table.number(cfg_.ra_column,  row).value_or(kNaN),
            table.number(cfg_.dec_column, row).value_or(kNaN)};
}

Real BandSurveyNormalizer::band_flux(const BandSpec& band,
                                     const CatalogTable& table,
                                     std::size_t row) const
{
    const auto v = table.number(band.column, row);
    if (!v) return kNaN;
    return (cfg_.unit == FluxUnit::Magnitude) ? magnitude_to_jansky(band, *v)
                                              : *v / 1e6;          // µJy → Jy
}

NormalizeResult BandSurveyNormalizer::normalize(Source& source, const CatalogTable& table) const
{
    if (table.empty()) return NormalizeResult::failure("empty response");
    if (!source.search_position().finite())
        return NormalizeResult::failure("no reference position to match against");
    if (!table.has_column(cfg_.ra_column) || !table.has_column(cfg_.dec_column))
        return NormalizeResult::failure("no position columns");

    return cfg_.combine == CombineMode::Average ? averaged(source, table)
                                                : per_row(source, table);
}

/* ---------------------------------------------------------------------
 *  one measurement per band and matching row
 * --------------------------------------------------------------------- */
NormalizeResult BandSurveyNormalizer::per_row(Source& source, const CatalogTable& table) const
{
    const SkyPosition ref = source.search_position();

    // closest row inside the tolerance; the first one wins a tie
    std::size_t best        = table.rows();
    Real        best_offset = kNaN;
    for (std::size_t r = 0; r < table.rows(); ++r) {
        const Real off = angular_offset_arcsec(row_position(table, r), ref);
        if (!within_tolerance(off, cfg_.tolerance_arcsec)) continue;
        if (best == table.rows() || off < best_offset) {
            best        = r;
            best_offset = off;
        }
    }
    if (best == table.rows()) return NormalizeResult::failure("no row within tolerance");

    const SkyPosition pos = row_position(table, best);
    std::size_t added = 0;
    for (const auto& band : cfg_.bands) {
        Detection d;
        d.source    = cfg_.source;
        d.frequency = band.frequency;
        d.flux      = band_flux(band, table, best);
        d.position  = pos;
        if (source.append(d)) ++added;
    }

    if (added == 0) return NormalizeResult::failure("no band survived matching");
    return NormalizeResult::success(added);
}

/* ---------------------------------------------------------------------
 *  per band: mean position, flux and reddening of the usable detections
 * --------------------------------------------------------------------- */
NormalizeResult BandSurveyNormalizer::averaged(Source& source, const CatalogTable& table) const
{
    const SkyPosition ref       = source.search_position();
    const bool        multiple  = table.rows() > 1;
    std::size_t       added     = 0;
    std::string       missing;

    for (const auto& band : cfg_.bands) {
        Real sum_lat = 0.0, sum_lon = 0.0, sum_flux = 0.0, sum_ebv = 0.0;
        std::size_t n = 0;

        for (std::size_t r = 0; r < table.rows(); ++r) {
            const SkyPosition pos = row_position(table, r);
            if (!within_tolerance(angular_offset_arcsec(pos, ref), cfg_.tolerance_arcsec))
                continue;

            const Real flux = band_flux(band, table, r);
            if (!std::isfinite(flux) || flux <= 0.0) continue;

            const Real ebv = cfg_.reddening_column.empty()
                           ? source.reddening()
                           : table.number(cfg_.reddening_column, r).value_or(kNaN);
            if (!std::isfinite(ebv) || ebv <= 0.0) continue;

            sum_lat  += pos.lat;
            sum_lon  += pos.lon;
            sum_flux += flux;
            sum_ebv  += ebv;
            ++n;
        }

        if (n == 0) {
            missing += missing.empty() ? band.column : ", " + band.column;
            continue;
        }

        Detection d;
        d.source    = cfg_.source;
        d.frequency = band.frequency;
        d.flux      = sum_flux / n;
        d.position  = {sum_lat / n, sum_lon / n};
        d.reddening = sum_ebv / n;
        d.averaged  = multiple;
        if (source.append(d)) ++added;
    }

    if (added == 0) return NormalizeResult::failure("no usable detection");
    NormalizeResult res = NormalizeResult::success(added);
    if (!missing.empty()) res.reason = "no usable detection in " + missing;
    return res;
}

} // namespace sedfuse
