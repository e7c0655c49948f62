#pragma once
#include "CatalogNormalizer.hpp"
#include <string>
#include <vector>

namespace sedfuse {

enum class FluxUnit    { Magnitude, MicroJansky };
enum class CombineMode { PerRow, Average };

struct BandSpec {
    std::string column;                   // magnitude or flux column
    Real        frequency;                // Hz
    Real        zero_point        = 0.0;  // Jy at magnitude 0 (Magnitude unit only)
    Real        no_data_magnitude = 99.0; // catalog sentinel, rejected when reached
};

/*
 *  Everything that differs between the photometric surveys.  PerRow emits
 *  one measurement per band from the closest matching row; Average merges all matching
 *  detections of a band into one measurement.
 */
struct SurveyConfig {
    std::string           label;
    DataSource            source           = DataSource::WISE;
    std::vector<BandSpec> bands;
    FluxUnit              unit             = FluxUnit::Magnitude;
    CombineMode           combine          = CombineMode::PerRow;
    Real                  tolerance_arcsec = 10.0;
    std::string           ra_column        = "ra";
    std::string           dec_column       = "dec";
    std::string           reddening_column;        // Average mode only
};

SurveyConfig wise_survey          (Real tolerance_arcsec = 10.0);
SurveyConfig twomass_survey       (Real tolerance_arcsec = 10.0);
SurveyConfig twomass_inline_survey(Real tolerance_arcsec = 10.0);   // *_2mass columns of a WISE row
SurveyConfig galex_survey         (Real tolerance_arcsec = 10.0);

// true when some row of `table` holds a value in every band column of `cfg`
bool carries_bands(const CatalogTable& table, const SurveyConfig& cfg);

// flux density [Jy] of a magnitude in a band; NaN for the sentinel
Real magnitude_to_jansky(const BandSpec& band, Real magnitude);

class BandSurveyNormalizer : public CatalogNormalizer {
public:
    explicit BandSurveyNormalizer(SurveyConfig cfg);

    const std::string&  label()  const override { return cfg_.label; }
    const SurveyConfig& config() const { return cfg_; }

    NormalizeResult normalize(Source& source, const CatalogTable& table) const override;

private:
    NormalizeResult per_row (Source& source, const CatalogTable& table) const;
    NormalizeResult averaged(Source& source, const CatalogTable& table) const;

    SkyPosition row_position(const CatalogTable& table, std::size_t row) const;
    Real        band_flux   (const BandSpec& band, const CatalogTable& table, std::size_t row) const;

    SurveyConfig cfg_;
};

} // namespace sedfuse
