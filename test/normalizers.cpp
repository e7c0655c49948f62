#include <cmath>
#include <string>
#include <vector>

#include <catch.hpp>

#include "sedfuse/BandSurveyNormalizer.hpp"
#include "sedfuse/Errors.hpp"
#include "sedfuse/NedNormalizers.hpp"
#include "fixtures.hpp"

using namespace sedfuse; // NOLINT

namespace {

Cell Num(double v) { return Cell{v}; }
Cell Str(const std::string &s) { return Cell{s}; }

CatalogTable WiseRow(double ra, double dec, double w1, double w2, double w3, double w4) {
    CatalogTable t;
    t.add_column("ra", {Num(ra)})
     .add_column("dec", {Num(dec)})
     .add_column("w1mpro", {Num(w1)})
     .add_column("w2mpro", {Num(w2)})
     .add_column("w3mpro", {Num(w3)})
     .add_column("w4mpro", {Num(w4)});
    return t;
}

// One NED photometry row per passband, all 1 Jy at distinct frequencies.
CatalogTable NedSed(const std::vector<std::string> &passbands,
                    const std::vector<std::string> &refcodes = {}) {
    std::vector<Cell> band, ref, freq, flux;
    for (std::size_t i = 0; i < passbands.size(); ++i) {
        band.push_back(Str(passbands[i]));
        ref.push_back(Str(i < refcodes.size() ? refcodes[i] : "1999ApJ...999..999X"));
        freq.push_back(Num(1e14 * (i + 1)));
        flux.push_back(Num(1.0));
    }
    CatalogTable t;
    t.add_column("Observed Passband", band)
     .add_column("Refcode", ref)
     .add_column("Frequency", freq)
     .add_column("NED Photometry Measurement", flux);
    return t;
}

CatalogTable GalexRows(const std::vector<double> &dec_offsets_arcsec,
                       const std::vector<Cell> &fuv, const std::vector<Cell> &ebv) {
    std::vector<Cell> ra, dec;
    for (double d : dec_offsets_arcsec) {
        ra.push_back(Num(187.27792));
        dec.push_back(Num(2.05239 + Arcsec(d)));
    }
    CatalogTable t;
    t.add_column("ra", ra).add_column("dec", dec)
     .add_column("fuv_flux", fuv).add_column("e_bv", ebv);
    return t;
}

} // namespace

/* ---------------------------------------------------------------------- */

TEST_CASE("WISE magnitudes become Jansky", "[normalizers]") {
    Source s = QuasarSource();
    BandSurveyNormalizer wise(wise_survey());

    auto res = wise.normalize(s, WiseRow(187.27792, 2.05239, 15.0, 14.0, 11.0, 8.0));
    CHECK(res.ok);
    CHECK(res.added == 4);

    const auto &m = s.measurements();
    REQUIRE(m.size() == 4);
    CHECK(m[0].flux_density() == Approx(3.06682e-4));
    CHECK(m[0].frequency() == 8.856e13);
    CHECK(m[3].frequency() == 1.346e13);
    CHECK(m[0].data_source() == DataSource::WISE);
    CHECK(m[0].offset_from_reference() == Approx(0.0).margin(1e-9));
}

TEST_CASE("Sentinel magnitude drops only that band", "[normalizers]") {
    Source s = QuasarSource();
    BandSurveyNormalizer wise(wise_survey());

    auto res = wise.normalize(s, WiseRow(187.27792, 2.05239, 15.0, 99.0, 11.0, 100.0));
    CHECK(res.added == 2);
    CHECK(std::isnan(magnitude_to_jansky(wise_survey().bands[0], 99.0)));
}

TEST_CASE("Match tolerance is inclusive at 10 arcsec", "[normalizers]") {
    BandSurveyNormalizer wise(wise_survey());

    Source inside = QuasarSource();
    CHECK(wise.normalize(inside, WiseRow(187.27792, 2.05239 + Arcsec(10.0), 15, 14, 11, 8)).ok);
    CHECK(inside.measurements().size() == 4);
    CHECK(inside.measurements()[0].offset_from_reference() == Approx(10.0));

    Source outside = QuasarSource();
    auto res = wise.normalize(outside, WiseRow(187.27792, 2.05239 + Arcsec(10.0001), 15, 14, 11, 8));
    CHECK_FALSE(res.ok);
    CHECK(outside.measurements().empty());
}

TEST_CASE("Only the closest row within tolerance is used", "[normalizers]") {
    CatalogTable rows;
    rows.add_column("ra", {Num(187.27792), Num(187.27792)})
        .add_column("dec", {Num(2.05239 + Arcsec(8.0)), Num(2.05239)})
        .add_column("w1mpro", {Num(16.0), Num(15.0)})
        .add_column("w2mpro", {Num(16.0), Num(14.0)})
        .add_column("w3mpro", {Num(16.0), Num(11.0)})
        .add_column("w4mpro", {Num(16.0), Num(8.0)});

    Source s = QuasarSource();
    auto res = BandSurveyNormalizer(wise_survey()).normalize(s, rows);
    CHECK(res.ok);
    CHECK(res.added == 4);

    const auto &m = s.measurements();
    REQUIRE(m.size() == 4);
    CHECK(m[0].offset_from_reference() == Approx(0.0).margin(1e-9));
    CHECK(m[0].flux_density() == Approx(3.06682e-4));
}

TEST_CASE("Survey soft failures never throw", "[normalizers]") {
    BandSurveyNormalizer wise(wise_survey());
    Source s = QuasarSource();

    auto empty = wise.normalize(s, CatalogTable{});
    CHECK_FALSE(empty.ok);
    CHECK(empty.reason == "empty response");

    CatalogTable no_position;
    no_position.add_column("w1mpro", {Num(15.0)});
    CHECK(wise.normalize(s, no_position).reason == "no position columns");

    Source nowhere(1, "3C 273", "", SkyPosition{}, 0.158);
    CHECK_FALSE(wise.normalize(nowhere, WiseRow(1, 1, 15, 14, 11, 8)).ok);
}

TEST_CASE("2MASS magnitudes carried by the WISE row", "[normalizers]") {
    CatalogTable row = WiseRow(187.27792, 2.05239, 15, 14, 11, 8);
    CHECK_FALSE(carries_bands(row, twomass_inline_survey()));

    row.add_column("j_m_2mass", {Num(13.0)})
       .add_column("h_m_2mass", {Num(12.5)})
       .add_column("k_m_2mass", {Num(12.0)});
    REQUIRE(carries_bands(row, twomass_inline_survey()));

    Source s = QuasarSource();
    auto res = BandSurveyNormalizer(twomass_inline_survey()).normalize(s, row);
    CHECK(res.added == 3);
    CHECK(s.measurements()[0].data_source() == DataSource::TwoMASS);
    CHECK(s.measurements()[0].flux_density() == Approx(1594.0 * std::pow(10.0, -0.4 * 13.0)));

    SECTION("null cells do not count as carried") {
        CatalogTable nulls = WiseRow(187.27792, 2.05239, 15, 14, 11, 8);
        nulls.add_column("j_m_2mass", {Cell{}})
             .add_column("h_m_2mass", {Cell{}})
             .add_column("k_m_2mass", {Cell{}});
        CHECK_FALSE(carries_bands(nulls, twomass_inline_survey()));
    }
}

TEST_CASE("GALEX detections are averaged per band", "[normalizers]") {
    BandSurveyNormalizer galex(galex_survey());

    SECTION("two detections") {
        Source s = QuasarSource();
        auto res = galex.normalize(s, GalexRows({0.0, 2.0}, {Num(2.0), Num(4.0)}, {Num(0.1), Num(0.3)}));
        CHECK(res.ok);
        CHECK(res.reason.find("nuv_flux") != std::string::npos);

        REQUIRE(s.measurements().size() == 1);
        const auto &m = s.measurements()[0];
        CHECK(m.flux_density() == Approx(3.0e-6));
        CHECK(m.flag() == kAveragedFlag);
        CHECK(m.reddening() == Approx(0.2));
        CHECK(m.position().lon == Approx(2.05239 + Arcsec(1.0)));
        CHECK(m.frequency() == 1.962e15);
    }

    SECTION("one detection") {
        Source s = QuasarSource();
        galex.normalize(s, GalexRows({0.0}, {Num(2.0)}, {Num(0.1)}));
        REQUIRE(s.measurements().size() == 1);
        CHECK(s.measurements()[0].flag() == kDefaultFlag);
        CHECK(s.measurements()[0].flux_density() == Approx(2.0e-6));
    }

    SECTION("filtered detections still count as multiple") {
        Source s = QuasarSource();
        galex.normalize(s, GalexRows({0.0, 30.0, 1.0}, {Num(2.0), Num(50.0), Num(-1.0)},
                                     {Num(0.1), Num(0.1), Num(0.1)}));
        REQUIRE(s.measurements().size() == 1);
        CHECK(s.measurements()[0].flux_density() == Approx(2.0e-6));
        CHECK(s.measurements()[0].flag() == kAveragedFlag);
    }

    SECTION("no reddening, no measurement") {
        Source s = QuasarSource();
        auto res = galex.normalize(s, GalexRows({0.0}, {Num(2.0)}, {Cell{}}));
        CHECK_FALSE(res.ok);
        CHECK(s.measurements().empty());
    }
}

TEST_CASE("NED SED quality filter", "[normalizers]") {
    NedSedNormalizer sed;

    Source s = QuasarSource();
    auto res = sed.normalize(s, NedSed({"HST F606W", "r (SDSS r PSF)", "r (SDSS r)",
                                        "r (SDSS Petrosian)", "1.4 GHz (VLA)", "Ks (2MASS)"},
                                       {"", "", "", "", "", "2006AJ....131.1163S"}));
    CHECK(res.ok);
    REQUIRE(s.measurements().size() == 3);
    CHECK(s.measurements()[0].frequency() == 3e14);   // (SDSS r)
    CHECK(s.measurements()[1].frequency() == 4e14);   // (SDSS Petrosian)
    CHECK(s.measurements()[2].frequency() == 5e14);   // VLA
    CHECK(s.measurements()[0].data_source() == DataSource::NED);
    CHECK(s.measurements()[0].offset_from_reference() == 0.0);

    NedSedRow row{"V (Johnson)", "1999ApJ...999..999X", "", "", "", ""};
    CHECK(sed.is_reliable(row));
    row.comments = "From count statistics";
    CHECK_FALSE(sed.is_reliable(row));
    row.comments = "";
    row.qualifiers = "Model fit";
    CHECK_FALSE(sed.is_reliable(row));
    row.qualifiers = "";
    row.frequency_mode = "Line";
    CHECK_FALSE(sed.is_reliable(row));
    row.frequency_mode = "Broad-band measurement; Outline";
    CHECK(sed.is_reliable(row));
}

TEST_CASE("NED SED with nothing left is a soft failure", "[normalizers]") {
    Source s = QuasarSource();
    auto res = NedSedNormalizer().normalize(s, NedSed({"HST F814W"}));
    CHECK_FALSE(res.ok);
    CHECK(res.reason == "no rows survived filtering");

    CHECK_THROWS_AS((NedSedNormalizer(NedSedFilter{{}, {"("}})), ConfigError);
}

TEST_CASE("NED position and dust map", "[normalizers]") {
    Source s = QuasarSource(187.27792, 2.05239);

    CatalogTable pos;
    pos.add_column("pos_ra_equ_J2000_d", {Str("187.27792")})
       .add_column("pos_dec_equ_J2000_d", {Num(2.05239 + Arcsec(2.0))});
    CHECK(NedPositionNormalizer().normalize(s, pos).ok);
    CHECK(s.ned_position().finite());
    CHECK(s.offset_from_input() == Approx(2.0));

    CHECK_FALSE(NedPositionNormalizer().normalize(s, CatalogTable{}).ok);

    CatalogTable dust;
    dust.add_column("E_B_V_SandF", {Num(0.0206)});
    CHECK(DustMapNormalizer().normalize(s, dust).ok);
    CHECK(s.reddening() == Approx(0.0206));

    CatalogTable bad_dust;
    bad_dust.add_column("ebv", {Num(-1.0)});
    CHECK_FALSE(DustMapNormalizer().normalize(s, bad_dust).ok);
    CHECK(s.reddening() == Approx(0.0206));
}
