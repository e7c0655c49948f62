#include <limits>

#include <catch.hpp>

#include "sedfuse/Cosmology.hpp"

using namespace sedfuse; // NOLINT

TEST_CASE("Zero or unusable redshift gives zero distance", "[cosmology]") {
    Cosmology cosmology;
    CHECK(cosmology.luminosity_distance_mpc(0.0) == 0.0);
    CHECK(cosmology.luminosity_distance_mpc(-0.1) == 0.0);
    CHECK(cosmology.luminosity_distance_m(std::numeric_limits<double>::quiet_NaN()) == 0.0);

    CHECK(cosmology.luminosity(1.0, 1.0, 0.0) == 0.0);
}

TEST_CASE("Luminosity distance of the default flat cosmology", "[cosmology]") {
    Cosmology cosmology;

    CHECK(cosmology.params().omega_k() == Approx(0.0).margin(1e-12));
    CHECK(cosmology.expansion_rate(0.0) == Approx(1.0));

    CHECK(cosmology.comoving_distance_mpc(0.1) == Approx(413.48982).epsilon(1e-6));
    CHECK(cosmology.luminosity_distance_mpc(0.1) == Approx(454.83881).epsilon(1e-6));
    CHECK(cosmology.luminosity_distance_mpc(1.0) == Approx(6634.8264).epsilon(1e-6));
    CHECK(cosmology.luminosity_distance_m(0.1) == Approx(454.83881 * 3.086e22).epsilon(1e-6));
}

TEST_CASE("Integration steps only change the result marginally", "[cosmology]") {
    CosmologyParams coarse;
    coarse.steps = 100;
    CHECK(Cosmology(coarse).luminosity_distance_mpc(0.5) ==
          Approx(Cosmology().luminosity_distance_mpc(0.5)).epsilon(1e-4));
}

TEST_CASE("Rest-frame luminosity and frequency", "[cosmology]") {
    Cosmology cosmology;
    const double z = 0.158;

    // 1 mJy, no extinction
    CHECK(cosmology.luminosity(1e-3, 1.0, z) == Approx(5.766191602924177e+22).epsilon(1e-6));
    CHECK(cosmology.luminosity(1e-3, 2.0, z) == Approx(2 * 5.766191602924177e+22).epsilon(1e-6));

    CHECK(Cosmology::rest_frequency(1e14, z) == Approx(1.158e14));
    CHECK(Cosmology::rest_frequency(1e14, std::numeric_limits<double>::quiet_NaN()) == 1e14);
}
