#pragma once
#include "Types.hpp"

namespace sedfuse {

// Flat ΛCDM defaults of the luminosity plots.
struct CosmologyParams {
    Real omega_m      = 0.27;
    Real omega_lambda = 0.73;
    Real h0           = 71.0;        // km s⁻¹ Mpc⁻¹
    Real c            = 2.99793e8;   // m s⁻¹
    Real metres_per_mpc = 3.086e22;
    int  steps        = 10000;       // trapezoid panels over [0, z]

    Real omega_k() const { return 1.0 - omega_m - omega_lambda; }
};

class Cosmology {
public:
    explicit Cosmology(CosmologyParams p = {});

    const CosmologyParams& params() const { return p_; }

    // E(z) = H(z)/H0
    Real expansion_rate(Real z) const;

    // All distances are 0 for z == 0 and for an unusable (NaN, negative) z.
    Real comoving_distance_mpc(Real z) const;
    Real luminosity_distance_mpc(Real z) const;
    Real luminosity_distance_m(Real z) const;

    // Rest-frame spectral luminosity [W Hz⁻¹] from an observed flux density
    // [Jy] and a de-reddening factor, given a precomputed d_L [m].
    static Real luminosity(Real flux_jy, Real extinction, Real z, Real d_l_m);
    Real        luminosity(Real flux_jy, Real extinction, Real z) const;

    static Real rest_frequency(Real observed_hz, Real z);

private:
    CosmologyParams p_;
};

} // namespace sedfuse
