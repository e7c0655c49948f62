#include "sedfuse/Cosmology.hpp"
#include <boost/math/constants/constants.hpp>
#include <cmath>

namespace sedfuse {

namespace {
constexpr Real kJansky = 1e-26;   // W m⁻² Hz⁻¹

bool usable_redshift(Real z) { return std::isfinite(z) && z > 0.0; }
} // unnamed namespace

Cosmology::Cosmology(CosmologyParams p) : p_(p)
{
    if (p_.steps < 1) p_.steps = 1;
}

Real Cosmology::expansion_rate(Real z) const
{
    const Real zp1 = 1.0 + z;
    return std::sqrt(p_.omega_m * zp1 * zp1 * zp1 +
                     p_.omega_k() * zp1 * zp1 +
                     p_.omega_lambda);
}

/* ------------------------------------------------------------------ *
 *  D_C = c/H0 ∫₀ᶻ dz'/E(z'),  trapezoidal rule on a uniform grid    *
 * ------------------------------------------------------------------ */
Real Cosmology::comoving_distance_mpc(Real z) const
{
    if (!usable_redshift(z)) return 0.0;

    const int    n  = p_.steps;
    const Real   dz = z / n;
    const Vector zs = Vector::LinSpaced(n + 1, 0.0, z);
    const Vector inv_e = zs.unaryExpr([this](Real zz) { return 1.0 / expansion_rate(zz); });

    const Real integral = dz * (inv_e.sum() - 0.5 * (inv_e[0] + inv_e[n]));
    return (p_.c / 1000.0) / p_.h0 * integral;
}

Real Cosmology::luminosity_distance_mpc(Real z) const
{
    if (!usable_redshift(z)) return 0.0;
    // flat universe: transverse comoving distance equals D_C
    return (1.0 + z) * comoving_distance_mpc(z);
}

Real Cosmology::luminosity_distance_m(Real z) const
{
    return luminosity_distance_mpc(z) * p_.metres_per_mpc;
}

Real Cosmology::luminosity(Real flux_jy, Real extinction, Real z, Real d_l_m)
{
    if (!usable_redshift(z) || d_l_m <= 0.0) return 0.0;
    const Real pi = boost::math::constants::pi<Real>();
    return 4.0 * pi * d_l_m * d_l_m * flux_jy * extinction * kJansky / (1.0 + z);
}

Real Cosmology::luminosity(Real flux_jy, Real extinction, Real z) const
{
    return luminosity(flux_jy, extinction, z, luminosity_distance_m(z));
}

Real Cosmology::rest_frequency(Real observed_hz, Real z)
{
    return std::isfinite(z) ? (1.0 + z) * observed_hz : observed_hz;
}

} // namespace sedfuse
