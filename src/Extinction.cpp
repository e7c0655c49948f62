#include "sedfuse/Extinction.hpp"
#include <cmath>
#include <cstddef>

namespace sedfuse {

namespace {
constexpr Real kSpeedOfLightMicron = 2.99792458e14;   // µm s⁻¹

// Horner evaluation, c[0] + c[1] y + … + c[N-1] y^(N-1)
template <std::size_t N>
Real poly(const Real (&c)[N], Real y)
{
    Real r = 0.0;
    for (std::size_t i = N; i-- > 0;) r = r * y + c[i];
    return r;
}
} // unnamed namespace

Real inverse_micron(Real frequency_hz)
{
    return frequency_hz / kSpeedOfLightMicron;
}

CcmCoefficients ccm89_coefficients(Real x)
{
    if (!(x >= 0.3 && x <= 8.0)) return {0.0, 0.0};

    /* infrared ----------------------------------------------------------- */
    if (x < 1.1) {
        const Real p = std::pow(x, 1.61);
        return {0.574 * p, -0.527 * p};
    }

    /* optical / near-IR -------------------------------------------------- */
    if (x < 3.3) {
        static const Real ca[] = {1.0,  0.17699, -0.50447, -0.02427,
                                  0.72085, 0.01979, -0.77530, 0.32999};
        static const Real cb[] = {0.0,  1.41338,  2.28305,  1.07233,
                                  -5.38434, -0.62251, 5.30260, -2.09002};
        const Real y = x - 1.82;
        return {poly(ca, y), poly(cb, y)};
    }

    /* ultraviolet (far-UV curvature above 5.9 µm⁻¹) ---------------------- */
    Real fa = 0.0, fb = 0.0;
    if (x >= 5.9) {
        const Real d = x - 5.9;
        fa = -0.04473 * d * d - 0.009779 * d * d * d;
        fb =  0.2130  * d * d + 0.1207   * d * d * d;
    }
    const Real a =  1.752 - 0.316 * x - 0.104 / ((x - 4.67) * (x - 4.67) + 0.341) + fa;
    const Real b = -3.090 + 1.825 * x + 1.206 / ((x - 4.62) * (x - 4.62) + 0.263) + fb;
    return {a, b};
}

Real extinction_factor(Real ebv, Real frequency_hz, Real r_v)
{
    if (!std::isfinite(ebv) || ebv <= 0.0 || !std::isfinite(1.0 / ebv))
        return 1.0;
    if (!std::isfinite(frequency_hz)) return 1.0;

    const auto   ab     = ccm89_coefficients(inverse_micron(frequency_hz));
    const Real   a_lam  = ebv * (ab.a + ab.b / r_v);
    return std::pow(10.0, 0.4 * a_lam);
}

} // namespace sedfuse
