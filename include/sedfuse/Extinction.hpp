#pragma once
#include "Types.hpp"

namespace sedfuse {

inline constexpr Real kDefaultRv = 3.1;

// a(x), b(x) of the Cardelli, Clayton & Mathis (1989) law
struct CcmCoefficients {
    Real a;
    Real b;
};

/*  x in µm⁻¹.  Zero outside the tabulated 0.3 … 8 µm⁻¹ range.  */
CcmCoefficients ccm89_coefficients(Real x);

/*  ν [Hz]  →  x [µm⁻¹]  */
Real inverse_micron(Real frequency_hz);

/*  Multiplicative de-reddening factor 10^(0.4·A_λ) for a colour excess
 *  E(B−V) at frequency ν.  Returns exactly 1 for a zero, negative or
 *  non-finite E(B−V).                                                   */
Real extinction_factor(Real ebv, Real frequency_hz, Real r_v = kDefaultRv);

} // namespace sedfuse
