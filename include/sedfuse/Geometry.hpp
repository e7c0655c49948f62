#pragma once
#include "Types.hpp"
#include <cmath>

namespace sedfuse {

// Equatorial position in decimal degrees (lat = RA, lon = Dec, the way the
// catalogs label them). Unset coordinates are NaN.
struct SkyPosition {
    Real lat = kNaN;
    Real lon = kNaN;

    bool finite() const { return std::isfinite(lat) && std::isfinite(lon); }
};

/*  Flat-sky separation in arcseconds:  hypot(Δlat, Δlon) · 3600.
 *  No cos(dec) factor; NaN when either position is unset.             */
Real angular_offset_arcsec(const SkyPosition& a, const SkyPosition& b);

/*  Inclusive tolerance test with a tiny slack so that a detection placed
 *  exactly on the tolerance radius survives the degree→arcsec round trip. */
bool within_tolerance(Real offset_arcsec, Real tolerance_arcsec);

} // namespace sedfuse
