#include "sedfuse/Geometry.hpp"

namespace sedfuse {

namespace {
constexpr Real kArcsecPerDegree = 3600.0;
constexpr Real kToleranceSlack  = 1e-9;     // arcsec
}

Real angular_offset_arcsec(const SkyPosition& a, const SkyPosition& b)
{
    if (!a.finite() || !b.finite()) return kNaN;
    return std::hypot(a.lat - b.lat, a.lon - b.lon) * kArcsecPerDegree;
}

bool within_tolerance(Real offset_arcsec, Real tolerance_arcsec)
{
    return std::isfinite(offset_arcsec) &&
           offset_arcsec <= tolerance_arcsec + kToleranceSlack;
}

} // namespace sedfuse
