#include "sedfuse/Measurement.hpp"
#include <utility>

namespace sedfuse {

const char* to_string(DataSource s)
{
    switch (s) {
        case DataSource::NED:     return "NED";
        case DataSource::WISE:    return "WISE";
        case DataSource::TwoMASS: return "2MASS";
        case DataSource::GALEX:   return "GALEX";
    }
    return "?";
}

Measurement::Measurement(const SourceContext& ctx,
                         std::size_t          position_in_source,
                         DataSource           source,
                         Real                 frequency,
                         Real                 flux_density,
                         SkyPosition          position,
                         Real                 offset_from_reference,
                         Real                 reddening,
                         Real                 extinction_factor,
                         char                 flag)
    : ctx_(ctx)
    , position_in_source_(position_in_source)
    , source_(source)
    , frequency_(frequency)
    , flux_(flux_density)
    , position_(position)
    , offset_(offset_from_reference)
    , reddening_(reddening)
    , extinction_(extinction_factor)
    , flag_(flag)
{}

} // namespace sedfuse
