#pragma once
#include "Types.hpp"
#include "Geometry.hpp"
#include <array>
#include <cstddef>
#include <map>
#include <string>

namespace sedfuse {

enum class DataSource { NED = 0, WISE = 1, TwoMASS = 2, GALEX = 3 };

inline constexpr std::size_t kDataSourceCount = 4;
inline constexpr std::array<DataSource, kDataSourceCount> kAllDataSources = {
    DataSource::NED, DataSource::WISE, DataSource::TwoMASS, DataSource::GALEX};

const char* to_string(DataSource s);

inline constexpr char kDefaultFlag  = 'a';
inline constexpr char kAveragedFlag = 'm';   // several raw detections merged

// Caller-defined input columns (rotation measure etc.), kept verbatim.
using ExtraFields = std::map<std::string, std::string>;

// Values a Measurement copies from its Source when it is created.
struct SourceContext {
    std::size_t  index = 0;
    std::string  name;                       // output name, no whitespace
    Real         z                 = kNaN;
    Real         offset_from_input = kNaN;   // arcsec
    ExtraFields  extra;
};

// What a normalizer hands over to Source::append().
struct Detection {
    DataSource  source    = DataSource::NED;
    Real        frequency = kNaN;    // Hz
    Real        flux      = kNaN;    // Jy
    SkyPosition position;
    Real        reddening = kNaN;    // NaN → Source reddening
    bool        averaged  = false;
};

/*
 *  One flux-density point of an SED.  Immutable once built; all Source-level
 *  values are copied in through the constructor.
 */
class Measurement {
public:
    Measurement(const SourceContext& ctx,
                std::size_t          position_in_source,
                DataSource           source,
                Real                 frequency,
                Real                 flux_density,
                SkyPosition          position,
                Real                 offset_from_reference,
                Real                 reddening,
                Real                 extinction_factor,
                char                 flag);

    std::size_t        sequence_index()        const { return ctx_.index; }
    std::size_t        position_in_source()    const { return position_in_source_; }
    const std::string& name()                  const { return ctx_.name; }
    Real               redshift()              const { return ctx_.z; }
    Real               offset_from_input()     const { return ctx_.offset_from_input; }
    const ExtraFields& extra()                 const { return ctx_.extra; }

    DataSource         data_source()           const { return source_; }
    Real               frequency()             const { return frequency_; }
    Real               flux_density()          const { return flux_; }
    const SkyPosition& position()              const { return position_; }
    Real               offset_from_reference() const { return offset_; }
    Real               reddening()             const { return reddening_; }
    Real               extinction_factor()     const { return extinction_; }
    char               flag()                  const { return flag_; }

private:
    SourceContext ctx_;
    std::size_t   position_in_source_;
    DataSource    source_;
    Real          frequency_;
    Real          flux_;
    SkyPosition   position_;
    Real          offset_;
    Real          reddening_;
    Real          extinction_;
    char          flag_;
};

} // namespace sedfuse
