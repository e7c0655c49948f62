#pragma once
#include "Types.hpp"
#include "Geometry.hpp"
#include "Measurement.hpp"
#include "InputParser.hpp"
#include <string>
#include <vector>

namespace sedfuse {

/*
 *  One extragalactic object and the SED collected for it.
 *
 *  Identity priority:  NED name  >  alternate id  >  "<ra>%+<dec>" built from
 *  the input position rounded to 1e-5 deg.  The batch may override it
 *  (rename()) to keep identities unique.
 */
class Source {
public:
    Source(std::size_t  index,
           std::string  ned_name,
           std::string  alt_id,
           SkyPosition  input,
           Real         z,
           ExtraFields  extra = {});

    // Build from parser output; unparsable numbers become NaN, a negative
    // redshift is treated as unset.
    static Source from_fields(std::size_t index,
                              const FieldMap& fields,
                              const std::vector<std::string>& extra_names);

    /* ---------------- identity ------------------------------------- */
    std::size_t        index()           const { return index_; }
    const std::string& identity()        const { return identity_; }
    std::string        output_name()     const;       // identity without blanks
    const std::string& ned_name()        const { return ned_name_; }
    const std::string& alt_id()          const { return alt_id_; }
    std::string        coordinate_name() const;       // empty if no input position
    bool               has_catalog_name() const { return !ned_name_.empty() || !alt_id_.empty(); }
    void               rename(std::string identity) { identity_ = std::move(identity); }

    /* ---------------- positions ------------------------------------ */
    const SkyPosition& input_position()    const { return input_; }
    const SkyPosition& ned_position()      const { return ned_; }
    SkyPosition        search_position()   const;
    Real               offset_from_input() const { return offset_from_input_; }
    void               set_ned_position(const SkyPosition& p);

    /* ---------------- physical values ------------------------------ */
    Real               redshift()  const { return z_; }
    Real               reddening() const { return ebv_; }
    void               set_reddening(Real ebv) { ebv_ = ebv; }
    const ExtraFields& extra()     const { return extra_; }

    /* ---------------- measurements --------------------------------- */
    // Appends unless frequency or flux is not positive finite.  Returns
    // whether the detection was kept.
    bool append(const Detection& d);
    const std::vector<Measurement>& measurements() const { return points_; }

    SourceContext context() const;

private:
    std::size_t              index_;
    std::string              ned_name_;
    std::string              alt_id_;
    std::string              identity_;
    SkyPosition              input_;
    SkyPosition              ned_;
    Real                     offset_from_input_ = kNaN;
    Real                     z_;
    Real                     ebv_ = kNaN;
    ExtraFields              extra_;
    std::vector<Measurement> points_;
};

} // namespace sedfuse
