#pragma once
#include "RunConfig.hpp"
#include "ResponseProvider.hpp"
#include "NedNormalizers.hpp"
#include "BandSurveyNormalizer.hpp"
#include "InputParser.hpp"
#include "Source.hpp"
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace sedfuse {

using LogLines = std::vector<std::string>;

/*
 *  Runs every catalog of one Source in the fixed order
 *
 *      NED position → dust map → NED SED → WISE → 2MASS → GALEX
 *
 *  A failing catalog only adds a log line; the Source always comes out with
 *  whatever was collected.
 */
class SourcePipeline {
public:
    SourcePipeline(const RunConfig& cfg, const ResponseProvider& provider);

    // Never throws for catalog problems; returns the log lines of this Source.
    LogLines process(Source& source) const;

private:
    std::optional<CatalogTable> fetch(CatalogKind kind, const Source& source,
                                      const std::string& label, LogLines& log) const;
    std::optional<CatalogTable> fetch_alternate(CatalogKind kind, const Source& source,
                                                const std::string& label, LogLines& log) const;
    // true when the normalizer succeeded
    bool apply(const CatalogNormalizer& n, Source& source,
               const CatalogTable& table, LogLines& log) const;

    const ResponseProvider& provider_;
    NedPositionNormalizer   position_;
    DustMapNormalizer       dust_;
    NedSedNormalizer        sed_;
    BandSurveyNormalizer    wise_;
    BandSurveyNormalizer    twomass_;
    BandSurveyNormalizer    twomass_inline_;
    BandSurveyNormalizer    galex_;
};

/* --------------------------------------------------------------------- */
/*                    batch input                                         */
/* --------------------------------------------------------------------- */

// Parse every line; unparsable lines are logged and skipped.  Sources are
// numbered 1.. in input order and get unique output names.
std::vector<Source> read_sources(std::istream& in, const InputParser& parser, LogLines& log);

} // namespace sedfuse
