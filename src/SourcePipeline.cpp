#include "sedfuse/SourcePipeline.hpp"
#include <istream>
#include <set>
#include <stdexcept>

namespace sedfuse {

namespace {
std::string message(const std::string& label, const Source& s, const std::string& what)
{
    return "[" + label + "] " + s.output_name() + ": " + what;
}
} // unnamed namespace

SourcePipeline::SourcePipeline(const RunConfig& cfg, const ResponseProvider& provider)
    : provider_(provider)
    , dust_(cfg.dust_columns)
    , sed_(cfg.ned_filter)
    , wise_(wise_survey(cfg.tolerance_arcsec))
    , twomass_(twomass_survey(cfg.tolerance_arcsec))
    , twomass_inline_(twomass_inline_survey(cfg.tolerance_arcsec))
    , galex_(galex_survey(cfg.tolerance_arcsec))
{}

std::optional<CatalogTable> SourcePipeline::fetch(CatalogKind kind, const Source& source,
                                                  const std::string& label, LogLines& log) const
{
    try {
        auto t = provider_.fetch(kind, source);
        if (!t) log.push_back(message(label, source, "no response"));
        return t;
    } catch (const std::exception& e) {
        log.push_back(message(label, source, std::string("cannot read response: ") + e.what()));
        return std::nullopt;
    }
}

std::optional<CatalogTable> SourcePipeline::fetch_alternate(CatalogKind kind, const Source& source,
                                                            const std::string& label,
                                                            LogLines& log) const
{
    log.push_back(message(label, source, "retrying with " + source.alt_id()));
    try {
        return provider_.fetch_by_id(kind, source.alt_id());
    } catch (const std::exception& e) {
        log.push_back(message(label, source, std::string("cannot read response: ") + e.what()));
        return std::nullopt;
    }
}

bool SourcePipeline::apply(const CatalogNormalizer& n, Source& source,
                           const CatalogTable& table, LogLines& log) const
{
    try {
        const NormalizeResult r = n.normalize(source, table);
        if (!r.reason.empty()) log.push_back(message(n.label(), source, r.reason));
        return r.ok;
    } catch (const std::exception& e) {
        log.push_back(message(n.label(), source, e.what()));
        return false;
    }
}

LogLines SourcePipeline::process(Source& source) const
{
    LogLines log;

    /* ---- 1. NED: reference position + photometry, by name ------------ */
    if (source.has_catalog_name()) {
        bool placed = false;
        if (auto t = fetch(CatalogKind::NedPosition, source, position_.label(), log))
            placed = apply(position_, source, *t, log);
        // the name resolved to nothing usable, the alternate id may still
        if (!placed && !source.ned_name().empty() && !source.alt_id().empty() &&
            source.alt_id() != source.ned_name()) {
            if (auto t = fetch_alternate(CatalogKind::NedPosition, source, position_.label(), log))
                apply(position_, source, *t, log);
        }
    } else {
        log.push_back(message(position_.label(), source, "no catalog name, NED skipped"));
    }

    /* ---- 2. dust map: needs a position -------------------------------- */
    if (source.search_position().finite()) {
        if (auto t = fetch(CatalogKind::DustMap, source, dust_.label(), log))
            apply(dust_, source, *t, log);
    }

    if (source.has_catalog_name()) {
        if (auto t = fetch(CatalogKind::NedSed, source, sed_.label(), log))
            apply(sed_, source, *t, log);
    }

    /* ---- 3. positional surveys ---------------------------------------- */
    if (!source.search_position().finite()) {
        log.push_back(message("surveys", source, "no usable position, surveys skipped"));
        return log;
    }

    bool twomass_done = false;
    if (auto t = fetch(CatalogKind::WISE, source, wise_.label(), log)) {
        apply(wise_, source, *t, log);
        if (carries_bands(*t, twomass_inline_.config())) {
            apply(twomass_inline_, source, *t, log);
            twomass_done = true;
        }
    }
    if (!twomass_done) {
        if (auto t = fetch(CatalogKind::TwoMASS, source, twomass_.label(), log))
            apply(twomass_, source, *t, log);
    }

    if (auto t = fetch(CatalogKind::GALEX, source, galex_.label(), log))
        apply(galex_, source, *t, log);

    return log;
}

/* ===================================================================== */
std::vector<Source> read_sources(std::istream& in, const InputParser& parser, LogLines& log)
{
    const auto extra = parser.grammar().extra_fields();

    std::vector<Source>   sources;
    std::set<std::string> seen;
    std::string           line;
    std::size_t           lineno = 0;

    while (std::getline(in, line)) {
        ++lineno;
        if (!line.empty() && line.back() == '\r') line.pop_back();

        const auto first = line.find_first_not_of(" \t");
        if (first == std::string::npos || line[first] == '#') continue;

        auto fields = parser.parse(line);
        if (!fields) {
            log.push_back("[input] line " + std::to_string(lineno) + ": no match, skipped");
            continue;
        }

        // output names key the result files, so they must stay unique
        Source s = Source::from_fields(sources.size() + 1, *fields, extra);
        if (!seen.insert(s.output_name()).second) {
            const std::string base = s.identity() + "#" + std::to_string(s.index());
            s.rename(base);
            for (int k = 2; !seen.insert(s.output_name()).second; ++k)
                s.rename(base + "_" + std::to_string(k));
        }
        sources.push_back(std::move(s));
    }
    return sources;
}

} // namespace sedfuse
