#include "sedfuse/Source.hpp"
#include "sedfuse/Extinction.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace sedfuse {

namespace {

Real parse_real(const FieldMap& fields, const char* key)
{
    auto it = fields.find(key);
    if (it == fields.end()) return kNaN;
    const char* begin = it->second.c_str();
    char* end = nullptr;
    const double v = std::strtod(begin, &end);
    if (end == begin) return kNaN;
    while (*end && std::isspace(static_cast<unsigned char>(*end))) ++end;
    return *end ? kNaN : v;
}

std::string lookup(const FieldMap& fields, const char* key)
{
    auto it = fields.find(key);
    return it == fields.end() ? std::string() : it->second;
}

} // unnamed namespace

Source::Source(std::size_t index,
               std::string ned_name,
               std::string alt_id,
               SkyPosition input,
               Real        z,
               ExtraFields extra)
    : index_(index)
    , ned_name_(std::move(ned_name))
    , alt_id_(std::move(alt_id))
    , input_(input)
    , z_((std::isfinite(z) && z >= 0.0) ? z : kNaN)
    , extra_(std::move(extra))
{
    if      (!ned_name_.empty()) identity_ = ned_name_;
    else if (!alt_id_.empty())   identity_ = alt_id_;
    else                         identity_ = coordinate_name();
    if (identity_.empty())       identity_ = "source" + std::to_string(index_);
}

Source Source::from_fields(std::size_t index,
                           const FieldMap& fields,
                           const std::vector<std::string>& extra_names)
{
    ExtraFields extra;
    for (const auto& name : extra_names)
        extra[name] = lookup(fields, name.c_str());

    return Source(index,
                  lookup(fields, field::kName),
                  lookup(fields, field::kAltId),
                  SkyPosition{parse_real(fields, field::kRa),
                              parse_real(fields, field::kDec)},
                  parse_real(fields, field::kZ),
                  std::move(extra));
}

std::string Source::output_name() const
{
    std::string out;
    out.reserve(identity_.size());
    for (char c : identity_)
        if (!std::isspace(static_cast<unsigned char>(c))) out.push_back(c);
    return out;
}

std::string Source::coordinate_name() const
{
    if (!input_.finite()) return {};
    char buf[64];
    std::snprintf(buf, sizeof buf, "%.5f%+.5f", input_.lat, input_.lon);
    return buf;
}

SkyPosition Source::search_position() const
{
    return ned_.finite() ? ned_ : input_;
}

void Source::set_ned_position(const SkyPosition& p)
{
    ned_ = p;
    offset_from_input_ = angular_offset_arcsec(ned_, input_);
}

SourceContext Source::context() const
{
    return SourceContext{index_, output_name(), z_, offset_from_input_, extra_};
}

bool Source::append(const Detection& d)
{
    if (!std::isfinite(d.frequency) || d.frequency <= 0.0) return false;
    if (!std::isfinite(d.flux)      || d.flux      <= 0.0) return false;

    const Real offset = (d.source == DataSource::NED)
                      ? 0.0
                      : angular_offset_arcsec(d.position, search_position());
    const Real ebv    = std::isfinite(d.reddening) ? d.reddening : ebv_;

    points_.emplace_back(context(),
                         points_.size() + 1,
                         d.source,
                         d.frequency,
                         d.flux,
                         d.position,
                         offset,
                         ebv,
                         extinction_factor(ebv, d.frequency),
                         d.averaged ? kAveragedFlag : kDefaultFlag);
    return true;
}

} // namespace sedfuse
