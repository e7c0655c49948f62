#include "sedfuse/OutputTemplate.hpp"
#include "sedfuse/Errors.hpp"
#include <algorithm>
#include <cstdio>
#include <cstring>

namespace sedfuse {

namespace {

enum FieldId {
    kIndex, kName, kZ, kNum, kFreq, kFlux, kSource, kFlag,
    kLat, kLon, kOffsetNed, kExtinction, kEbv, kOffsetInput, kFieldCount
};

const char* kFieldNames[kFieldCount] = {
    "index", "name", "z", "num", "freq", "flux", "source", "flag",
    "lat", "lon", "offset_from_ned", "extinction", "ebv", "offset_from_input"
};

bool is_integer_conv(char c) { return c == 'd' || c == 'i'; }
bool is_real_conv(char c)    { return std::strchr("eEfgG", c) != nullptr; }

template <typename T>
std::string format_one(const std::string& fmt, T value)
{
    const int n = std::snprintf(nullptr, 0, fmt.c_str(), value);
    if (n <= 0) return {};
    std::string out(static_cast<std::size_t>(n) + 1, '\0');
    std::snprintf(out.data(), out.size(), fmt.c_str(), value);
    out.resize(static_cast<std::size_t>(n));
    return out;
}

} // unnamed namespace

const std::string& OutputTemplate::default_text()
{
    static const std::string t =
        "%(index)d  %(name)s %(z).5f %(num)d   %(freq).3e %(flux).3e %(source)s  "
        "%(flag)c %(lat).5f %(lon).5f %(offset_from_ned).1f  %(extinction).3e";
    return t;
}

const std::vector<std::string>& OutputTemplate::builtin_fields()
{
    static const std::vector<std::string> f(std::begin(kFieldNames), std::end(kFieldNames));
    return f;
}

/* --------------------------------------------------------------------- */
/*  parse + validate                                                      */
/* --------------------------------------------------------------------- */
OutputTemplate::OutputTemplate(std::string text, const std::vector<std::string>& extra_fields)
    : text_(std::move(text))
{
    auto fail = [&](const std::string& why) {
        throw ConfigError("output template: " + why + " in \"" + text_ + "\"");
    };

    Segment cur;
    std::size_t i = 0;
    while (i < text_.size()) {
        const char ch = text_[i];
        if (ch != '%') { cur.literal.push_back(ch); ++i; continue; }

        if (i + 1 < text_.size() && text_[i + 1] == '%') {
            cur.literal.push_back('%');
            i += 2;
            continue;
        }
        if (i + 1 >= text_.size() || text_[i + 1] != '(')
            fail("expected '%(name)' at offset " + std::to_string(i));

        const std::size_t close = text_.find(')', i + 2);
        if (close == std::string::npos) fail("unterminated field name");
        cur.field = text_.substr(i + 2, close - i - 2);

        std::size_t j = close + 1;
        while (j < text_.size() && std::strchr("-+ #0123456789.", text_[j])) ++j;
        if (j >= text_.size()) fail("missing conversion for '" + cur.field + "'");
        cur.spec       = text_.substr(close + 1, j - close - 1);
        cur.conversion = text_[j];
        i = j + 1;

        /* ---- resolve the field and check the conversion fits ---------- */
        const auto* it = std::find(std::begin(kFieldNames), std::end(kFieldNames), cur.field);
        if (it != std::end(kFieldNames)) {
            cur.id = static_cast<int>(it - std::begin(kFieldNames));
            switch (cur.id) {
                case kIndex: case kNum:          cur.kind = Kind::Integer; break;
                case kName:  case kSource:       cur.kind = Kind::Text;    break;
                case kFlag:                      cur.kind = Kind::Char;    break;
                default:                         cur.kind = Kind::Real;    break;
            }
        } else if (std::find(extra_fields.begin(), extra_fields.end(), cur.field)
                   != extra_fields.end()) {
            cur.id   = -1;
            cur.kind = Kind::Text;
        } else {
            fail("unknown field '" + cur.field + "'");
        }

        const char c = cur.conversion;
        bool ok = false;
        switch (cur.kind) {
            case Kind::Integer: ok = is_integer_conv(c) || is_real_conv(c) || c == 's'; break;
            case Kind::Real:    ok = is_real_conv(c) || c == 's';                       break;
            case Kind::Text:    ok = c == 's';                                          break;
            case Kind::Char:    ok = c == 'c' || c == 's';                              break;
        }
        if (!ok)
            fail(std::string("conversion '%") + c + "' does not fit field '" + cur.field + "'");

        segments_.push_back(std::move(cur));
        cur = Segment{};
    }
    if (!cur.literal.empty()) segments_.push_back(std::move(cur));
}

/* --------------------------------------------------------------------- */
/*  render                                                                */
/* --------------------------------------------------------------------- */
std::string OutputTemplate::render(const Measurement& m) const
{
    std::string out;
    for (const auto& seg : segments_) {
        out += seg.literal;
        if (seg.field.empty()) continue;

        const std::string fmt = "%" + seg.spec;

        if (seg.id < 0) {
            auto it = m.extra().find(seg.field);
            const std::string v = (it == m.extra().end() || it->second.empty())
                                ? std::string("None") : it->second;
            out += format_one(fmt + 's', v.c_str());
            continue;
        }

        long        iv = 0;
        double      rv = 0.0;
        std::string sv;
        char        cv = 0;
        switch (seg.id) {
            case kIndex:       iv = static_cast<long>(m.sequence_index());     break;
            case kNum:         iv = static_cast<long>(m.position_in_source()); break;
            case kName:        sv = m.name();                                  break;
            case kSource:      sv = to_string(m.data_source());                break;
            case kFlag:        cv = m.flag();                                  break;
            case kZ:           rv = m.redshift();                              break;
            case kFreq:        rv = m.frequency();                             break;
            case kFlux:        rv = m.flux_density();                          break;
            case kLat:         rv = m.position().lat;                          break;
            case kLon:         rv = m.position().lon;                          break;
            case kOffsetNed:   rv = m.offset_from_reference();                 break;
            case kExtinction:  rv = m.extinction_factor();                     break;
            case kEbv:         rv = m.reddening();                             break;
            case kOffsetInput: rv = m.offset_from_input();                     break;
            default:                                                           break;
        }

        const char c = seg.conversion;
        switch (seg.kind) {
            case Kind::Integer:
                if (is_integer_conv(c))   out += format_one(fmt + "l" + c, iv);
                else if (is_real_conv(c)) out += format_one(fmt + c, static_cast<double>(iv));
                else                      out += format_one(fmt + 's', std::to_string(iv).c_str());
                break;
            case Kind::Real:
                if (c == 's') out += format_one(fmt + 's', format_one("%g", rv).c_str());
                else          out += format_one(fmt + c, rv);
                break;
            case Kind::Text:
                out += format_one(fmt + 's', sv.c_str());
                break;
            case Kind::Char:
                if (c == 'c') out += format_one(fmt + 'c', static_cast<int>(cv));
                else          out += format_one(fmt + 's', std::string(1, cv).c_str());
                break;
        }
    }
    return out;
}

} // namespace sedfuse
