#pragma once
#include "Measurement.hpp"
#include <string>
#include <vector>

namespace sedfuse {

/*
 *  printf-style line template with named fields, e.g.
 *
 *      "%(index)d %(name)s %(freq).3e %(flux).3e %(source)s"
 *
 *  Supported conversions: d i (integers), e E f g G (reals), s (any), c.
 *  Caller-defined input fields are text and only take %s.  All checks run
 *  in the constructor; a template that constructs renders every
 *  Measurement.
 */
class OutputTemplate {
public:
    OutputTemplate(std::string text, const std::vector<std::string>& extra_fields);

    static const std::string& default_text();

    // Names of the built-in fields.
    static const std::vector<std::string>& builtin_fields();

    std::string render(const Measurement& m) const;

    const std::string& text() const { return text_; }

private:
    enum class Kind { Integer, Real, Text, Char };

    struct Segment {
        std::string literal;        // emitted before the field
        std::string field;          // empty for a trailing literal
        std::string spec;           // flags / width / precision
        char        conversion = 0;
        Kind        kind       = Kind::Text;
        int         id         = -1;    // built-in field id, -1 for extra fields
    };

    std::string           text_;
    std::vector<Segment>  segments_;
};

} // namespace sedfuse
