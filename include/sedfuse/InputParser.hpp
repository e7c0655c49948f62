#pragma once
#include <ankerl/unordered_dense.h>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace sedfuse {

// field name → raw text, only for fields that matched non-empty
using FieldMap = ankerl::unordered_dense::map<std::string, std::string>;

// Names the parser and the Source understand without configuration.
namespace field {
inline constexpr const char* kRa    = "ra";
inline constexpr const char* kDec   = "dec";
inline constexpr const char* kName  = "name";
inline constexpr const char* kAltId = "alt_id";
inline constexpr const char* kZ     = "z";
} // namespace field

/*
 *  Field grammar of one input line:  ordered names plus per-field regex
 *  overrides.  Fields without an override get a default pattern chosen by
 *  name (signed decimal for positions, decimal with exponent for redshift,
 *  non-greedy wildcard otherwise).
 */
struct InputGrammar {
    std::vector<std::string>                                  fields;
    ankerl::unordered_dense::map<std::string, std::string>    patterns;

    static InputGrammar defaults();          // ra dec name z RM RM_err
    std::string pattern_for(const std::string& name) const;

    // names in `fields` that are not one of the core names above
    std::vector<std::string> extra_fields() const;
};

class InputParser {
public:
    // Throws ConfigError for duplicate names, bad regexes and patterns that
    // refuse the empty string.
    explicit InputParser(InputGrammar grammar);

    // nullopt for blank, comment (#) and malformed lines
    std::optional<FieldMap> parse(const std::string& line) const;

    const InputGrammar& grammar() const { return grammar_; }

private:
    InputGrammar grammar_;
    std::regex   line_re_;
    std::vector<std::size_t> group_index_;   // capture group of each field
};

} // namespace sedfuse
