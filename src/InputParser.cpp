#include "sedfuse/InputParser.hpp"
#include "sedfuse/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <set>

namespace sedfuse {

namespace {

const char* kSignedDecimal  = R"([+-]?(?:\d+\.?\d*|\.\d+)?)";
const char* kScientific     = R"([+-]?(?:\d+\.?\d*|\.\d+)?(?:[eE][+-]?\d+)?)";
const char* kWildcard       = R"(.*?)";

bool is_core(const std::string& name)
{
    return name == field::kRa || name == field::kDec || name == field::kName ||
           name == field::kAltId || name == field::kZ;
}

} // unnamed namespace

InputGrammar InputGrammar::defaults()
{
    InputGrammar g;
    g.fields = {field::kRa, field::kDec, field::kName, field::kZ, "RM", "RM_err"};
    return g;
}

std::string InputGrammar::pattern_for(const std::string& name) const
{
    if (auto it = patterns.find(name); it != patterns.end())
        return it->second;
    if (name == field::kRa || name == field::kDec) return kSignedDecimal;
    if (name == field::kZ)                         return kScientific;
    return kWildcard;
}

std::vector<std::string> InputGrammar::extra_fields() const
{
    std::vector<std::string> out;
    for (const auto& f : fields)
        if (!is_core(f)) out.push_back(f);
    return out;
}

InputParser::InputParser(InputGrammar grammar)
    : grammar_(std::move(grammar))
{
    if (grammar_.fields.empty())
        throw ConfigError("input grammar: no fields configured");

    std::set<std::string> seen;
    std::string full = R"(^\s*)";
    std::size_t group = 1;
    for (std::size_t i = 0; i < grammar_.fields.size(); ++i) {
        const auto& name = grammar_.fields[i];
        if (!seen.insert(name).second)
            throw ConfigError("input grammar: duplicate field '" + name + "'");

        const std::string pat = grammar_.pattern_for(name);
        try {
            const std::regex single("^(?:" + pat + ")$");
            if (!std::regex_match(std::string(), single))
                throw ConfigError("input grammar: pattern for '" + name +
                                  "' must accept the empty string");
            group_index_.push_back(group);
            group += 1 + single.mark_count();
        } catch (const std::regex_error& e) {
            throw ConfigError("input grammar: invalid pattern for '" + name +
                              "': " + e.what());
        }

        if (i) full += R"(\s+)";
        full += R"(["']?()" + pat + R"()["']?)";
    }
    full += R"(\s*$)";
    line_re_ = std::regex(full);
}

std::optional<FieldMap> InputParser::parse(const std::string& line) const
{
    auto first = std::find_if_not(line.begin(), line.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    if (first == line.end() || *first == '#') return std::nullopt;

    std::smatch m;
    if (!std::regex_match(line, m, line_re_)) return std::nullopt;

    FieldMap out;
    for (std::size_t i = 0; i < grammar_.fields.size(); ++i) {
        const std::string value = m[group_index_[i]].str();
        if (!value.empty()) out.emplace(grammar_.fields[i], value);
    }
    return out;
}

} // namespace sedfuse
