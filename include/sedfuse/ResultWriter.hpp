#pragma once
#include "Types.hpp"
#include "Source.hpp"
#include "Cosmology.hpp"
#include "OutputTemplate.hpp"
#include <array>
#include <optional>
#include <string>
#include <vector>

namespace sedfuse {

/* --------------------------------------------------------------------- */
/*                    rest-frame luminosity table                        */
/* --------------------------------------------------------------------- */
struct PlotRow {
    Real                                  rest_frequency;  // Hz
    std::array<Real, kDataSourceCount>    luminosity{};    // W Hz⁻¹, one column set
};
using PlotTable = std::vector<PlotRow>;

// One line per Measurement, in append order.
std::vector<std::string> render_lines(const Source& source, const OutputTemplate& tmpl);

PlotTable make_plot_table(const Source& source, const Cosmology& cosmology);

// "<output name>.dat" with anything outside [A-Za-z0-9+-._#] mapped to '_'
std::string plot_file_name(const Source& source);

// "rest_frequency NED WISE 2MASS GALEX" header + one row per entry
void write_plot_table(const std::string& path, const PlotTable& table);

/* --------------------------------------------------------------------- */
/*                    UV power law  log L = m log ν + b                  */
/* --------------------------------------------------------------------- */
inline constexpr Real kUvLowerCutoff = 1e15;   // Hz
inline constexpr Real kUvUpperCutoff = 1e17;

struct PowerLawFit {
    Real        slope;
    Real        intercept;
    std::size_t npoints;
};

// Least-squares fit over rows strictly inside (lo, hi) with L > 0; needs two
// distinct frequencies.
std::optional<PowerLawFit> fit_uv_power_law(const PlotTable& table,
                                            Real lo = kUvLowerCutoff,
                                            Real hi = kUvUpperCutoff);

/* --------------------------------------------------------------------- */
/*                    gnuplot helper                                      */
/* --------------------------------------------------------------------- */
class GnuplotRenderer {
public:
    explicit GnuplotRenderer(std::string executable = "gnuplot");

    // Writes <dat>.gp next to the table and runs gnuplot on it (PostScript
    // output <dat>.ps).  Returns the exit status, 0 on success.
    int render(const std::string& dat_path,
               const std::string& title,
               const std::optional<PowerLawFit>& fit) const;

    std::string script(const std::string& dat_path,
                       const std::string& out_path,
                       const std::string& title,
                       const std::optional<PowerLawFit>& fit) const;

private:
    std::string exe_;
};

} // namespace sedfuse
