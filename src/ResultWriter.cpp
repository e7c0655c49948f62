#include "sedfuse/ResultWriter.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace sedfuse {

std::vector<std::string> render_lines(const Source& source, const OutputTemplate& tmpl)
{
    std::vector<std::string> out;
    out.reserve(source.measurements().size());
    for (const auto& m : source.measurements())
        out.push_back(tmpl.render(m));
    return out;
}

PlotTable make_plot_table(const Source& source, const Cosmology& cosmology)
{
    const Real z   = source.redshift();
    const Real d_l = cosmology.luminosity_distance_m(z);      // once per Source

    PlotTable table;
    table.reserve(source.measurements().size());
    for (const auto& m : source.measurements()) {
        PlotRow row;
        row.rest_frequency = Cosmology::rest_frequency(m.frequency(), z);
        row.luminosity[static_cast<std::size_t>(m.data_source())] =
            Cosmology::luminosity(m.flux_density(), m.extinction_factor(), z, d_l);
        table.push_back(row);
    }
    return table;
}

void write_plot_table(const std::string& path, const PlotTable& table)
{
    const fs::path p(path);
    if (p.has_parent_path()) fs::create_directories(p.parent_path());

    std::ofstream f(path);
    if (!f)
        throw std::runtime_error("Cannot write '" + path + "'");

    f << "rest_frequency";
    for (DataSource s : kAllDataSources) f << ' ' << to_string(s);
    f << '\n';

    f << std::scientific << std::setprecision(6);
    for (const auto& row : table) {
        f << row.rest_frequency;
        for (Real l : row.luminosity) f << ' ' << l;
        f << '\n';
    }
}

/* --------------------------------------------------------------------- */
std::optional<PowerLawFit> fit_uv_power_law(const PlotTable& table, Real lo, Real hi)
{
    std::vector<Real> xs, ys;
    for (const auto& row : table) {
        if (!(row.rest_frequency > lo && row.rest_frequency < hi)) continue;
        Real total = 0.0;
        for (Real l : row.luminosity) total += l;
        if (!(total > 0.0) || !std::isfinite(total)) continue;
        xs.push_back(std::log10(row.rest_frequency));
        ys.push_back(std::log10(total));
    }
    if (xs.size() < 2) return std::nullopt;

    const Eigen::Index n = static_cast<Eigen::Index>(xs.size());
    Matrix A(n, 2);
    Vector y(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        A(i, 0) = xs[i];
        A(i, 1) = 1.0;
        y[i]    = ys[i];
    }
    // all abscissae equal → slope undetermined
    if ((A.col(0).array() - A(0, 0)).abs().maxCoeff() == 0.0) return std::nullopt;

    const Vector sol = A.colPivHouseholderQr().solve(y);
    return PowerLawFit{sol[0], sol[1], xs.size()};
}

/* ===================================================================== */
/*                          G n u p l o t                                */
/* ===================================================================== */
std::string plot_file_name(const Source& source)
{
    std::string n = source.output_name();
    for (char& c : n) {
        const unsigned char u = static_cast<unsigned char>(c);
        if (!std::isalnum(u) && c != '+' && c != '-' && c != '.' && c != '_' && c != '#')
            c = '_';
    }
    if (n.empty() || n.front() == '.') n.insert(n.begin(), '_');
    return n + ".dat";
}

namespace {
// gnuplot single-quoted string: no escapes, '' stands for a quote
std::string gnuplot_quote(const std::string& text)
{
    std::string q = "'";
    for (char c : text) {
        if (c == '\'') q += '\'';
        q += c;
    }
    return q + "'";
}

// POSIX shell single-quoted word
std::string shell_quote(const std::string& word)
{
    std::string q = "'";
    for (char c : word) {
        if (c == '\'') q += "'\\''";
        else            q += c;
    }
    return q + "'";
}
} // unnamed namespace

GnuplotRenderer::GnuplotRenderer(std::string executable) : exe_(std::move(executable)) {}

std::string GnuplotRenderer::script(const std::string& dat_path,
                                    const std::string& out_path,
                                    const std::string& title,
                                    const std::optional<PowerLawFit>& fit) const
{
    std::ostringstream s;
    s << std::setprecision(10);
    s << "set term postscript enhanced color\n"
      << "set output " << gnuplot_quote(out_path) << "\n"
      << "lower_cutoff = " << kUvLowerCutoff << "\n"
      << "upper_cutoff = " << kUvUpperCutoff << "\n"
      << "freq_filter(x) = (x>lower_cutoff && x<upper_cutoff) ? x : 1/0\n"
      << "set title " << gnuplot_quote(title) << "\n"
      << "set logscale\n"
      << "set key autotitle columnhead\n"
      << "set xrange[1e7:1e18]\n"
      << "set format x \"%L\"\n"
      << "set xlabel \"Rest-frame frequency, log_{10}({/Symbol-Oblique n}_{rest}) [Hz]\"\n"
      << "set yrange[1e15:1e30]\n"
      << "set format y \"%L\"\n"
      << "set ylabel \"Luminosity, log_{10}(L_{/Symbol-Oblique n}) [W Hz^{-1}]\"\n"
      << "set arrow from lower_cutoff,graph(0,0) to lower_cutoff,graph(1,1) nohead linetype 0\n"
      << "set arrow from upper_cutoff,graph(0,0) to upper_cutoff,graph(1,1) nohead linetype 0\n";

    if (fit) {
        s << "m = " << fit->slope << "\n"
          << "b = " << fit->intercept << "\n"
          << "f(x) = m*x+b\n"
          << "plot 10**f(log10(freq_filter(x))) title \"UV fit\", "
          << "for [col=2:5] " << gnuplot_quote(dat_path) << " using 1:col\n";
    } else {
        s << "plot for [col=2:5] " << gnuplot_quote(dat_path) << " using 1:col\n";
    }
    return s.str();
}

int GnuplotRenderer::render(const std::string& dat_path,
                            const std::string& title,
                            const std::optional<PowerLawFit>& fit) const
{
    const fs::path dat(dat_path);
    const fs::path gp = fs::path(dat).replace_extension(".gp");
    const fs::path ps = fs::path(dat).replace_extension(".ps");

    {
        std::ofstream f(gp);
        if (!f) {
            std::cerr << "[GnuplotRenderer] cannot write " << gp << '\n';
            return -1;
        }
        f << script(dat.string(), ps.string(), title, fit);
    }

    const std::string cmd = exe_ + " " + shell_quote(gp.string()) + " > /dev/null 2>&1";
    const int rc = std::system(cmd.c_str());
    if (rc != 0)
        std::cerr << "[GnuplotRenderer] gnuplot failed (" << rc << ") for "
                  << dat.filename() << '\n';
    return rc;
}

} // namespace sedfuse
