#include <cmath>
#include <filesystem>
#include <fstream>
#include <string>

#include <catch.hpp>

#include "sedfuse/OutputTemplate.hpp"
#include "sedfuse/ResultWriter.hpp"
#include "fixtures.hpp"

using namespace sedfuse; // NOLINT

static void AddPoint(Source &s, DataSource src, double freq, double flux) {
    Detection d;
    d.source    = src;
    d.frequency = freq;
    d.flux      = flux;
    d.position  = s.input_position();
    s.append(d);
}

TEST_CASE("One rendered line per measurement in append order", "[results]") {
    Source s = QuasarSource();
    AddPoint(s, DataSource::NED, 1.4e9, 40.0);
    AddPoint(s, DataSource::GALEX, 1.962e15, 3e-6);

    const auto lines = render_lines(s, OutputTemplate("%(num)d %(source)s", {}));
    REQUIRE(lines.size() == 2);
    CHECK(lines[0] == "1 NED");
    CHECK(lines[1] == "2 GALEX");
}

TEST_CASE("Plot table puts each luminosity in its own column", "[results]") {
    Source s = QuasarSource();
    AddPoint(s, DataSource::NED, 1e14, 1e-3);
    AddPoint(s, DataSource::WISE, 8.856e13, 1e-3);

    const PlotTable table = make_plot_table(s, Cosmology());
    REQUIRE(table.size() == 2);

    CHECK(table[0].rest_frequency == Approx(1.158e14));
    CHECK(table[0].luminosity[0] == Approx(5.766191602924177e+22).epsilon(1e-6));
    CHECK(table[0].luminosity[1] == 0.0);
    CHECK(table[1].luminosity[0] == 0.0);
    CHECK(table[1].luminosity[1] == Approx(5.766191602924177e+22).epsilon(1e-6));
    CHECK(table[1].luminosity[2] == 0.0);
    CHECK(table[1].luminosity[3] == 0.0);
}

TEST_CASE("Zero redshift gives zero luminosity", "[results]") {
    Source s = QuasarSource(187.27792, 2.05239, 0.0);
    AddPoint(s, DataSource::TwoMASS, 2.429e14, 1e-2);

    const PlotTable table = make_plot_table(s, Cosmology());
    REQUIRE(table.size() == 1);
    CHECK(table[0].rest_frequency == 2.429e14);
    CHECK(table[0].luminosity[2] == 0.0);
}

TEST_CASE("Plot table file layout", "[results]") {
    ScratchDir dir("plot");
    PlotTable table = {PlotRow{1e14, {1e22, 0.0, 0.0, 0.0}},
                       PlotRow{2e15, {0.0, 0.0, 0.0, 3e21}}};

    const std::string path = (dir.Path() / "nested" / "3C273.dat").string();
    write_plot_table(path, table);

    std::ifstream in(path);
    std::string header, row1, row2, extra;
    std::getline(in, header);
    std::getline(in, row1);
    std::getline(in, row2);
    CHECK(header == "rest_frequency NED WISE 2MASS GALEX");
    CHECK(row1 == "1.000000e+14 1.000000e+22 0.000000e+00 0.000000e+00 0.000000e+00");
    CHECK(row2.substr(0, 12) == "2.000000e+15");
    CHECK_FALSE(std::getline(in, extra));
}

TEST_CASE("UV power law fit", "[results]") {
    // log L = -1.5 log ν + 45 inside the window, junk outside it
    PlotTable table;
    for (double lognu : {15.2, 15.5, 16.0, 16.7}) {
        PlotRow row{std::pow(10.0, lognu), {}};
        row.luminosity[3] = std::pow(10.0, -1.5 * lognu + 45.0);
        table.push_back(row);
    }
    table.push_back(PlotRow{1e14, {1e30, 0.0, 0.0, 0.0}});
    table.push_back(PlotRow{1e18, {1e10, 0.0, 0.0, 0.0}});
    table.push_back(PlotRow{3e15, {}});   // nothing measured in this row

    const auto fit = fit_uv_power_law(table);
    REQUIRE(fit);
    CHECK(fit->npoints == 4);
    CHECK(fit->slope == Approx(-1.5));
    CHECK(fit->intercept == Approx(45.0));

    SECTION("too few points") {
        PlotTable one = {table[0], table[4]};
        CHECK_FALSE(fit_uv_power_law(one));

        PlotTable same_x = {table[0], table[0]};
        CHECK_FALSE(fit_uv_power_law(same_x));
    }
}

TEST_CASE("Gnuplot script", "[results]") {
    GnuplotRenderer gnuplot;
    const std::string with_fit = gnuplot.script("3C273.dat", "3C273.ps", "3C 273",
                                                PowerLawFit{-1.5, 45.0, 4});
    CHECK(with_fit.find("set xrange[1e7:1e18]") != std::string::npos);
    CHECK(with_fit.find("set yrange[1e15:1e30]") != std::string::npos);
    CHECK(with_fit.find("m = -1.5") != std::string::npos);
    CHECK(with_fit.find("for [col=2:5] '3C273.dat' using 1:col") != std::string::npos);
    CHECK(with_fit.find("set output '3C273.ps'") != std::string::npos);
    CHECK(with_fit.find("set title '3C 273'") != std::string::npos);

    const std::string without = gnuplot.script("x.dat", "x.ps", "x", std::nullopt);
    CHECK(without.find("UV fit") == std::string::npos);

    SECTION("strings are single quoted") {
        const std::string quoted = gnuplot.script("a`b`.dat", "a.ps", "O'Neil \"$x\"", std::nullopt);
        CHECK(quoted.find("set title 'O''Neil \"$x\"'") != std::string::npos);
        CHECK(quoted.find("for [col=2:5] 'a`b`.dat' using 1:col") != std::string::npos);
    }
}

TEST_CASE("Plot file names keep to a safe character set", "[results]") {
    CHECK(plot_file_name(QuasarSource()) == "3C273.dat");
    CHECK(plot_file_name(Source(1, "J1229+0203#2", "", SkyPosition{}, 0.1)) == "J1229+0203#2.dat");
    CHECK(plot_file_name(Source(1, "a/b$(rm)`x`;'q'", "", SkyPosition{}, 0.1)) ==
          "a_b__rm__x___q_.dat");
    CHECK(plot_file_name(Source(1, "..", "", SkyPosition{}, 0.1)) == "_...dat");
}

TEST_CASE("Rendering never hands the file name to the shell", "[results]") {
    namespace fs = std::filesystem;
    const fs::path marker = fs::current_path() / "sedfuse-render-marker";
    fs::remove(marker);

    ScratchDir dir("render");
    const std::string dat = dir.Write("x\"$(touch sedfuse-render-marker)'`touch sedfuse-render-marker`.dat",
                                      "rest_frequency NED WISE 2MASS GALEX\n");

    const GnuplotRenderer renderer("true");
    CHECK(renderer.render(dat, "3C 273", std::nullopt) == 0);
    CHECK(fs::exists(fs::path(dat).replace_extension(".gp")));
    CHECK_FALSE(fs::exists(marker));
}
