#include <petsc.h>
#include "GnuplotEncoder.hpp"
#include "ProfileErrors.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <vector>
#include <stdlib.h>
#include <sys/wait.h>

namespace GeoProfile {

namespace {

std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::string();
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::string firstLine(const std::string& text) {
    auto pos = text.find('\n');
    return pos == std::string::npos ? text : text.substr(0, pos);
}

} // namespace

// ============================================================================
// ScopedWorkDir
// ============================================================================

ScopedWorkDir::ScopedWorkDir(const std::string& parent) {
    std::string tmpl = parent + "/geoprofile-XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    if (mkdtemp(buf.data()) == nullptr) {
        throw RenderingError("Cannot create work directory under " + parent +
                             ": " + std::strerror(errno));
    }
    path_ = buf.data();
}

ScopedWorkDir::~ScopedWorkDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        PetscPrintf(PETSC_COMM_SELF, "Warning: could not remove %s: %s\n",
                    path_.c_str(), ec.message().c_str());
    }
}

// ============================================================================
// GnuplotEncoder
// ============================================================================

GnuplotEncoder::GnuplotEncoder(const RenderConfig& config, OutputFormat format)
    : config_(config), format_(format) {}

std::string GnuplotEncoder::contentType() const {
    return format_ == OutputFormat::DOCUMENT ? "application/pdf" : "image/png";
}

std::string GnuplotEncoder::fileName() const {
    return format_ == OutputFormat::DOCUMENT ? "earth_depth_profile.pdf"
                                             : "earth_depth_profile.png";
}

std::string GnuplotEncoder::bandFileName(size_t band_index) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "band_%02zu.dat", band_index);
    return std::string(buf);
}

std::string GnuplotEncoder::quote(const std::string& text) {
    std::string out = "\"";
    for (char c : text) {
        switch (c) {
            case '\n': out += "\\n"; break;
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            default:   out += c;
        }
    }
    out += "\"";
    return out;
}

std::string GnuplotEncoder::shellQuote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

std::string GnuplotEncoder::commandLine(const std::string& script_file,
                                        const std::string& log_file) const {
    return shellQuote(config_.gnuplot) + " " + shellQuote(script_file) +
           " > " + shellQuote(log_file) + " 2>&1";
}

bool GnuplotEncoder::available(const std::string& gnuplot) {
    std::string cmd = "command -v " + shellQuote(gnuplot) + " > /dev/null 2>&1";
    return std::system(cmd.c_str()) == 0;
}

std::string GnuplotEncoder::terminalLine() const {
    std::ostringstream line;
    std::string font = "'" + config_.font + "'";

    if (format_ == OutputFormat::DOCUMENT) {
        line << "set terminal pdfcairo size " << config_.page_width_in << "in,"
             << config_.page_height_in << "in font " << font << " noenhanced";
    } else {
        line << "set terminal pngcairo size " << config_.raster_width << ","
             << config_.raster_height << " font " << font << " noenhanced";
    }
    return line.str();
}

void GnuplotEncoder::writeBandData(const ContourBand& band, std::ostream& out) {
    out << std::setprecision(10);
    out << "# band [" << band.lower << ", " << band.upper << "]\n";
    for (const auto& poly : band.polygons) {
        for (const auto& p : poly) {
            out << p.x << " " << p.z << "\n";
        }
        // Close the ring
        out << poly.front().x << " " << poly.front().z << "\n\n\n";
    }
}

void GnuplotEncoder::writeMapPanel(const ChartScene& scene, const std::string& data_dir,
                                   std::ostream& script) const {
    const AxisSpec& xa = scene.xAxis();
    const AxisSpec& za = scene.depthAxis();

    script << "# Contour map\n";
    script << "set origin 0.0,0.08\n";
    script << "set size 0.66,0.90\n";
    script << "set tmargin 5\n";
    script << "set bmargin 6\n";
    script << "set title " << quote(scene.title()) << " offset 0,1.5\n";
    script << "set xlabel " << quote(xa.label) << " offset 0,-1.5\n";
    script << "set ylabel " << quote(za.label) << "\n";
    script << "unset key\n";

    script << "set xrange [" << xa.lo << ":" << xa.hi << "]\n";
    if (za.inverted) {
        script << "set yrange [" << za.hi << ":" << za.lo << "]\n";
    } else {
        script << "set yrange [" << za.lo << ":" << za.hi << "]\n";
    }

    auto tics = [&](const char* axis, const std::vector<double>& ticks) {
        script << "set " << axis << " (";
        for (size_t k = 0; k < ticks.size(); ++k) {
            if (k > 0) script << ", ";
            script << ticks[k];
        }
        script << ") out nomirror\n";
    };
    tics("xtics", xa.ticks);
    tics("ytics", za.ticks);

    int tag = 1;
    for (const auto& ann : scene.annotations()) {
        script << "set label " << tag++ << " " << quote(ann.text)
               << " at first " << ann.x << "," << ann.z << " center";
        if (ann.rotation_deg != 0.0) script << " rotate by " << ann.rotation_deg;
        script << " front\n";
    }
    script << "\n";

    std::vector<std::string> curves;
    const auto& bands = scene.bands();
    for (size_t k = 0; k < bands.size(); ++k) {
        if (bands[k].polygons.empty()) continue;
        std::string file = data_dir + "/" + bandFileName(k);
        curves.push_back(quote(file) + " using 1:2 with filledcurves closed fc rgb \"" +
                         bands[k].color.hex() + "\" fs solid 1.0 noborder notitle");
    }

    if (curves.empty()) {
        script << "plot NaN notitle\n\n";
        return;
    }
    script << "plot ";
    for (size_t k = 0; k < curves.size(); ++k) {
        if (k > 0) script << ", \\\n     ";
        script << curves[k];
    }
    script << "\n\n";
}

void GnuplotEncoder::writeLegendPanel(const ChartScene& scene, std::ostream& script) const {
    const LegendPanel& legend = scene.legend();
    const double bar_lo = 0.05;
    const double bar_hi = 0.20;

    script << "# Legend\n";
    script << "unset label\n";
    script << "unset arrow\n";
    script << "unset object\n";
    script << "set origin 0.68,0.08\n";
    script << "set size 0.30,0.90\n";
    script << "set title " << quote(legend.title) << " offset 0,1.5\n";
    script << "unset xlabel\n";
    script << "unset ylabel\n";
    script << "unset xtics\n";
    script << "unset ytics\n";
    script << "unset border\n";
    script << "set xrange [0:1]\n";
    script << "set yrange [" << legend.scale_min << ":" << legend.scale_max << "]\n";

    // Colour scale uses the same band colours as the map
    for (const auto& band : scene.bands()) {
        script << "set object rect from " << bar_lo << "," << band.lower
               << " to " << bar_hi << "," << band.upper
               << " fc rgb \"" << band.color.hex() << "\" fs solid 1.0 noborder\n";
    }
    script << "set object rect from " << bar_lo << "," << legend.scale_min
           << " to " << bar_hi << "," << legend.scale_max
           << " fs empty border lc rgb \"black\" front\n";

    for (double t : legend.scale_ticks) {
        script << "set arrow from " << bar_hi << "," << t << " to " << bar_hi + 0.03
               << "," << t << " nohead lc rgb \"black\" front\n";
    }

    for (const auto& entry : legend.entries) {
        script << "set arrow from 0.0," << entry.value << " to " << bar_lo << ","
               << entry.value << " nohead lw 1.5 lc rgb \"black\" front\n";
        script << "set arrow from " << bar_hi << "," << entry.value << " to "
               << bar_hi + 0.06 << "," << entry.value << " nohead lw 1.5 lc rgb \"black\" front\n";
        script << "set label " << quote(entry.label) << " at " << bar_hi + 0.08 << ","
               << entry.value << " left front\n";
    }

    script << "set label " << quote(scene.caption()) << " at screen 0.5,0.03 center front\n";
    script << "plot NaN notitle\n\n";
}

std::string GnuplotEncoder::buildScript(const ChartScene& scene,
                                        const std::string& output_path,
                                        const std::string& data_dir) const {
    std::ostringstream script;
    script << std::setprecision(10);

    script << terminalLine() << "\n";
    script << "set output " << quote(output_path) << "\n";
    script << "set encoding utf8\n";
    script << "set multiplot\n\n";

    writeMapPanel(scene, data_dir, script);
    writeLegendPanel(scene, script);

    script << "unset multiplot\n";
    script << "set output\n";
    return script.str();
}

std::string GnuplotEncoder::encode(const ChartScene& scene) const {
    ScopedWorkDir dir(config_.work_dir);

    const auto& bands = scene.bands();
    for (size_t k = 0; k < bands.size(); ++k) {
        if (bands[k].polygons.empty()) continue;
        std::ofstream data(dir.file(bandFileName(k)));
        if (!data) {
            throw RenderingError("Cannot write band data in " + dir.path());
        }
        writeBandData(bands[k], data);
        if (!data) {
            throw RenderingError("Failed writing band data in " + dir.path());
        }
    }

    std::string output = dir.file(fileName());
    std::string script_file = dir.file("profile.gp");
    {
        std::ofstream script(script_file);
        if (!script) {
            throw RenderingError("Cannot write gnuplot script in " + dir.path());
        }
        script << buildScript(scene, output, dir.path());
        if (!script) {
            throw RenderingError("Failed writing gnuplot script in " + dir.path());
        }
    }

    std::string log_file = dir.file("gnuplot.log");
    std::string cmd = commandLine(script_file, log_file);

    int status = std::system(cmd.c_str());
    if (status == -1) {
        throw RenderingError("Could not launch gnuplot: " + std::string(std::strerror(errno)));
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        throw RenderingError("gnuplot exited with status " + std::to_string(code) +
                             ": " + firstLine(readFile(log_file)));
    }

    std::string bytes = readFile(output);
    if (bytes.empty()) {
        throw RenderingError("gnuplot produced no output for " + fileName());
    }
    return bytes;
}

} // namespace GeoProfile
