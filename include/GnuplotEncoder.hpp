#ifndef GNUPLOT_ENCODER_HPP
#define GNUPLOT_ENCODER_HPP

#include "GeoProfile.hpp"
#include "SceneEncoder.hpp"
#include <ostream>
#include <string>

namespace GeoProfile {

/**
 * @brief Temporary directory removed when the owner goes out of scope
 */
class ScopedWorkDir {
public:
    /// Creates a fresh directory under parent; throws RenderingError on failure
    explicit ScopedWorkDir(const std::string& parent);
    ~ScopedWorkDir();

    ScopedWorkDir(const ScopedWorkDir&) = delete;
    ScopedWorkDir& operator=(const ScopedWorkDir&) = delete;

    const std::string& path() const { return path_; }
    std::string file(const std::string& name) const { return path_ + "/" + name; }

private:
    std::string path_;
};

/**
 * @brief Renders a scene through the gnuplot executable
 *
 * Produces a two-panel multiplot: the filled contour map with axes and
 * annotations on the left, the legend colour scale with its labelled
 * entries on the right, and the caption along the bottom. Each band is
 * written to its own data file, polygons separated by blank lines, and
 * drawn with filledcurves.
 *
 * DOCUMENT uses the pdfcairo terminal, RASTER uses pngcairo.
 */
class GnuplotEncoder : public SceneEncoder {
public:
    GnuplotEncoder(const RenderConfig& config, OutputFormat format);

    std::string encode(const ChartScene& scene) const override;
    std::string contentType() const override;
    std::string fileName() const override;

    OutputFormat format() const { return format_; }

    /**
     * @brief Gnuplot script for a scene
     *
     * @param scene Scene to draw
     * @param output_path File the terminal writes to
     * @param data_dir Directory holding the band files named by bandFileName()
     */
    std::string buildScript(const ChartScene& scene,
                            const std::string& output_path,
                            const std::string& data_dir) const;

    /// "set terminal ..." line for the configured format
    std::string terminalLine() const;

    static std::string bandFileName(size_t band_index);

    /// One polygon per block, blocks separated by two blank lines
    static void writeBandData(const ContourBand& band, std::ostream& out);

    /// Double-quoted gnuplot string; '\n' becomes a line break
    static std::string quote(const std::string& text);

    /// Single-quoted shell word
    static std::string shellQuote(const std::string& s);

    /// Shell line running the configured executable on a script, output to log_file
    std::string commandLine(const std::string& script_file, const std::string& log_file) const;

    /// True if the executable can be found by the shell
    static bool available(const std::string& gnuplot);

private:
    RenderConfig config_;
    OutputFormat format_;

    void writeMapPanel(const ChartScene& scene, const std::string& data_dir,
                       std::ostream& script) const;
    void writeLegendPanel(const ChartScene& scene, std::ostream& script) const;
};

} // namespace GeoProfile

#endif // GNUPLOT_ENCODER_HPP
