#ifndef CHART_COMPOSER_HPP
#define CHART_COMPOSER_HPP

#include "GridInterpolator.hpp"
#include "ChartScene.hpp"
#include <memory>

namespace GeoProfile {

/**
 * @brief Fixed text, ticks and legend layout of the chart
 */
struct ChartStyle {
    std::string title;
    std::string x_label;
    std::string z_label;
    std::string caption;
    std::string legend_title;

    double level_min;
    double level_max;
    int level_count;

    std::vector<double> x_ticks;
    std::vector<double> z_ticks;
    std::vector<double> scale_ticks;

    std::vector<TextAnnotation> annotations;
    std::vector<LegendEntry> legend_entries;

    /// Earth depth profile layout: 15 levels over [55, 1000], six captions, seven legend rows
    static ChartStyle earthDepthProfile();
};

/**
 * @brief Turns an interpolated field into a ChartScene
 *
 * Pure: no randomness, no I/O. Every lattice cell whose four corners are
 * defined is split into two triangles, and each triangle is clipped against
 * the bands it spans, giving the filled contour polygons. Cells touching an
 * undefined node are left empty.
 */
class ChartComposer {
public:
    explicit ChartComposer(ChartStyle style = ChartStyle::earthDepthProfile(),
                           std::shared_ptr<const ColorMap> cmap = nullptr);

    ChartScene compose(const InterpolatedField& field) const;

    /// Level set used for contouring, ascending
    std::vector<double> levels() const;

    const ChartStyle& style() const { return style_; }

private:
    ChartStyle style_;
    std::shared_ptr<const ColorMap> cmap_;

    void fillBands(const InterpolatedField& field, ChartScene& scene) const;
};

} // namespace GeoProfile

#endif // CHART_COMPOSER_HPP
