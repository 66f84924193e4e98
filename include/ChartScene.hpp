#ifndef CHART_SCENE_HPP
#define CHART_SCENE_HPP

#include "ColorMap.hpp"
#include <string>
#include <vector>

namespace GeoProfile {

struct ScenePoint {
    double x;
    double z;
};

using ScenePolygon = std::vector<ScenePoint>;

/// Filled region of the contour map between two consecutive levels
struct ContourBand {
    double lower;
    double upper;
    Color color;
    std::vector<ScenePolygon> polygons;   ///< Convex pieces in domain coordinates
};

struct TextAnnotation {
    std::string text;                     ///< Lines separated by '\n'
    double x;                             ///< Domain coordinates; may lie outside the axes
    double z;
    double rotation_deg;
};

struct LegendEntry {
    std::string label;
    double value;                         ///< Position on the shared colour scale
};

struct LegendPanel {
    std::string title;
    double scale_min;
    double scale_max;
    std::vector<double> scale_ticks;      ///< Tick marks only, drawn without numbers
    std::vector<LegendEntry> entries;
};

struct AxisSpec {
    std::string label;
    double lo;
    double hi;
    std::vector<double> ticks;
    bool inverted;                        ///< Increasing values drawn downward
};

/**
 * @brief Renderer-agnostic description of the depth profile chart
 *
 * Built once by ChartComposer and read-only afterwards. Holds geometry,
 * colours and text only; no drawing-surface handles.
 */
class ChartScene {
public:
    const std::string& title() const { return title_; }
    const AxisSpec& xAxis() const { return x_axis_; }
    const AxisSpec& depthAxis() const { return depth_axis_; }
    const std::vector<double>& levels() const { return levels_; }
    const std::vector<ContourBand>& bands() const { return bands_; }
    const std::vector<TextAnnotation>& annotations() const { return annotations_; }
    const LegendPanel& legend() const { return legend_; }
    const std::string& caption() const { return caption_; }

    /// Index of the band a value falls into; out-of-range values go to the end bands
    int bandIndexFor(double value) const;

    /// Colour of the band containing value, shared by the map and the legend
    Color colorFor(double value) const;

    size_t polygonCount() const;

private:
    friend class ChartComposer;
    ChartScene() = default;

    std::string title_;
    AxisSpec x_axis_;
    AxisSpec depth_axis_;
    std::vector<double> levels_;
    std::vector<ContourBand> bands_;
    std::vector<TextAnnotation> annotations_;
    LegendPanel legend_;
    std::string caption_;
};

} // namespace GeoProfile

#endif // CHART_SCENE_HPP
