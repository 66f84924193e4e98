#include "ChartComposer.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace GeoProfile {

// ============================================================================
// ChartScene
// ============================================================================

int ChartScene::bandIndexFor(double value) const {
    int nbands = static_cast<int>(bands_.size());
    if (nbands == 0) return -1;
    if (value <= levels_.front()) return 0;
    if (value >= levels_.back()) return nbands - 1;
    auto it = std::upper_bound(levels_.begin(), levels_.end(), value);
    int k = static_cast<int>(it - levels_.begin()) - 1;
    return std::max(0, std::min(nbands - 1, k));
}

Color ChartScene::colorFor(double value) const {
    int k = bandIndexFor(value);
    if (k < 0) return Color();
    return bands_[k].color;
}

size_t ChartScene::polygonCount() const {
    size_t n = 0;
    for (const auto& band : bands_) n += band.polygons.size();
    return n;
}

// ============================================================================
// ChartStyle
// ============================================================================

ChartStyle ChartStyle::earthDepthProfile() {
    ChartStyle s;
    s.title = "Earth Depth Profile";
    s.x_label = "Surface-X (m/f)";
    s.z_label = "Depth-Z (m/f)";
    s.caption = "The Earth Depth Profile describes the spread of Soft rock, Hard rock "
                "and the Water Bearing Porous rock information.";
    s.legend_title = "Legend";

    s.level_min = Defaults::VALUE_MIN;
    s.level_max = Defaults::VALUE_MAX;
    s.level_count = Defaults::CONTOUR_LEVELS;

    s.x_ticks = {1, 2, 3, 4, 5, 6};
    s.z_ticks = {0, 10, 20, 30, 40, 50, 60, 70, 80};
    s.scale_ticks = {55, 71, 93, 121, 157, 205, 267, 348, 453, 590, 768, 1000};

    s.annotations = {
        {"Soft Rock\nAnd Dry Sand", 2.0, -5.0, 0.0},
        {"Wet Nature",              5.0, -5.0, 0.0},
        {"More Hard",               0.7, 20.0, 90.0},
        {"Most Hard\nStructure",    2.0, 85.0, 0.0},
        {"Wet Condition",           3.5, 85.0, 0.0},
        {"Water Bearing Rock",      5.0, 85.0, 0.0}
    };

    s.legend_entries = {
        {"Hard Rock", 900},
        {"Medium Hard Rock", 750},
        {"Less Medium Rock, Below Soft Rock", 650},
        {"Rock, Soil and Wet Nature", 350},
        {"Less Dense Porous Rock", 190},
        {"Little More Dense Porous Rock", 130},
        {"More Dense Porous Rock (Water Bearing Rock Layer)", 85}
    };
    return s;
}

// ============================================================================
// Band clipping helpers
// ============================================================================

namespace {

struct ValuedPoint {
    double x;
    double z;
    double v;
};

using ValuedPolygon = std::vector<ValuedPoint>;

// Sutherland-Hodgman against a half-space in value: keep v >= c (keep_above)
// or v <= c. Linear interpolation of v along edges keeps the pieces exact.
ValuedPolygon clipByValue(const ValuedPolygon& poly, double c, bool keep_above) {
    ValuedPolygon out;
    if (poly.empty()) return out;
    out.reserve(poly.size() + 2);

    auto inside = [&](const ValuedPoint& p) {
        return keep_above ? p.v >= c : p.v <= c;
    };

    for (size_t k = 0; k < poly.size(); ++k) {
        const ValuedPoint& P = poly[k];
        const ValuedPoint& Q = poly[(k + 1) % poly.size()];
        bool pin = inside(P);
        bool qin = inside(Q);

        if (pin) out.push_back(P);
        if (pin != qin) {
            double t = (c - P.v) / (Q.v - P.v);
            out.push_back({P.x + t * (Q.x - P.x), P.z + t * (Q.z - P.z), c});
        }
    }
    return out;
}

double signedArea(const ValuedPolygon& poly) {
    double a = 0.0;
    for (size_t k = 0; k < poly.size(); ++k) {
        const ValuedPoint& P = poly[k];
        const ValuedPoint& Q = poly[(k + 1) % poly.size()];
        a += P.x * Q.z - Q.x * P.z;
    }
    return 0.5 * a;
}

ScenePolygon toScene(const ValuedPolygon& poly) {
    ScenePolygon out;
    out.reserve(poly.size());
    for (const auto& p : poly) out.push_back({p.x, p.z});
    return out;
}

} // namespace

// ============================================================================
// ChartComposer
// ============================================================================

ChartComposer::ChartComposer(ChartStyle style, std::shared_ptr<const ColorMap> cmap)
    : style_(std::move(style)), cmap_(std::move(cmap)) {
    if (style_.level_count < 2) {
        throw std::invalid_argument("Contour level count must be at least 2");
    }
    if (!(style_.level_min < style_.level_max)) {
        throw std::invalid_argument("Contour levels must satisfy level_min < level_max");
    }
    if (!cmap_) {
        cmap_ = std::make_shared<JetColorMap>();
    }
}

std::vector<double> ChartComposer::levels() const {
    return GridInterpolator::linspace(style_.level_min, style_.level_max, style_.level_count);
}

ChartScene ChartComposer::compose(const InterpolatedField& field) const {
    ChartScene scene;
    scene.title_ = style_.title;
    scene.caption_ = style_.caption;

    const ProfileDomain& dom = field.domain();
    scene.x_axis_ = {style_.x_label, dom.x_min, dom.x_max, style_.x_ticks, false};
    scene.depth_axis_ = {style_.z_label, dom.z_min, dom.z_max, style_.z_ticks, true};

    scene.levels_ = levels();
    const double span = style_.level_max - style_.level_min;
    for (size_t k = 0; k + 1 < scene.levels_.size(); ++k) {
        ContourBand band;
        band.lower = scene.levels_[k];
        band.upper = scene.levels_[k + 1];
        double mid = 0.5 * (band.lower + band.upper);
        band.color = cmap_->getColor((mid - style_.level_min) / span);
        scene.bands_.push_back(band);
    }

    scene.annotations_ = style_.annotations;

    scene.legend_.title = style_.legend_title;
    scene.legend_.scale_min = style_.level_min;
    scene.legend_.scale_max = style_.level_max;
    scene.legend_.scale_ticks = style_.scale_ticks;
    scene.legend_.entries = style_.legend_entries;

    fillBands(field, scene);
    return scene;
}

void ChartComposer::fillBands(const InterpolatedField& field, ChartScene& scene) const {
    const int res = field.resolution();
    const int nbands = static_cast<int>(scene.bands_.size());
    const double cell_area = std::fabs((field.xCoord(1) - field.xCoord(0)) *
                                       (field.zCoord(1) - field.zCoord(0)));
    const double min_area = 1e-12 * cell_area;

    auto clipInto = [&](const ValuedPolygon& tri) {
        double vmin = std::min({tri[0].v, tri[1].v, tri[2].v});
        double vmax = std::max({tri[0].v, tri[1].v, tri[2].v});
        int kmin = scene.bandIndexFor(vmin);
        int kmax = scene.bandIndexFor(vmax);

        for (int k = kmin; k <= kmax; ++k) {
            ValuedPolygon piece = tri;
            // The end bands absorb values beyond the level range
            if (k > 0) piece = clipByValue(piece, scene.levels_[k], true);
            if (k < nbands - 1) piece = clipByValue(piece, scene.levels_[k + 1], false);
            if (piece.size() < 3 || std::fabs(signedArea(piece)) <= min_area) continue;
            scene.bands_[k].polygons.push_back(toScene(piece));
        }
    };

    for (int j = 0; j + 1 < res; ++j) {
        for (int i = 0; i + 1 < res; ++i) {
            if (!field.defined(i, j) || !field.defined(i + 1, j) ||
                !field.defined(i + 1, j + 1) || !field.defined(i, j + 1)) {
                continue;
            }

            ValuedPoint p00{field.xCoord(i),     field.zCoord(j),     field.value(i, j)};
            ValuedPoint p10{field.xCoord(i + 1), field.zCoord(j),     field.value(i + 1, j)};
            ValuedPoint p11{field.xCoord(i + 1), field.zCoord(j + 1), field.value(i + 1, j + 1)};
            ValuedPoint p01{field.xCoord(i),     field.zCoord(j + 1), field.value(i, j + 1)};

            // Whole cell inside one band: emit the quad as is
            int k00 = scene.bandIndexFor(p00.v);
            if (k00 == scene.bandIndexFor(p10.v) && k00 == scene.bandIndexFor(p11.v) &&
                k00 == scene.bandIndexFor(p01.v)) {
                scene.bands_[k00].polygons.push_back(toScene({p00, p10, p11, p01}));
                continue;
            }

            clipInto({p00, p10, p11});
            clipInto({p00, p11, p01});
        }
    }
}

} // namespace GeoProfile
