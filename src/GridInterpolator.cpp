#include "GridInterpolator.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace GeoProfile {

// ============================================================================
// InterpolatedField
// ============================================================================

InterpolatedField::InterpolatedField(const ProfileDomain& domain, int resolution)
    : domain_(domain), resolution_(resolution) {
    if (resolution_ < 2) {
        throw std::invalid_argument("Grid resolution must be at least 2");
    }
    x_ = GridInterpolator::linspace(domain_.x_min, domain_.x_max, resolution_);
    z_ = GridInterpolator::linspace(domain_.z_min, domain_.z_max, resolution_);
    values_.assign(static_cast<size_t>(resolution_) * resolution_,
                   std::numeric_limits<double>::quiet_NaN());
}

int InterpolatedField::definedCount() const {
    return static_cast<int>(std::count_if(values_.begin(), values_.end(),
                                          [](double v) { return !std::isnan(v); }));
}

void InterpolatedField::clamp(double lo, double hi) {
    for (double& v : values_) {
        if (std::isnan(v)) continue;
        v = std::max(lo, std::min(hi, v));
    }
}

// ============================================================================
// GridInterpolator
// ============================================================================

GridInterpolator::GridInterpolator(const ProfileDomain& domain, int resolution,
                                   double clip_min, double clip_max)
    : domain_(domain), resolution_(resolution),
      clip_min_(clip_min), clip_max_(clip_max) {
    domain_.validate();
    if (resolution_ < 2) {
        throw std::invalid_argument("Grid resolution must be at least 2");
    }
    if (!(clip_min_ < clip_max_)) {
        throw std::invalid_argument("Clip range must satisfy clip_min < clip_max");
    }
}

std::vector<double> GridInterpolator::linspace(double lo, double hi, int n) {
    std::vector<double> out(static_cast<size_t>(std::max(n, 0)));
    if (n == 1) {
        out[0] = lo;
        return out;
    }
    double step = (hi - lo) / (n - 1);
    for (int k = 0; k < n; ++k) {
        out[k] = lo + k * step;
    }
    if (n > 1) out[n - 1] = hi;
    return out;
}

InterpolatedField GridInterpolator::interpolate(const std::vector<Sample>& samples) const {
    std::vector<Point2> pts;
    pts.reserve(samples.size());
    for (const auto& s : samples) {
        pts.push_back({s.x, s.z});
    }

    DelaunayTriangulation mesh(pts);
    return interpolate(samples, mesh);
}

InterpolatedField GridInterpolator::interpolate(const std::vector<Sample>& samples,
                                                const DelaunayTriangulation& mesh) const {
    InterpolatedField field(domain_, resolution_);

    const auto& verts = mesh.points();
    const auto& source = mesh.sourceIndex();

    const double dx = (domain_.x_max - domain_.x_min) / (resolution_ - 1);
    const double dz = (domain_.z_max - domain_.z_min) / (resolution_ - 1);
    const double eps = 1e-12;

    for (const auto& tri : mesh.triangles()) {
        const Point2& A = verts[tri.a];
        const Point2& B = verts[tri.b];
        const Point2& C = verts[tri.c];

        double area = DelaunayTriangulation::orient(A, B, C);
        if (area <= 0.0) continue;

        double va = samples[source[tri.a]].value;
        double vb = samples[source[tri.b]].value;
        double vc = samples[source[tri.c]].value;

        // Lattice nodes inside the triangle's bounding box
        double tx0 = std::min({A.x, B.x, C.x});
        double tx1 = std::max({A.x, B.x, C.x});
        double tz0 = std::min({A.z, B.z, C.z});
        double tz1 = std::max({A.z, B.z, C.z});

        int i0 = std::max(0, static_cast<int>(std::ceil((tx0 - domain_.x_min) / dx - eps)));
        int i1 = std::min(resolution_ - 1,
                          static_cast<int>(std::floor((tx1 - domain_.x_min) / dx + eps)));
        int j0 = std::max(0, static_cast<int>(std::ceil((tz0 - domain_.z_min) / dz - eps)));
        int j1 = std::min(resolution_ - 1,
                          static_cast<int>(std::floor((tz1 - domain_.z_min) / dz + eps)));

        for (int j = j0; j <= j1; ++j) {
            for (int i = i0; i <= i1; ++i) {
                if (field.defined(i, j)) continue;

                Point2 p{field.xCoord(i), field.zCoord(j)};
                double l0 = DelaunayTriangulation::orient(B, C, p) / area;
                double l1 = DelaunayTriangulation::orient(C, A, p) / area;
                double l2 = DelaunayTriangulation::orient(A, B, p) / area;

                if (l0 < -eps || l1 < -eps || l2 < -eps) continue;

                field.set(i, j, l0 * va + l1 * vb + l2 * vc);
            }
        }
    }

    field.clamp(clip_min_, clip_max_);
    return field;
}

} // namespace GeoProfile
