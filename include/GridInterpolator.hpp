#ifndef GRID_INTERPOLATOR_HPP
#define GRID_INTERPOLATOR_HPP

#include "PointCloudSampler.hpp"
#include "DelaunayTriangulation.hpp"
#include <vector>
#include <cmath>

namespace GeoProfile {

/**
 * @brief Scalar field on a regular lattice over the profile domain
 *
 * Nodes are stored row-major with one row per depth level:
 * value(i, j) is at (xCoord(i), zCoord(j)). Nodes not covered by the
 * triangulation hold NaN and are reported as undefined.
 */
class InterpolatedField {
public:
    InterpolatedField(const ProfileDomain& domain, int resolution);

    int resolution() const { return resolution_; }
    int nodeCount() const { return resolution_ * resolution_; }
    const ProfileDomain& domain() const { return domain_; }

    double xCoord(int i) const { return x_[i]; }
    double zCoord(int j) const { return z_[j]; }
    const std::vector<double>& xCoords() const { return x_; }
    const std::vector<double>& zCoords() const { return z_; }

    double value(int i, int j) const { return values_[index(i, j)]; }
    bool defined(int i, int j) const { return !std::isnan(values_[index(i, j)]); }
    void set(int i, int j, double v) { values_[index(i, j)] = v; }

    const std::vector<double>& values() const { return values_; }
    int definedCount() const;

    /// Clamp every defined node into [lo, hi]
    void clamp(double lo, double hi);

private:
    ProfileDomain domain_;
    int resolution_;
    std::vector<double> x_;
    std::vector<double> z_;
    std::vector<double> values_;

    size_t index(int i, int j) const {
        return static_cast<size_t>(j) * resolution_ + i;
    }
};

/**
 * @brief Piecewise-linear resampling of scattered samples onto a lattice
 *
 * The samples are Delaunay-triangulated and each triangle is rasterized onto
 * the lattice nodes it covers using barycentric weights. No extrapolation:
 * nodes outside the convex hull stay undefined. Defined values are clamped
 * into [clip_min, clip_max].
 */
class GridInterpolator {
public:
    GridInterpolator(const ProfileDomain& domain, int resolution,
                     double clip_min = Defaults::VALUE_MIN,
                     double clip_max = Defaults::VALUE_MAX);

    /// Throws DegenerateInputError if the samples cannot be triangulated
    InterpolatedField interpolate(const std::vector<Sample>& samples) const;

    /// Same, reusing an existing triangulation of the samples
    InterpolatedField interpolate(const std::vector<Sample>& samples,
                                  const DelaunayTriangulation& mesh) const;

    static std::vector<double> linspace(double lo, double hi, int n);

    int resolution() const { return resolution_; }

private:
    ProfileDomain domain_;
    int resolution_;
    double clip_min_;
    double clip_max_;
};

} // namespace GeoProfile

#endif // GRID_INTERPOLATOR_HPP
