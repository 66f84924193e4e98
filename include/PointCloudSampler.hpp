#ifndef POINT_CLOUD_SAMPLER_HPP
#define POINT_CLOUD_SAMPLER_HPP

#include "ProfileDomain.hpp"
#include <vector>

namespace GeoProfile {

/**
 * @brief Scatter point of the synthetic profile
 *
 * Position comes from the sampler; the remaining fields are filled in by
 * the zone classifier.
 */
struct Sample {
    double x = 0.0;                      ///< Surface position
    double z = 0.0;                      ///< Depth
    double boundary_z = 0.0;             ///< Boundary curve depth at this x
    Zone zone = Zone::UNCLASSIFIED;      ///< Zone of the last matching rule
    double base_value = 0.0;             ///< Value before global noise
    double value = 0.0;                  ///< Final raw value (unclipped)
};

/**
 * @brief Draws N independent points uniformly over a ProfileDomain
 *
 * All x coordinates are drawn first, then all z coordinates, from the
 * RandomContext of the current run.
 */
class PointCloudSampler {
public:
    explicit PointCloudSampler(const ProfileDomain& domain);

    std::vector<Sample> sample(int n_points, RandomContext& rng) const;

    const ProfileDomain& domain() const { return domain_; }

private:
    ProfileDomain domain_;
};

} // namespace GeoProfile

#endif // POINT_CLOUD_SAMPLER_HPP
