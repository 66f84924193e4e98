#include "PointCloudSampler.hpp"
#include <stdexcept>

namespace GeoProfile {

PointCloudSampler::PointCloudSampler(const ProfileDomain& domain)
    : domain_(domain) {
    domain_.validate();
}

std::vector<Sample> PointCloudSampler::sample(int n_points, RandomContext& rng) const {
    if (n_points < 0) {
        throw std::invalid_argument("Number of sample points must be non-negative");
    }

    std::vector<Sample> samples(static_cast<size_t>(n_points));

    for (auto& s : samples) {
        s.x = rng.uniform(domain_.x_min, domain_.x_max);
    }
    for (auto& s : samples) {
        s.z = rng.uniform(domain_.z_min, domain_.z_max);
    }

    return samples;
}

} // namespace GeoProfile
