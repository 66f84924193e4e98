#ifndef PROFILE_DOMAIN_HPP
#define PROFILE_DOMAIN_HPP

#include "GeoProfile.hpp"
#include <random>
#include <cstdint>

namespace GeoProfile {

/**
 * @brief Rectangular (surface-position, depth) region of one profile
 *
 * x is the surface position, z the depth; z grows downward when drawn.
 */
struct ProfileDomain {
    double x_min = Defaults::X_MIN;
    double x_max = Defaults::X_MAX;
    double z_min = Defaults::Z_MIN;
    double z_max = Defaults::Z_MAX;

    ProfileDomain() = default;
    ProfileDomain(double xmin, double xmax, double zmin, double zmax);

    static ProfileDomain fromConfig(const ProfileConfig& config);

    double width() const { return x_max - x_min; }
    double depth() const { return z_max - z_min; }
    bool contains(double x, double z) const;

    // Throws std::invalid_argument when a range is empty or inverted
    void validate() const;
};

/**
 * @brief Seeded random stream owned by exactly one generation run
 *
 * Every stochastic step of the pipeline draws from the instance it is
 * handed, in a fixed order, so the same seed replays the same profile.
 * Never shared between runs.
 */
class RandomContext {
public:
    explicit RandomContext(std::uint32_t seed);

    RandomContext(const RandomContext&) = delete;
    RandomContext& operator=(const RandomContext&) = delete;

    /// Uniform draw in [0, 1)
    double uniform();

    /// Uniform draw in [lo, hi)
    double uniform(double lo, double hi);

    /// Standard normal draw
    double normal();

    std::uint32_t seed() const { return seed_; }

    /// Number of draws consumed so far (uniform + normal)
    std::uint64_t drawCount() const { return draws_; }

private:
    std::uint32_t seed_;
    std::uint64_t draws_ = 0;
    std::mt19937 engine_;
    std::uniform_real_distribution<double> uniform_;
    std::normal_distribution<double> normal_;
};

} // namespace GeoProfile

#endif // PROFILE_DOMAIN_HPP
