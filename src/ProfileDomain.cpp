#include "ProfileDomain.hpp"
#include <stdexcept>
#include <sstream>

namespace GeoProfile {

const char* zoneName(Zone zone) {
    switch (zone) {
        case Zone::HARD_ROCK:         return "hard_rock";
        case Zone::DEEP:              return "deep";
        case Zone::WATER_POCKET_WEST: return "water_pocket_west";
        case Zone::WATER_POCKET_EAST: return "water_pocket_east";
        case Zone::DEEPEST_LAYER:     return "deepest_layer";
        default:                      return "unclassified";
    }
}

// ============================================================================
// ProfileDomain
// ============================================================================

ProfileDomain::ProfileDomain(double xmin, double xmax, double zmin, double zmax)
    : x_min(xmin), x_max(xmax), z_min(zmin), z_max(zmax) {}

ProfileDomain ProfileDomain::fromConfig(const ProfileConfig& config) {
    return ProfileDomain(config.x_min, config.x_max, config.z_min, config.z_max);
}

bool ProfileDomain::contains(double x, double z) const {
    return x >= x_min && x <= x_max && z >= z_min && z <= z_max;
}

void ProfileDomain::validate() const {
    if (!(x_min < x_max) || !(z_min < z_max)) {
        std::ostringstream msg;
        msg << "Invalid profile domain: x=[" << x_min << ", " << x_max
            << "], z=[" << z_min << ", " << z_max << "]";
        throw std::invalid_argument(msg.str());
    }
}

// ============================================================================
// RandomContext
// ============================================================================

RandomContext::RandomContext(std::uint32_t seed)
    : seed_(seed), engine_(seed), uniform_(0.0, 1.0), normal_(0.0, 1.0) {}

double RandomContext::uniform() {
    ++draws_;
    return uniform_(engine_);
}

double RandomContext::uniform(double lo, double hi) {
    return lo + (hi - lo) * uniform();
}

double RandomContext::normal() {
    ++draws_;
    return normal_(engine_);
}

} // namespace GeoProfile
