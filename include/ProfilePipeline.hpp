#ifndef PROFILE_PIPELINE_HPP
#define PROFILE_PIPELINE_HPP

#include "GeoProfile.hpp"
#include "PointCloudSampler.hpp"
#include "ZoneClassifier.hpp"
#include "GridInterpolator.hpp"
#include "ChartComposer.hpp"
#include <map>
#include <vector>

namespace GeoProfile {

/// Everything one generation run produced, stage by stage
struct ProfileRun {
    std::vector<Sample> samples;
    std::map<Zone, int> zone_counts;
    size_t triangle_count;
    InterpolatedField field;
    ChartScene scene;
};

/**
 * @brief Sampler -> classifier -> interpolator -> composer
 *
 * Every call builds its own RandomContext from the configured seed, so
 * concurrent or repeated calls are independent and give identical scenes.
 */
class ProfilePipeline {
public:
    explicit ProfilePipeline(const ProfileConfig& config = ProfileConfig());

    ProfileRun run() const;

    /// Scene only; same result as run().scene
    ChartScene generate() const;

    const ProfileConfig& config() const { return config_; }
    const ProfileDomain& domain() const { return domain_; }

private:
    ProfileConfig config_;
    ProfileDomain domain_;
    PointCloudSampler sampler_;
    ZoneClassifier classifier_;
    GridInterpolator interpolator_;
    ChartComposer composer_;

    static ChartStyle styleFor(const ProfileConfig& config);
    void logRun(const ProfileRun& run, const double* stage_seconds) const;
};

} // namespace GeoProfile

#endif // PROFILE_PIPELINE_HPP
