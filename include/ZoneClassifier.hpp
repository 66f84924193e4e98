#ifndef ZONE_CLASSIFIER_HPP
#define ZONE_CLASSIFIER_HPP

/**
 * @file ZoneClassifier.hpp
 * @brief Zone classification and value synthesis for scatter samples
 *
 * Values are assigned by an ordered chain of rules. Each rule selects the
 * samples it applies to, optionally keeps only a random fraction of them,
 * and overwrites their value with a fresh uniform draw from its band.
 * Later rules override earlier ones; a Gaussian perturbation is added to
 * every sample once the chain has run. Nothing is clipped here.
 */

#include "PointCloudSampler.hpp"
#include <functional>
#include <string>
#include <vector>
#include <map>

namespace GeoProfile {

/**
 * @brief Noisy curve separating the hard-rock regime from the deep regime
 *
 * z_upper(x) = clip(offset + amplitude * sin(x * pi / half_period) + noise_scale * n,
 *                   clip_min, clip_max)
 * with n a standard normal draw per sample.
 */
struct BoundaryCurve {
    double offset = 40.0;
    double amplitude = 15.0;
    double half_period = 2.5;
    double noise_scale = 5.0;
    double clip_min = 25.0;
    double clip_max = 50.0;

    double evaluate(double x, double standard_normal) const;
};

/**
 * @brief One step of the override chain
 */
struct ZoneRule {
    Zone zone;                                   ///< Zone recorded for matching samples
    std::string name;
    std::function<bool(const Sample&)> applies;  ///< Spatial predicate
    double base;                                 ///< Value = base + span * U
    double span;
    double retention_threshold = -1.0;           ///< Keep a match when U > threshold; < 0 keeps all

    bool hasRetention() const { return retention_threshold >= 0.0; }
};

class ZoneClassifier {
public:
    ZoneClassifier();
    ZoneClassifier(const BoundaryCurve& curve, std::vector<ZoneRule> rules,
                   double noise_sigma = 100.0);

    /**
     * @brief Standard chain: boundary split, two water pockets, deepest layer
     *
     * Pocket predicates test the boundary split (z >= boundary_z) rather than
     * the zone left behind by earlier rules.
     */
    static std::vector<ZoneRule> defaultRules(
        double retention_threshold = Defaults::POCKET_RETENTION_THRESHOLD);

    /**
     * @brief Classify samples in place and synthesize their values
     *
     * Draw order: boundary noise for all samples, then each rule in chain
     * order (retention draws for all samples first when the rule has one,
     * then one value draw per kept match), then global noise for all samples.
     */
    void classify(std::vector<Sample>& samples, RandomContext& rng) const;

    const BoundaryCurve& boundary() const { return curve_; }
    const std::vector<ZoneRule>& rules() const { return rules_; }
    double noiseSigma() const { return noise_sigma_; }

    static std::map<Zone, int> countZones(const std::vector<Sample>& samples);

private:
    BoundaryCurve curve_;
    std::vector<ZoneRule> rules_;
    double noise_sigma_;

    void applyRule(const ZoneRule& rule, std::vector<Sample>& samples,
                   RandomContext& rng) const;
};

} // namespace GeoProfile

#endif // ZONE_CLASSIFIER_HPP
