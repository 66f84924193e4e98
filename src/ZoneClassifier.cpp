#include "ZoneClassifier.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace GeoProfile {

double BoundaryCurve::evaluate(double x, double standard_normal) const {
    double z = offset + amplitude * std::sin(x * M_PI / half_period)
             + noise_scale * standard_normal;
    return std::max(clip_min, std::min(clip_max, z));
}

ZoneClassifier::ZoneClassifier()
    : ZoneClassifier(BoundaryCurve(), defaultRules()) {}

ZoneClassifier::ZoneClassifier(const BoundaryCurve& curve, std::vector<ZoneRule> rules,
                               double noise_sigma)
    : curve_(curve), rules_(std::move(rules)), noise_sigma_(noise_sigma) {}

std::vector<ZoneRule> ZoneClassifier::defaultRules(double retention_threshold) {
    std::vector<ZoneRule> rules;

    rules.push_back({Zone::HARD_ROCK, "hard_rock",
                     [](const Sample& s) { return s.z < s.boundary_z; },
                     800.0, 350.0});

    rules.push_back({Zone::DEEP, "deep",
                     [](const Sample& s) { return s.z >= s.boundary_z; },
                     450.0, 250.0});

    rules.push_back({Zone::WATER_POCKET_WEST, "water_pocket_west",
                     [](const Sample& s) {
                         return s.z >= s.boundary_z &&
                                s.x > 1.5 && s.x < 3.5 && s.z > 50.0 && s.z < 70.0;
                     },
                     50.0, 70.0, retention_threshold});

    rules.push_back({Zone::WATER_POCKET_EAST, "water_pocket_east",
                     [](const Sample& s) {
                         return s.z >= s.boundary_z &&
                                s.x > 4.5 && s.x < 6.0 && s.z > 55.0 && s.z < 75.0;
                     },
                     100.0, 100.0, retention_threshold});

    rules.push_back({Zone::DEEPEST_LAYER, "deepest_layer",
                     [](const Sample& s) { return s.z >= 75.0; },
                     600.0, 300.0});

    return rules;
}

void ZoneClassifier::classify(std::vector<Sample>& samples, RandomContext& rng) const {
    for (auto& s : samples) {
        s.boundary_z = curve_.evaluate(s.x, rng.normal());
        s.zone = Zone::UNCLASSIFIED;
        s.base_value = 0.0;
    }

    for (const auto& rule : rules_) {
        applyRule(rule, samples, rng);
    }

    for (auto& s : samples) {
        s.value = s.base_value + noise_sigma_ * rng.normal();
    }
}

void ZoneClassifier::applyRule(const ZoneRule& rule, std::vector<Sample>& samples,
                               RandomContext& rng) const {
    std::vector<char> matched(samples.size(), 0);
    for (size_t i = 0; i < samples.size(); ++i) {
        matched[i] = rule.applies(samples[i]) ? 1 : 0;
    }

    // Retention is drawn for every sample, matching or not
    if (rule.hasRetention()) {
        for (size_t i = 0; i < samples.size(); ++i) {
            double u = rng.uniform();
            if (!(u > rule.retention_threshold)) {
                matched[i] = 0;
            }
        }
    }

    for (size_t i = 0; i < samples.size(); ++i) {
        if (!matched[i]) continue;
        samples[i].base_value = rule.base + rule.span * rng.uniform();
        samples[i].zone = rule.zone;
    }
}

std::map<Zone, int> ZoneClassifier::countZones(const std::vector<Sample>& samples) {
    std::map<Zone, int> counts;
    for (const auto& s : samples) {
        counts[s.zone]++;
    }
    return counts;
}

} // namespace GeoProfile
