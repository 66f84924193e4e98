/**
 * @file test_zone_classifier.cpp
 * @brief Unit tests for the zone override chain and value synthesis
 */

#include <gtest/gtest.h>
#include "ZoneClassifier.hpp"
#include <cmath>

using namespace GeoProfile;

class ZoneClassifierTest : public ::testing::Test {
protected:
    std::vector<Sample> classified(int n, std::uint32_t seed) {
        PointCloudSampler sampler{ProfileDomain()};
        RandomContext rng(seed);
        auto samples = sampler.sample(n, rng);
        ZoneClassifier().classify(samples, rng);
        return samples;
    }
};

// ============================================================================
// BoundaryCurve
// ============================================================================

TEST_F(ZoneClassifierTest, BoundaryCurveShape) {
    BoundaryCurve curve;
    EXPECT_NEAR(curve.evaluate(2.5, 0.0), 40.0, 1e-12);
    EXPECT_NEAR(curve.evaluate(1.25, 0.0), 50.0, 1e-12);   // 40 + 15, clipped to 50
    EXPECT_NEAR(curve.evaluate(3.75, 0.0), 25.0, 1e-12);   // 40 - 15
    EXPECT_NEAR(curve.evaluate(2.5, 1.0), 45.0, 1e-12);
    EXPECT_DOUBLE_EQ(curve.evaluate(1.25, 10.0), 50.0);
    EXPECT_DOUBLE_EQ(curve.evaluate(3.75, -10.0), 25.0);
}

TEST_F(ZoneClassifierTest, BoundaryDepthWithinClip) {
    auto samples = classified(2000, 678);
    for (const auto& s : samples) {
        EXPECT_GE(s.boundary_z, 25.0);
        EXPECT_LE(s.boundary_z, 50.0);
    }
}

// ============================================================================
// Override chain
// ============================================================================

TEST_F(ZoneClassifierTest, DefaultChainOrder) {
    auto rules = ZoneClassifier::defaultRules();
    ASSERT_EQ(rules.size(), 5u);
    EXPECT_EQ(rules[0].zone, Zone::HARD_ROCK);
    EXPECT_EQ(rules[1].zone, Zone::DEEP);
    EXPECT_EQ(rules[2].zone, Zone::WATER_POCKET_WEST);
    EXPECT_EQ(rules[3].zone, Zone::WATER_POCKET_EAST);
    EXPECT_EQ(rules[4].zone, Zone::DEEPEST_LAYER);

    EXPECT_FALSE(rules[0].hasRetention());
    EXPECT_TRUE(rules[2].hasRetention());
    EXPECT_DOUBLE_EQ(rules[2].retention_threshold, 0.4);
    EXPECT_TRUE(rules[3].hasRetention());
    EXPECT_FALSE(rules[4].hasRetention());
}

TEST_F(ZoneClassifierTest, EverySampleClassified) {
    auto samples = classified(1000, 678);
    auto counts = ZoneClassifier::countZones(samples);
    EXPECT_EQ(counts.count(Zone::UNCLASSIFIED), 0u);

    int total = 0;
    for (const auto& c : counts) total += c.second;
    EXPECT_EQ(total, 1000);
}

TEST_F(ZoneClassifierTest, DeepestLayerTakesPrecedence) {
    auto samples = classified(5000, 678);
    int deepest = 0;
    for (const auto& s : samples) {
        if (s.z >= 75.0) {
            ++deepest;
            EXPECT_EQ(s.zone, Zone::DEEPEST_LAYER);
            EXPECT_GE(s.base_value, 600.0);
            EXPECT_LT(s.base_value, 900.0);
        }
    }
    EXPECT_GT(deepest, 0);
}

TEST_F(ZoneClassifierTest, HardRockAboveBoundary) {
    auto samples = classified(3000, 11);
    for (const auto& s : samples) {
        if (s.z < s.boundary_z) {
            EXPECT_EQ(s.zone, Zone::HARD_ROCK);
            EXPECT_GE(s.base_value, 800.0);
            EXPECT_LT(s.base_value, 1150.0);
        }
    }
}

TEST_F(ZoneClassifierTest, DeepValuesOutsidePockets) {
    auto samples = classified(3000, 12);
    for (const auto& s : samples) {
        if (s.zone == Zone::DEEP) {
            EXPECT_GE(s.z, s.boundary_z);
            EXPECT_LT(s.z, 75.0);
            EXPECT_GE(s.base_value, 450.0);
            EXPECT_LT(s.base_value, 700.0);
        }
    }
}

TEST_F(ZoneClassifierTest, PocketValuesAndRegions) {
    auto samples = classified(20000, 678);
    int west = 0, east = 0;
    for (const auto& s : samples) {
        if (s.zone == Zone::WATER_POCKET_WEST) {
            ++west;
            EXPECT_GT(s.x, 1.5);
            EXPECT_LT(s.x, 3.5);
            EXPECT_GT(s.z, 50.0);
            EXPECT_LT(s.z, 70.0);
            EXPECT_GE(s.base_value, 50.0);
            EXPECT_LT(s.base_value, 120.0);
        } else if (s.zone == Zone::WATER_POCKET_EAST) {
            ++east;
            EXPECT_GT(s.x, 4.5);
            EXPECT_LT(s.x, 6.0);
            EXPECT_GT(s.z, 55.0);
            EXPECT_LT(s.z, 75.0);
            EXPECT_GE(s.base_value, 100.0);
            EXPECT_LT(s.base_value, 200.0);
        }
    }
    EXPECT_GT(west, 0);
    EXPECT_GT(east, 0);
}

TEST_F(ZoneClassifierTest, PocketRetentionRate) {
    auto samples = classified(20000, 678);

    int west_candidates = 0, west_kept = 0;
    int east_candidates = 0, east_kept = 0;
    for (const auto& s : samples) {
        bool deep = s.z >= s.boundary_z;
        if (deep && s.x > 1.5 && s.x < 3.5 && s.z > 50.0 && s.z < 70.0) {
            ++west_candidates;
            if (s.zone == Zone::WATER_POCKET_WEST) ++west_kept;
        }
        if (deep && s.x > 4.5 && s.x < 6.0 && s.z > 55.0 && s.z < 75.0) {
            ++east_candidates;
            if (s.zone == Zone::WATER_POCKET_EAST) ++east_kept;
        }
    }

    ASSERT_GT(west_candidates, 1000);
    ASSERT_GT(east_candidates, 1000);
    EXPECT_NEAR(static_cast<double>(west_kept) / west_candidates, 0.6, 0.05);
    EXPECT_NEAR(static_cast<double>(east_kept) / east_candidates, 0.6, 0.05);
}

TEST_F(ZoneClassifierTest, DrawOrderConsumption) {
    const int n = 1500;
    PointCloudSampler sampler{ProfileDomain()};
    RandomContext rng(678);
    auto samples = sampler.sample(n, rng);
    ZoneClassifier().classify(samples, rng);

    auto counts = ZoneClassifier::countZones(samples);
    // sampler 2N, boundary N, split N, two retention passes 2N, noise N,
    // plus one value draw per pocket or deepest-layer sample
    std::uint64_t expected = 7u * n + counts[Zone::WATER_POCKET_WEST] +
                             counts[Zone::WATER_POCKET_EAST] + counts[Zone::DEEPEST_LAYER];
    EXPECT_EQ(rng.drawCount(), expected);
}

TEST_F(ZoneClassifierTest, ValuesAreNotClipped) {
    auto samples = classified(2000, 678);
    bool above = false;
    for (const auto& s : samples) {
        if (s.value > 1000.0) above = true;
    }
    EXPECT_TRUE(above);
}

TEST_F(ZoneClassifierTest, Deterministic) {
    auto a = classified(800, 678);
    auto b = classified(800, 678);
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].zone, b[i].zone);
        EXPECT_EQ(a[i].value, b[i].value);
    }
}

// ============================================================================
// Custom chains
// ============================================================================

TEST_F(ZoneClassifierTest, LastMatchingRuleWins) {
    std::vector<ZoneRule> rules;
    rules.push_back({Zone::HARD_ROCK, "first", [](const Sample&) { return true; }, 1.0, 0.0});
    rules.push_back({Zone::DEEP, "second", [](const Sample&) { return true; }, 2.0, 0.0});
    rules.push_back({Zone::DEEPEST_LAYER, "never", [](const Sample&) { return false; }, 3.0, 0.0});
    ZoneClassifier classifier(BoundaryCurve(), rules, 0.0);

    PointCloudSampler sampler{ProfileDomain()};
    RandomContext rng(3);
    auto samples = sampler.sample(100, rng);
    classifier.classify(samples, rng);

    for (const auto& s : samples) {
        EXPECT_EQ(s.zone, Zone::DEEP);
        EXPECT_DOUBLE_EQ(s.base_value, 2.0);
        EXPECT_DOUBLE_EQ(s.value, 2.0);
    }
}

TEST_F(ZoneClassifierTest, RetentionZeroKeepsAlmostAll) {
    std::vector<ZoneRule> rules;
    rules.push_back({Zone::DEEP, "all", [](const Sample&) { return true; }, 5.0, 0.0, 0.0});
    ZoneClassifier classifier(BoundaryCurve(), rules, 0.0);

    PointCloudSampler sampler{ProfileDomain()};
    RandomContext rng(8);
    auto samples = sampler.sample(500, rng);
    classifier.classify(samples, rng);

    auto counts = ZoneClassifier::countZones(samples);
    EXPECT_GE(counts[Zone::DEEP], 499);
}

TEST_F(ZoneClassifierTest, ZoneNames) {
    EXPECT_STREQ(zoneName(Zone::HARD_ROCK), "hard_rock");
    EXPECT_STREQ(zoneName(Zone::DEEPEST_LAYER), "deepest_layer");
    EXPECT_STREQ(zoneName(Zone::UNCLASSIFIED), "unclassified");
}
