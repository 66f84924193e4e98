/**
 * @file test_profile_pipeline.cpp
 * @brief End-to-end tests of the sample -> classify -> interpolate -> compose chain
 */

#include <gtest/gtest.h>
#include <petsc.h>
#include "ProfilePipeline.hpp"
#include "GnuplotEncoder.hpp"
#include "ProfileErrors.hpp"
#include <CGAL/Exact_predicates_inexact_constructions_kernel.h>
#include <CGAL/convex_hull_2.h>
#include <CGAL/Polygon_2.h>
#include <cmath>
#include <iterator>
#include <filesystem>
#include <stdexcept>

using namespace GeoProfile;

namespace {

bool sameField(const InterpolatedField& a, const InterpolatedField& b) {
    if (a.values().size() != b.values().size()) return false;
    for (size_t k = 0; k < a.values().size(); ++k) {
        double va = a.values()[k];
        double vb = b.values()[k];
        if (std::isnan(va) != std::isnan(vb)) return false;
        if (!std::isnan(va) && va != vb) return false;
    }
    return true;
}

typedef CGAL::Exact_predicates_inexact_constructions_kernel Kernel;

// Lattice nodes strictly inside the samples' convex hull that hold no value
int undefinedInsideHull(const ProfileRun& run) {
    std::vector<Kernel::Point_2> pts, hull;
    for (const auto& s : run.samples) pts.emplace_back(s.x, s.z);
    CGAL::convex_hull_2(pts.begin(), pts.end(), std::back_inserter(hull));
    CGAL::Polygon_2<Kernel> polygon(hull.begin(), hull.end());

    int missing = 0;
    const InterpolatedField& f = run.field;
    for (int j = 0; j < f.resolution(); ++j) {
        for (int i = 0; i < f.resolution(); ++i) {
            Kernel::Point_2 node(f.xCoord(i), f.zCoord(j));
            if (polygon.bounded_side(node) == CGAL::ON_BOUNDED_SIDE && !f.defined(i, j)) {
                ++missing;
            }
        }
    }
    return missing;
}

} // namespace

class ProfilePipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        MPI_Comm_rank(PETSC_COMM_WORLD, &rank);
    }

    int rank;
};

TEST_F(ProfilePipelineTest, DefaultRun) {
    ProfilePipeline pipeline;
    ProfileRun run = pipeline.run();

    ASSERT_EQ(run.samples.size(), 800u);
    int total = 0;
    for (const auto& zc : run.zone_counts) total += zc.second;
    EXPECT_EQ(total, 800);
    EXPECT_EQ(run.zone_counts.count(Zone::UNCLASSIFIED), 0u);
    EXPECT_GT(run.zone_counts[Zone::HARD_ROCK], 0);
    EXPECT_GT(run.zone_counts[Zone::DEEPEST_LAYER], 0);

    EXPECT_GT(run.triangle_count, 800u);

    EXPECT_EQ(run.field.resolution(), 80);
    EXPECT_GT(run.field.definedCount(), run.field.nodeCount() / 2);
    for (double v : run.field.values()) {
        if (std::isnan(v)) continue;
        EXPECT_GE(v, 55.0);
        EXPECT_LE(v, 1000.0);
    }

    EXPECT_EQ(run.scene.bands().size(), 14u);
    EXPECT_GT(run.scene.polygonCount(), 0u);
    EXPECT_EQ(run.scene.title(), "Earth Depth Profile");
}

TEST_F(ProfilePipelineTest, DeepestLayerValues) {
    ProfileRun run = ProfilePipeline().run();
    for (const auto& s : run.samples) {
        if (s.zone == Zone::DEEPEST_LAYER) {
            EXPECT_GE(s.z, 75.0);
            EXPECT_GE(s.base_value, 600.0);
            EXPECT_LT(s.base_value, 900.0);
        }
    }
}

TEST_F(ProfilePipelineTest, RepeatedRunsIdentical) {
    ProfilePipeline pipeline;
    ProfileRun a = pipeline.run();
    ProfileRun b = pipeline.run();

    ASSERT_EQ(a.samples.size(), b.samples.size());
    for (size_t i = 0; i < a.samples.size(); ++i) {
        EXPECT_EQ(a.samples[i].x, b.samples[i].x);
        EXPECT_EQ(a.samples[i].z, b.samples[i].z);
        EXPECT_EQ(a.samples[i].value, b.samples[i].value);
    }
    EXPECT_EQ(a.triangle_count, b.triangle_count);
    EXPECT_TRUE(sameField(a.field, b.field));
    EXPECT_EQ(a.scene.polygonCount(), b.scene.polygonCount());

    // A second pipeline with the same configuration agrees too
    ProfileRun c = ProfilePipeline(pipeline.config()).run();
    EXPECT_TRUE(sameField(a.field, c.field));
}

TEST_F(ProfilePipelineTest, SeedChangesProfile) {
    ProfileConfig other;
    other.seed = 679;
    ProfileRun a = ProfilePipeline().run();
    ProfileRun b = ProfilePipeline(other).run();
    EXPECT_FALSE(sameField(a.field, b.field));
}

TEST_F(ProfilePipelineTest, GenerateMatchesRun) {
    ProfilePipeline pipeline;
    ChartScene scene = pipeline.generate();
    ProfileRun run = pipeline.run();

    ASSERT_EQ(scene.bands().size(), run.scene.bands().size());
    for (size_t k = 0; k < scene.bands().size(); ++k) {
        EXPECT_EQ(scene.bands()[k].polygons.size(), run.scene.bands()[k].polygons.size());
        EXPECT_EQ(scene.bands()[k].color, run.scene.bands()[k].color);
    }
}

TEST_F(ProfilePipelineTest, ConfiguredLevels) {
    ProfileConfig config;
    config.n_points = 300;
    config.grid_resolution = 30;
    config.value_min = 100.0;
    config.value_max = 900.0;
    config.contour_levels = 9;

    ProfileRun run = ProfilePipeline(config).run();
    ASSERT_EQ(run.scene.levels().size(), 9u);
    EXPECT_DOUBLE_EQ(run.scene.levels().front(), 100.0);
    EXPECT_DOUBLE_EQ(run.scene.levels().back(), 900.0);
    EXPECT_EQ(run.scene.bands().size(), 8u);
    for (double v : run.field.values()) {
        if (std::isnan(v)) continue;
        EXPECT_GE(v, 100.0);
        EXPECT_LE(v, 900.0);
    }
}

TEST_F(ProfilePipelineTest, TooFewSamples) {
    ProfileConfig config;
    config.n_points = 2;
    ProfilePipeline pipeline(config);
    EXPECT_THROW(pipeline.run(), DegenerateInputError);

    config.n_points = -1;
    EXPECT_THROW(ProfilePipeline{config}, std::invalid_argument);
}

TEST_F(ProfilePipelineTest, RenderDefaultProfile) {
    if (rank != 0) return;
    if (!GnuplotEncoder::available("gnuplot")) {
        GTEST_SKIP() << "gnuplot not installed";
    }

    RenderConfig render;
    render.work_dir = std::filesystem::temp_directory_path().string();
    ChartScene scene = ProfilePipeline().generate();

    std::string pdf = GnuplotEncoder(render, OutputFormat::DOCUMENT).encode(scene);
    EXPECT_EQ(pdf.substr(0, 4), "%PDF");

    std::string png = GnuplotEncoder(render, OutputFormat::RASTER).encode(scene);
    EXPECT_EQ(png.substr(0, 4), std::string("\x89PNG", 4));
}

TEST_F(ProfilePipelineTest, HullInteriorFullyDefined) {
    for (unsigned seed : {678u, 1234u, 99u, 2024u}) {
        ProfileConfig config;
        config.seed = seed;
        ProfileRun run = ProfilePipeline(config).run();
        EXPECT_EQ(undefinedInsideHull(run), 0) << "seed " << seed;
    }
}
