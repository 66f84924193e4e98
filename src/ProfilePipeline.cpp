#include <petsc.h>
#include "ProfilePipeline.hpp"
#include <chrono>
#include <stdexcept>
#include <utility>

namespace GeoProfile {

ChartStyle ProfilePipeline::styleFor(const ProfileConfig& config) {
    ChartStyle style = ChartStyle::earthDepthProfile();
    style.level_min = config.value_min;
    style.level_max = config.value_max;
    style.level_count = config.contour_levels;
    return style;
}

ProfilePipeline::ProfilePipeline(const ProfileConfig& config)
    : config_(config),
      domain_(ProfileDomain::fromConfig(config)),
      sampler_(domain_),
      classifier_(),
      interpolator_(domain_, config.grid_resolution, config.value_min, config.value_max),
      composer_(styleFor(config)) {
    if (config_.n_points < 0) {
        throw std::invalid_argument("n_points must be non-negative");
    }
}

ProfileRun ProfilePipeline::run() const {
    using Clock = std::chrono::steady_clock;
    double seconds[4] = {0.0, 0.0, 0.0, 0.0};

    RandomContext rng(config_.seed);

    auto t0 = Clock::now();
    std::vector<Sample> samples = sampler_.sample(config_.n_points, rng);
    auto t1 = Clock::now();
    classifier_.classify(samples, rng);
    auto t2 = Clock::now();

    std::vector<Point2> pts;
    pts.reserve(samples.size());
    for (const auto& s : samples) pts.push_back({s.x, s.z});
    DelaunayTriangulation mesh(pts);
    InterpolatedField field = interpolator_.interpolate(samples, mesh);
    auto t3 = Clock::now();

    ChartScene scene = composer_.compose(field);
    auto t4 = Clock::now();

    seconds[0] = std::chrono::duration<double>(t1 - t0).count();
    seconds[1] = std::chrono::duration<double>(t2 - t1).count();
    seconds[2] = std::chrono::duration<double>(t3 - t2).count();
    seconds[3] = std::chrono::duration<double>(t4 - t3).count();

    std::map<Zone, int> counts = ZoneClassifier::countZones(samples);
    ProfileRun result{std::move(samples), std::move(counts), mesh.triangles().size(),
                      std::move(field), std::move(scene)};

    if (config_.verbose) {
        logRun(result, seconds);
    }
    return result;
}

ChartScene ProfilePipeline::generate() const {
    return run().scene;
}

void ProfilePipeline::logRun(const ProfileRun& run, const double* stage_seconds) const {
    PetscPrintf(PETSC_COMM_SELF, "Profile run (seed %u)\n", config_.seed);
    PetscPrintf(PETSC_COMM_SELF, "  Samples: %d\n", static_cast<int>(run.samples.size()));
    for (const auto& zc : run.zone_counts) {
        PetscPrintf(PETSC_COMM_SELF, "    %-20s %d\n", zoneName(zc.first), zc.second);
    }
    PetscPrintf(PETSC_COMM_SELF, "  Triangles: %d\n", static_cast<int>(run.triangle_count));
    PetscPrintf(PETSC_COMM_SELF, "  Defined nodes: %d / %d\n",
                run.field.definedCount(), run.field.nodeCount());
    PetscPrintf(PETSC_COMM_SELF, "  Contour polygons: %d\n",
                static_cast<int>(run.scene.polygonCount()));
    PetscPrintf(PETSC_COMM_SELF, "  Timings: sample %.4f s, classify %.4f s, "
                "interpolate %.4f s, compose %.4f s\n",
                stage_seconds[0], stage_seconds[1], stage_seconds[2], stage_seconds[3]);
}

} // namespace GeoProfile
