#ifndef GEOPROFILE_HPP
#define GEOPROFILE_HPP

#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace GeoProfile {

// Forward declarations
class RandomContext;
class PointCloudSampler;
class ZoneClassifier;
class GridInterpolator;
class ChartComposer;
class ChartScene;
class SceneEncoder;

// Zone assigned to a sample by the override chain
enum class Zone {
    UNCLASSIFIED,
    HARD_ROCK,               ///< Above the boundary curve
    DEEP,                    ///< At or below the boundary curve
    WATER_POCKET_WEST,       ///< Low-value pocket, 1.5 < x < 3.5
    WATER_POCKET_EAST,       ///< Low-value pocket, 4.5 < x < 6.0
    DEEPEST_LAYER            ///< z >= 75, supersedes everything above
};

const char* zoneName(Zone zone);

// Output encodings offered by the delivery layer
enum class OutputFormat {
    DOCUMENT,                ///< Vector document (PDF)
    RASTER                   ///< Raster image (PNG)
};

// Fixed constants of the reproducible contract
namespace Defaults {
    constexpr std::uint32_t SEED = 678;
    constexpr int N_POINTS = 800;
    constexpr int GRID_RESOLUTION = 80;
    constexpr double X_MIN = 1.0;
    constexpr double X_MAX = 6.0;
    constexpr double Z_MIN = 0.0;
    constexpr double Z_MAX = 80.0;
    constexpr double VALUE_MIN = 55.0;
    constexpr double VALUE_MAX = 1000.0;
    constexpr int CONTOUR_LEVELS = 15;
    constexpr double POCKET_RETENTION_THRESHOLD = 0.4;
}

// Configuration structures
struct ProfileConfig {
    std::uint32_t seed = Defaults::SEED;
    int n_points = Defaults::N_POINTS;
    int grid_resolution = Defaults::GRID_RESOLUTION;

    double x_min = Defaults::X_MIN;
    double x_max = Defaults::X_MAX;
    double z_min = Defaults::Z_MIN;
    double z_max = Defaults::Z_MAX;

    // Display range; interpolated values are clamped into it
    double value_min = Defaults::VALUE_MIN;
    double value_max = Defaults::VALUE_MAX;
    int contour_levels = Defaults::CONTOUR_LEVELS;

    bool verbose = false;
};

struct RenderConfig {
    std::string gnuplot = "gnuplot";
    std::string work_dir = "/tmp";

    int raster_width = 1200;         // pixels
    int raster_height = 800;
    double page_width_in = 12.0;     // inches
    double page_height_in = 8.0;
    std::string font = "Sans,10";
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 5000;
    std::size_t max_body_bytes = 1 << 20;
    int backlog = 16;
};

} // namespace GeoProfile

#endif // GEOPROFILE_HPP
