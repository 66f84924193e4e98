#include "ConfigReader.hpp"
#include <iostream>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace GeoProfile {

ConfigReader::ConfigReader() {}

bool ConfigReader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open configuration file: " << filename << std::endl;
        return false;
    }

    std::string current_section;
    std::string line;
    int line_num = 0;

    while (std::getline(file, line)) {
        line_num++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header [SECTION]
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            std::cerr << "Warning: Invalid line " << line_num << ": " << line << std::endl;
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove inline comments
        size_t comment_pos = value.find('#');
        if (comment_pos != std::string::npos) {
            value = trim(value.substr(0, comment_pos));
        }

        if (current_section.empty()) {
            std::cerr << "Warning: Key without section at line " << line_num << std::endl;
            continue;
        }

        data[current_section][key] = value;
    }

    return true;
}

std::string ConfigReader::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

// =============================================================================
// Value Accessors
// =============================================================================

std::string ConfigReader::getString(const std::string& section, const std::string& key,
                                    const std::string& default_val) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return default_val;

    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) return default_val;

    return key_it->second;
}

int ConfigReader::getInt(const std::string& section, const std::string& key,
                         int default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse [" << section << "] " << key << " = '"
                  << val << "' as integer, using " << default_val << std::endl;
        return default_val;
    }
}

double ConfigReader::getDouble(const std::string& section, const std::string& key,
                               double default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stod(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse [" << section << "] " << key << " = '"
                  << val << "' as number, using " << default_val << std::endl;
        return default_val;
    }
}

bool ConfigReader::getBool(const std::string& section, const std::string& key,
                           bool default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    std::transform(val.begin(), val.end(), val.begin(), ::tolower);

    if (val == "true" || val == "yes" || val == "1" || val == "on") return true;
    if (val == "false" || val == "no" || val == "0" || val == "off") return false;

    std::cerr << "Warning: Cannot parse [" << section << "] " << key << " = '"
              << val << "' as boolean" << std::endl;
    return default_val;
}

// =============================================================================
// Section/Key Queries
// =============================================================================

bool ConfigReader::hasSection(const std::string& section) const {
    return data.find(section) != data.end();
}

bool ConfigReader::hasKey(const std::string& section, const std::string& key) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return false;
    return sec_it->second.find(key) != sec_it->second.end();
}

std::vector<std::string> ConfigReader::getSections() const {
    std::vector<std::string> sections;
    for (const auto& pair : data) {
        sections.push_back(pair.first);
    }
    return sections;
}

std::vector<std::string> ConfigReader::getKeys(const std::string& section) const {
    std::vector<std::string> keys;
    auto sec_it = data.find(section);
    if (sec_it != data.end()) {
        for (const auto& pair : sec_it->second) {
            keys.push_back(pair.first);
        }
    }
    return keys;
}

// =============================================================================
// Section Parsers
// =============================================================================

bool ConfigReader::parseProfileConfig(ProfileConfig& config) const {
    // [OUTPUT] applies even without a [PROFILE] section
    config.verbose = getBool("OUTPUT", "verbose", config.verbose);

    if (!hasSection("PROFILE")) return false;

    int seed = getInt("PROFILE", "seed", static_cast<int>(config.seed));
    if (seed < 0) {
        std::cerr << "Warning: Negative seed " << seed << ", using "
                  << config.seed << std::endl;
    } else {
        config.seed = static_cast<std::uint32_t>(seed);
    }

    config.n_points = getInt("PROFILE", "n_points", config.n_points);
    config.grid_resolution = getInt("PROFILE", "grid_resolution", config.grid_resolution);

    config.x_min = getDouble("PROFILE", "x_min", config.x_min);
    config.x_max = getDouble("PROFILE", "x_max", config.x_max);
    config.z_min = getDouble("PROFILE", "z_min", config.z_min);
    config.z_max = getDouble("PROFILE", "z_max", config.z_max);

    config.value_min = getDouble("PROFILE", "value_min", config.value_min);
    config.value_max = getDouble("PROFILE", "value_max", config.value_max);
    config.contour_levels = getInt("PROFILE", "contour_levels", config.contour_levels);

    return true;
}

bool ConfigReader::parseRenderConfig(RenderConfig& config) const {
    if (!hasSection("RENDER")) return false;

    config.gnuplot = getString("RENDER", "gnuplot", config.gnuplot);
    config.work_dir = getString("RENDER", "work_dir", config.work_dir);
    config.raster_width = getInt("RENDER", "raster_width", config.raster_width);
    config.raster_height = getInt("RENDER", "raster_height", config.raster_height);
    config.page_width_in = getDouble("RENDER", "page_width_in", config.page_width_in);
    config.page_height_in = getDouble("RENDER", "page_height_in", config.page_height_in);
    config.font = getString("RENDER", "font", config.font);

    return true;
}

bool ConfigReader::parseServerConfig(ServerConfig& config) const {
    if (!hasSection("SERVER")) return false;

    config.host = getString("SERVER", "host", config.host);
    config.port = getInt("SERVER", "port", config.port);
    config.backlog = getInt("SERVER", "backlog", config.backlog);

    int max_body = getInt("SERVER", "max_body_bytes", static_cast<int>(config.max_body_bytes));
    if (max_body > 0) {
        config.max_body_bytes = static_cast<std::size_t>(max_body);
    } else {
        std::cerr << "Warning: max_body_bytes must be positive, using "
                  << config.max_body_bytes << std::endl;
    }

    return true;
}

// =============================================================================
// Template Generation
// =============================================================================

bool ConfigReader::generateTemplate(const std::string& filename) {
    std::ofstream file(filename);
    if (!file) {
        std::cerr << "Error: Cannot write template: " << filename << std::endl;
        return false;
    }

    ProfileConfig profile;
    RenderConfig render;
    ServerConfig server;

    file << "# GeoProfile Configuration File\n";
    file << "#\n";
    file << "# Lines starting with # or ; are comments\n";
    file << "# Format: key = value\n";
    file << "# The values below are the defaults; an empty file gives the same chart.\n\n";

    file << "[PROFILE]\n";
    file << "seed = " << profile.seed << "                            # Random stream seed\n";
    file << "n_points = " << profile.n_points << "                        # Scatter samples\n";
    file << "grid_resolution = " << profile.grid_resolution
         << "                  # Lattice nodes per axis\n\n";

    file << "# Domain: surface position x, depth z\n";
    file << "x_min = " << profile.x_min << "\n";
    file << "x_max = " << profile.x_max << "\n";
    file << "z_min = " << profile.z_min << "\n";
    file << "z_max = " << profile.z_max << "\n\n";

    file << "# Display range and contour levels\n";
    file << "value_min = " << profile.value_min << "\n";
    file << "value_max = " << profile.value_max << "\n";
    file << "contour_levels = " << profile.contour_levels << "\n\n";

    file << "[RENDER]\n";
    file << "gnuplot = " << render.gnuplot << "                      # Executable or full path\n";
    file << "work_dir = " << render.work_dir << "                        # Scratch space for plots\n";
    file << "raster_width = " << render.raster_width << "                    # PNG pixels\n";
    file << "raster_height = " << render.raster_height << "\n";
    file << "page_width_in = " << render.page_width_in << "                     # PDF inches\n";
    file << "page_height_in = " << render.page_height_in << "\n";
    file << "font = " << render.font << "\n\n";

    file << "[SERVER]\n";
    file << "host = " << server.host << "\n";
    file << "port = " << server.port << "\n";
    file << "max_body_bytes = " << server.max_body_bytes << "              # Larger bodies get 413\n";
    file << "backlog = " << server.backlog << "\n\n";

    file << "[OUTPUT]\n";
    file << "verbose = false                      # Stage timings and statistics\n";

    return static_cast<bool>(file);
}

// =============================================================================
// Utility Methods
// =============================================================================

bool ConfigReader::mergeFile(const std::string& filename) {
    ConfigReader other;
    if (!other.loadFile(filename)) {
        return false;
    }

    // Values from the other file override existing ones
    for (const auto& section : other.data) {
        for (const auto& key_val : section.second) {
            data[section.first][key_val.first] = key_val.second;
        }
    }

    return true;
}

ConfigReader::ValidationResult ConfigReader::validate() const {
    ValidationResult result;
    result.valid = true;

    auto fail = [&result](const std::string& msg) {
        result.errors.push_back(msg);
        result.valid = false;
    };

    if (!hasSection("PROFILE")) {
        result.warnings.push_back("No [PROFILE] section found - using defaults");
    }

    ProfileConfig profile;
    parseProfileConfig(profile);

    if (profile.n_points < 3) {
        fail("n_points must be at least 3");
    }
    if (profile.grid_resolution < 2) {
        fail("grid_resolution must be at least 2");
    }
    if (!(profile.x_min < profile.x_max)) {
        fail("x_min must be less than x_max");
    }
    if (!(profile.z_min < profile.z_max)) {
        fail("z_min must be less than z_max");
    }
    if (!(profile.value_min < profile.value_max)) {
        fail("value_min must be less than value_max");
    }
    if (profile.contour_levels < 2) {
        fail("contour_levels must be at least 2");
    }

    RenderConfig render;
    parseRenderConfig(render);
    if (render.raster_width <= 0 || render.raster_height <= 0) {
        fail("raster_width and raster_height must be positive");
    }
    if (render.page_width_in <= 0.0 || render.page_height_in <= 0.0) {
        fail("page_width_in and page_height_in must be positive");
    }
    if (render.gnuplot.empty()) {
        fail("gnuplot executable must not be empty");
    }

    ServerConfig server;
    parseServerConfig(server);
    if (!validPort(server.port)) {
        fail("port must be in 1..65535");
    }
    if (server.backlog < 1) {
        result.warnings.push_back("backlog < 1 - the listener will use the system minimum");
    }

    // Warn about keys nothing reads
    static const std::map<std::string, std::vector<std::string>> known = {
        {"PROFILE", {"seed", "n_points", "grid_resolution", "x_min", "x_max", "z_min",
                     "z_max", "value_min", "value_max", "contour_levels"}},
        {"RENDER",  {"gnuplot", "work_dir", "raster_width", "raster_height",
                     "page_width_in", "page_height_in", "font"}},
        {"SERVER",  {"host", "port", "max_body_bytes", "backlog"}},
        {"OUTPUT",  {"verbose"}}
    };
    for (const auto& section : data) {
        auto it = known.find(section.first);
        if (it == known.end()) {
            result.warnings.push_back("Unknown section [" + section.first + "]");
            continue;
        }
        for (const auto& key_val : section.second) {
            if (std::find(it->second.begin(), it->second.end(), key_val.first) ==
                it->second.end()) {
                result.warnings.push_back("Unknown key '" + key_val.first + "' in [" +
                                          section.first + "]");
            }
        }
    }

    return result;
}

} // namespace GeoProfile
