#ifndef CONFIG_READER_HPP
#define CONFIG_READER_HPP

#include "GeoProfile.hpp"
#include <string>
#include <map>
#include <vector>
#include <fstream>
#include <sstream>

namespace GeoProfile {

/**
 * @brief INI-style configuration reader
 *
 * Format:
 *   [SECTION]
 *   key = value      # inline comment
 * Lines starting with '#' or ';' are comments. Keys outside a section are
 * ignored with a warning. Every setting has a default equal to the fixed
 * reproducible constants, so an empty file reproduces the standard chart.
 *
 * Sections: [PROFILE], [RENDER], [SERVER], [OUTPUT]
 */
class ConfigReader {
public:
    struct ValidationResult {
        bool valid;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
    };

    ConfigReader();
    ~ConfigReader() = default;

    // Load configuration file
    bool loadFile(const std::string& filename);

    // =========================================================================
    // Parsing Methods
    // =========================================================================

    /// Fills config from [PROFILE] and [OUTPUT]; returns false if [PROFILE] is absent
    bool parseProfileConfig(ProfileConfig& config) const;
    bool parseRenderConfig(RenderConfig& config) const;
    bool parseServerConfig(ServerConfig& config) const;

    // =========================================================================
    // Value Accessors
    // =========================================================================

    std::string getString(const std::string& section, const std::string& key,
                          const std::string& default_val = "") const;
    int getInt(const std::string& section, const std::string& key,
               int default_val = 0) const;
    double getDouble(const std::string& section, const std::string& key,
                     double default_val = 0.0) const;
    bool getBool(const std::string& section, const std::string& key,
                 bool default_val = false) const;

    // =========================================================================
    // Section/Key Query Methods
    // =========================================================================

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;
    std::vector<std::string> getSections() const;
    std::vector<std::string> getKeys(const std::string& section) const;

    // =========================================================================
    // Utility Methods
    // =========================================================================

    /// Writes a commented config file holding every key at its default
    static bool generateTemplate(const std::string& filename);

    /// Values from filename override the ones already loaded
    bool mergeFile(const std::string& filename);

    /// Range checks on the values as they would be parsed
    ValidationResult validate() const;

    /// Listening ports accepted from the config file and the command line
    static bool validPort(long port) { return port >= 1 && port <= 65535; }

private:
    std::map<std::string, std::map<std::string, std::string>> data;

    std::string trim(const std::string& str) const;
};

} // namespace GeoProfile

#endif // CONFIG_READER_HPP
