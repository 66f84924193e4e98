#ifndef SCENE_ENCODER_HPP
#define SCENE_ENCODER_HPP

#include "ChartScene.hpp"
#include <string>

namespace GeoProfile {

/**
 * @brief Turns a ChartScene into a byte payload
 *
 * Implementations throw RenderingError when encoding fails. The payload is
 * returned as a byte string.
 */
class SceneEncoder {
public:
    virtual ~SceneEncoder() = default;

    virtual std::string encode(const ChartScene& scene) const = 0;

    /// MIME type of the payload, e.g. "application/pdf"
    virtual std::string contentType() const = 0;

    /// Suggested download name
    virtual std::string fileName() const = 0;
};

} // namespace GeoProfile

#endif // SCENE_ENCODER_HPP
