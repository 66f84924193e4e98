#ifndef COLOR_MAP_HPP
#define COLOR_MAP_HPP

#include <string>
#include <vector>
#include <utility>

namespace GeoProfile {

struct Color {
    unsigned char r, g, b;

    Color(unsigned char red = 0, unsigned char green = 0, unsigned char blue = 0)
        : r(red), g(green), b(blue) {}

    /// "#rrggbb"
    std::string hex() const;

    bool operator==(const Color& o) const { return r == o.r && g == o.g && b == o.b; }
    bool operator!=(const Color& o) const { return !(*this == o); }
};

class ColorMap {
public:
    /// value is normalized to [0, 1]; out-of-range input is clamped
    virtual Color getColor(double value) const = 0;
    virtual ~ColorMap() = default;
};

/**
 * @brief Classic "jet" ramp: dark blue, blue, cyan, yellow, red, dark red
 *
 * Each channel is piecewise linear between fixed breakpoints.
 */
class JetColorMap : public ColorMap {
public:
    Color getColor(double value) const override;

private:
    using Ramp = std::vector<std::pair<double, double>>;
    static double channel(const Ramp& ramp, double t);
};

} // namespace GeoProfile

#endif // COLOR_MAP_HPP
