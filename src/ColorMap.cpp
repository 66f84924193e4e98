#include "ColorMap.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace GeoProfile {

std::string Color::hex() const {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", r, g, b);
    return std::string(buf);
}

double JetColorMap::channel(const Ramp& ramp, double t) {
    if (t <= ramp.front().first) return ramp.front().second;
    for (size_t k = 1; k < ramp.size(); ++k) {
        if (t <= ramp[k].first) {
            double t0 = ramp[k - 1].first;
            double t1 = ramp[k].first;
            double w = (t - t0) / (t1 - t0);
            return ramp[k - 1].second + w * (ramp[k].second - ramp[k - 1].second);
        }
    }
    return ramp.back().second;
}

Color JetColorMap::getColor(double value) const {
    value = std::max(0.0, std::min(1.0, value));

    static const Ramp red   = {{0.0, 0.0}, {0.35, 0.0}, {0.66, 1.0}, {0.89, 1.0}, {1.0, 0.5}};
    static const Ramp green = {{0.0, 0.0}, {0.125, 0.0}, {0.375, 1.0}, {0.64, 1.0},
                               {0.91, 0.0}, {1.0, 0.0}};
    static const Ramp blue  = {{0.0, 0.5}, {0.11, 1.0}, {0.34, 1.0}, {0.65, 0.0}, {1.0, 0.0}};

    auto to8 = [](double c) {
        return static_cast<unsigned char>(std::lround(255.0 * std::max(0.0, std::min(1.0, c))));
    };

    return Color(to8(channel(red, value)), to8(channel(green, value)), to8(channel(blue, value)));
}

} // namespace GeoProfile
