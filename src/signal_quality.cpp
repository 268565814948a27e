#include "signal_quality.hpp"
#include <algorithm>
#include <cmath>

int signalQuality(int32_t signalMbm) {
    double dbm = static_cast<double>(signalMbm) / 100.0;
    dbm = std::clamp(dbm, -100.0, -40.0);

    double magnitude = std::abs(dbm + 40.0);
    double quality = std::round(100.0 - (100.0 * magnitude) / 60.0);
    quality = std::clamp(quality, 0.0, 100.0);

    return static_cast<int>(quality);
}
