#pragma once
#include <cstdint>

// Maps a signal level in mBm (hundredths of a dBm) onto 0-100.
// -40 dBm and above is 100, -100 dBm and below is 0, linear in between.
int signalQuality(int32_t signalMbm);
