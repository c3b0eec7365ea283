#pragma once

#include <string_view>

namespace pyro::core {
// ------------------ Version ------------------
inline constexpr std::string_view PYRO_VERSION{"pyro 1.0v"};

inline constexpr unsigned DEFAULT_GRID_WIDTH = 160;
inline constexpr unsigned DEFAULT_GRID_HEIGHT = 90;
inline constexpr unsigned DEFAULT_PIXEL_SIZE = 6;
inline constexpr int DEFAULT_TICK_RATE = 60;
inline constexpr int DEFAULT_FRAME_LIMIT = 120;
inline constexpr int MAX_CATCH_UP_TICKS = 8;  // per frame, excess is dropped
}  // namespace pyro::core
