#pragma once

#include <FL/Fl.H>

namespace ThemeColors {
constexpr Fl_Color BG_PRIMARY = 0x1a1a1eFF;
constexpr Fl_Color BG_SECONDARY = 0x121214FF;
constexpr Fl_Color BG_ROW_ALT = 0x202024FF;
constexpr Fl_Color BG_STICKY = 0x333338FF;

constexpr Fl_Color TEXT_NORMAL = 0xDCDCDCFF;
constexpr Fl_Color TEXT_MUTED = 0x949ba4FF;

constexpr Fl_Color BRAND_PRIMARY = 0x5865F2FF;
constexpr Fl_Color SEPARATOR = 0x252529FF;

inline constexpr unsigned char red(Fl_Color color) { return (color >> 24) & 0xFF; }
inline constexpr unsigned char green(Fl_Color color) { return (color >> 16) & 0xFF; }
inline constexpr unsigned char blue(Fl_Color color) { return (color >> 8) & 0xFF; }
} // namespace ThemeColors

void init_theme();
