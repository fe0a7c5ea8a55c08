#ifndef VETSCAN_COLOR_HPP
#define VETSCAN_COLOR_HPP

inline constexpr const char* RESET  = "\033[0m";
inline constexpr const char* RED    = "\033[1;31m";
inline constexpr const char* GREEN  = "\033[1;32m";
inline constexpr const char* YELLOW = "\033[1;33m";
inline constexpr const char* CYAN   = "\033[1;36m";
inline constexpr const char* GRAY   = "\033[0;90m";

#endif // VETSCAN_COLOR_HPP
