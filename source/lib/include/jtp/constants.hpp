#pragma once

#include <array>
#include <cstdint>
#include <string_view>

#include <jtp/util.hpp>

inline constexpr double c_DefaultDpi{ 300.0 };
inline constexpr double c_PointsPerInch{ 72.0 };

// EXIF orientation 1, pixels are stored the way they are meant to be displayed
inline constexpr uint32_t c_DefaultOrientation{ 1 };

inline constexpr std::string_view c_DefaultConfigFile{ "jpeg2pdf.json" };

inline const std::array g_JpegExtensions{
    ".jpg"_p,
    ".jpeg"_p,
};
