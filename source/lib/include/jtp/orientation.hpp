#pragma once

#include <cstdint>
#include <optional>

#include <jtp/constants.hpp>

// Counter-clockwise rotation in pdf user space
enum class ImageRotation
{
    None,
    Degree90,
    Degree180,
    Degree270,
};

double RotationDegrees(ImageRotation rotation);

/*
        EXIF orientation of an image together with its stored pixel dimensions

        The orientation records how the camera was held, the pixels are always stored
        unrotated, so instead of touching the pixels we describe the transform that
        places the stored image upright on a page:

            page_position = translation + rotate(mirror(image_position))

        Any code outside of [1, 8] behaves like c_DefaultOrientation
*/
struct Orientation
{
    uint32_t m_Code{ c_DefaultOrientation };
    uint32_t m_Width{ 0 };
    uint32_t m_Height{ 0 };

    bool SwapsDimensions() const;

    uint32_t DisplayWidth() const;
    uint32_t DisplayHeight() const;

    std::optional<uint32_t> TranslateX() const;
    std::optional<uint32_t> TranslateY() const;

    ImageRotation Rotation() const;

    // Horizontal scale applied before rotating, -1 when mirrored
    std::optional<double> MirrorFactor() const;
};
