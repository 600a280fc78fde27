#pragma once

#include <array>
#include <cstdint>

#include <jtp/orientation.hpp>

// Page size in points
struct PageSpec
{
    double m_Width;
    double m_Height;
};

// Where the unrotated image of size (width, height) points ends up on its page
struct ImagePlacement
{
    double m_TranslateX{ 0.0 };
    double m_TranslateY{ 0.0 };
    ImageRotation m_Rotation{ ImageRotation::None };
    double m_ScaleX{ 1.0 };
    double m_ScaleY{ 1.0 };
};

double PixelsToPoints(uint32_t pixels, double dpi);

PageSpec ComputePageSpec(const Orientation& orientation, double dpi);
ImagePlacement ComputeImagePlacement(const Orientation& orientation, double dpi);

/*
        Coefficients [a b c d e f] of the pdf transformation matrix that mirrors, then rotates
        and finally translates the image, so that x' = a*x + c*y + e and y' = b*x + d*y + f
*/
std::array<double, 6> ComputePlacementMatrix(const ImagePlacement& placement);
