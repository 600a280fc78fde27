#include <jtp/pdf/util.hpp>

#include <jtp/constants.hpp>

namespace
{
struct RotationCosSin
{
    double m_Cos;
    double m_Sin;
};

// Exact values, a generic cos/sin would leave tiny residues in the page content
RotationCosSin ExactCosSin(ImageRotation rotation)
{
    switch (rotation)
    {
    case ImageRotation::Degree90:
        return { 0.0, 1.0 };
    case ImageRotation::Degree180:
        return { -1.0, 0.0 };
    case ImageRotation::Degree270:
        return { 0.0, -1.0 };
    case ImageRotation::None:
    default:
        return { 1.0, 0.0 };
    }
}
} // namespace

double PixelsToPoints(uint32_t pixels, double dpi)
{
    return static_cast<double>(pixels) * c_PointsPerInch / dpi;
}

PageSpec ComputePageSpec(const Orientation& orientation, double dpi)
{
    return PageSpec{
        PixelsToPoints(orientation.DisplayWidth(), dpi),
        PixelsToPoints(orientation.DisplayHeight(), dpi),
    };
}

ImagePlacement ComputeImagePlacement(const Orientation& orientation, double dpi)
{
    return ImagePlacement{
        .m_TranslateX{ PixelsToPoints(orientation.TranslateX().value_or(0), dpi) },
        .m_TranslateY{ PixelsToPoints(orientation.TranslateY().value_or(0), dpi) },
        .m_Rotation{ orientation.Rotation() },
        .m_ScaleX{ orientation.MirrorFactor().value_or(1.0) },
        .m_ScaleY{ 1.0 },
    };
}

std::array<double, 6> ComputePlacementMatrix(const ImagePlacement& placement)
{
    const auto [cos, sin]{ ExactCosSin(placement.m_Rotation) };
    const auto& sx{ placement.m_ScaleX };
    const auto& sy{ placement.m_ScaleY };
    return {
        sx * cos,
        sx * sin,
        -sy * sin,
        sy * cos,
        placement.m_TranslateX,
        placement.m_TranslateY,
    };
}
