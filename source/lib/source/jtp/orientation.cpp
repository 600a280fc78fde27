#include <jtp/orientation.hpp>

double RotationDegrees(ImageRotation rotation)
{
    switch (rotation)
    {
    case ImageRotation::Degree90:
        return 90.0;
    case ImageRotation::Degree180:
        return 180.0;
    case ImageRotation::Degree270:
        return 270.0;
    case ImageRotation::None:
    default:
        return 0.0;
    }
}

bool Orientation::SwapsDimensions() const
{
    return m_Code >= 5 && m_Code <= 8;
}

uint32_t Orientation::DisplayWidth() const
{
    return SwapsDimensions() ? m_Height : m_Width;
}

uint32_t Orientation::DisplayHeight() const
{
    return SwapsDimensions() ? m_Width : m_Height;
}

std::optional<uint32_t> Orientation::TranslateX() const
{
    switch (m_Code)
    {
    case 2:
    case 3:
        return m_Width;
    case 5:
    case 8:
        return m_Height;
    default:
        return std::nullopt;
    }
}

std::optional<uint32_t> Orientation::TranslateY() const
{
    switch (m_Code)
    {
    case 3:
    case 4:
        return m_Height;
    case 5:
    case 6:
        return m_Width;
    default:
        return std::nullopt;
    }
}

ImageRotation Orientation::Rotation() const
{
    switch (m_Code)
    {
    case 3:
    case 4:
        return ImageRotation::Degree180;
    case 5:
    case 8:
        return ImageRotation::Degree90;
    case 6:
    case 7:
        return ImageRotation::Degree270;
    default:
        return ImageRotation::None;
    }
}

std::optional<double> Orientation::MirrorFactor() const
{
    switch (m_Code)
    {
    case 2:
    case 4:
    case 5:
    case 7:
        return -1.0;
    default:
        return std::nullopt;
    }
}
