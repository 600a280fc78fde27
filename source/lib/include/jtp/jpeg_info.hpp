#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>

#include <jtp/util.hpp>

enum class ColorFormat
{
    Grayscale,
    Rgb,
    Cmyk,
};

struct JpegInfo
{
    uint32_t m_Width;
    uint32_t m_Height;
    ColorFormat m_ColorFormat;
};

class JpegInfoError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/*
        Reads the frame header of a jpeg without decoding any pixels
        Throws JpegInfoError when the header can't be decoded, returns std::nullopt when the
        header decodes fine but does not describe an image we can embed
*/
std::optional<JpegInfo> ReadJpegInfo(EncodedImageView jpeg);
