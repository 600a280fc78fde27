#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <vector>

#include <jtp/util.hpp>

class JpegSectionsError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

namespace JpegMarker
{
inline constexpr uint8_t c_StartOfImage{ 0xD8 };
inline constexpr uint8_t c_EndOfImage{ 0xD9 };
inline constexpr uint8_t c_StartOfScan{ 0xDA };
inline constexpr uint8_t c_App1{ 0xE1 };
} // namespace JpegMarker

struct JpegSegment
{
    uint8_t m_Marker;

    // Everything after the length field, empty for markers without a length
    EncodedImage m_Payload;

    bool IsExif() const;
};

/*
        The marker segments of a jpeg file up to the first scan

        Everything starting at the first SOS marker is kept as an opaque block, so
        re-encoding never touches the entropy-coded data. Parsing fails if that block
        has no EOI marker, which catches files cut off inside their scan
*/
class JpegSections
{
  public:
    static JpegSections Parse(EncodedImageView jpeg);

    const std::vector<JpegSegment>& Segments() const;

    // Payload of the first EXIF APP1 segment, including the "Exif\0\0" header
    std::optional<EncodedImageView> Exif() const;

    // Removes all EXIF APP1 segments, returns how many were removed
    size_t RemoveExif();

    EncodedImageView ScanData() const;

    EncodedImage Encode() const;

  private:
    std::vector<JpegSegment> m_Segments;
    EncodedImage m_ScanData;
};
