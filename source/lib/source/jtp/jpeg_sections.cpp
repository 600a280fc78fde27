#include <jtp/jpeg_sections.hpp>

#include <algorithm>
#include <array>

#include <fmt/format.h>

namespace
{
inline constexpr std::array c_ExifHeader{
    std::byte{ 'E' },
    std::byte{ 'x' },
    std::byte{ 'i' },
    std::byte{ 'f' },
    std::byte{ 0x00 },
    std::byte{ 0x00 },
};

inline constexpr std::byte c_MarkerPrefix{ 0xFF };

bool IsStandaloneMarker(uint8_t marker)
{
    // TEM and RST0 to RST7 carry no length field
    return marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7);
}

uint8_t ToUint8(std::byte b)
{
    return std::to_integer<uint8_t>(b);
}

// Entropy-coded data stuffs every 0xFF with 0x00, so the first FF D9 pair is the EOI marker
bool HasEndOfImage(EncodedImageView scan)
{
    const std::array c_EndOfImage{ c_MarkerPrefix, std::byte{ JpegMarker::c_EndOfImage } };
    return !std::ranges::search(scan, c_EndOfImage).empty();
}
} // namespace

bool JpegSegment::IsExif() const
{
    return m_Marker == JpegMarker::c_App1 &&
           m_Payload.size() >= c_ExifHeader.size() &&
           std::ranges::equal(std::span{ m_Payload }.first(c_ExifHeader.size()), c_ExifHeader);
}

JpegSections JpegSections::Parse(EncodedImageView jpeg)
{
    if (jpeg.size() < 2 || jpeg[0] != c_MarkerPrefix || ToUint8(jpeg[1]) != JpegMarker::c_StartOfImage)
    {
        throw JpegSectionsError{ "Missing start of image marker" };
    }

    JpegSections sections{};

    size_t pos{ 2 };
    while (true)
    {
        if (pos >= jpeg.size())
        {
            throw JpegSectionsError{ "Unexpected end of data before start of scan" };
        }

        if (jpeg[pos] != c_MarkerPrefix)
        {
            throw JpegSectionsError{
                fmt::format("Expected marker at offset {} but found 0x{:02x}", pos, ToUint8(jpeg[pos]))
            };
        }

        // Any number of 0xFF fill bytes may precede a marker
        const size_t marker_start{ pos };
        while (pos < jpeg.size() && jpeg[pos] == c_MarkerPrefix)
        {
            ++pos;
        }
        if (pos >= jpeg.size())
        {
            throw JpegSectionsError{ "Unexpected end of data inside marker" };
        }

        const uint8_t marker{ ToUint8(jpeg[pos]) };
        ++pos;

        if (marker == 0x00 || marker == JpegMarker::c_StartOfImage)
        {
            throw JpegSectionsError{
                fmt::format("Invalid marker 0x{:02x} at offset {}", marker, marker_start)
            };
        }

        if (marker == JpegMarker::c_EndOfImage)
        {
            const auto rest{ jpeg.subspan(marker_start) };
            sections.m_ScanData.assign(rest.begin(), rest.end());
            break;
        }

        if (IsStandaloneMarker(marker))
        {
            sections.m_Segments.push_back(JpegSegment{ marker, {} });
            continue;
        }

        if (pos + 2 > jpeg.size())
        {
            throw JpegSectionsError{
                fmt::format("Truncated length of segment 0x{:02x} at offset {}", marker, marker_start)
            };
        }

        const size_t length{
            static_cast<size_t>(ToUint8(jpeg[pos])) << 8 |
            static_cast<size_t>(ToUint8(jpeg[pos + 1]))
        };
        if (length < 2)
        {
            throw JpegSectionsError{
                fmt::format("Invalid length {} of segment 0x{:02x} at offset {}", length, marker, marker_start)
            };
        }
        if (pos + length > jpeg.size())
        {
            throw JpegSectionsError{
                fmt::format("Segment 0x{:02x} at offset {} exceeds the data by {} bytes",
                            marker,
                            marker_start,
                            pos + length - jpeg.size())
            };
        }

        if (marker == JpegMarker::c_StartOfScan)
        {
            if (!HasEndOfImage(jpeg.subspan(pos + length)))
            {
                throw JpegSectionsError{ "Unexpected end of data in scan" };
            }

            const auto rest{ jpeg.subspan(marker_start) };
            sections.m_ScanData.assign(rest.begin(), rest.end());
            break;
        }

        const auto payload{ jpeg.subspan(pos + 2, length - 2) };
        sections.m_Segments.push_back(JpegSegment{
            marker,
            EncodedImage{ payload.begin(), payload.end() },
        });
        pos += length;
    }

    return sections;
}

const std::vector<JpegSegment>& JpegSections::Segments() const
{
    return m_Segments;
}

std::optional<EncodedImageView> JpegSections::Exif() const
{
    const auto it{ std::ranges::find_if(m_Segments, &JpegSegment::IsExif) };
    if (it == m_Segments.end())
    {
        return std::nullopt;
    }
    return EncodedImageView{ it->m_Payload };
}

size_t JpegSections::RemoveExif()
{
    return std::erase_if(m_Segments, [](const JpegSegment& segment)
                         { return segment.IsExif(); });
}

EncodedImageView JpegSections::ScanData() const
{
    return m_ScanData;
}

EncodedImage JpegSections::Encode() const
{
    EncodedImage encoded;
    encoded.reserve(m_ScanData.size() + 2 + m_Segments.size() * 4);

    encoded.push_back(c_MarkerPrefix);
    encoded.push_back(std::byte{ JpegMarker::c_StartOfImage });

    for (const JpegSegment& segment : m_Segments)
    {
        encoded.push_back(c_MarkerPrefix);
        encoded.push_back(std::byte{ segment.m_Marker });
        if (IsStandaloneMarker(segment.m_Marker))
        {
            continue;
        }

        const size_t length{ segment.m_Payload.size() + 2 };
        encoded.push_back(static_cast<std::byte>((length >> 8) & 0xFF));
        encoded.push_back(static_cast<std::byte>(length & 0xFF));
        encoded.insert(encoded.end(), segment.m_Payload.begin(), segment.m_Payload.end());
    }

    encoded.insert(encoded.end(), m_ScanData.begin(), m_ScanData.end());
    return encoded;
}
