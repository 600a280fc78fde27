#include <jtp/exif_orientation.hpp>

#include <libexif/exif-data.h>
#include <libexif/exif-utils.h>

#include <jtp/constants.hpp>
#include <jtp/util/at_scope_exit.hpp>
#include <jtp/util/log.hpp>

namespace
{
bool HasAnyEntries(const ExifData& exif_data)
{
    for (const ExifContent* content : exif_data.ifd)
    {
        if (content != nullptr && content->count > 0)
        {
            return true;
        }
    }
    return false;
}

std::optional<uint32_t> ReadUnsigned(const ExifEntry& entry, ExifByteOrder byte_order)
{
    if (entry.components == 0 || entry.data == nullptr)
    {
        return std::nullopt;
    }

    const auto format_size{ exif_format_get_size(entry.format) };
    if (format_size == 0 || entry.size < format_size)
    {
        return std::nullopt;
    }

    switch (entry.format)
    {
    case EXIF_FORMAT_BYTE:
        return entry.data[0];
    case EXIF_FORMAT_SHORT:
        return exif_get_short(entry.data, byte_order);
    case EXIF_FORMAT_LONG:
        return exif_get_long(entry.data, byte_order);
    default:
        return std::nullopt;
    }
}
} // namespace

uint32_t ResolveOrientation(std::optional<EncodedImageView> exif_segment)
{
    if (!exif_segment.has_value() || exif_segment->empty())
    {
        return c_DefaultOrientation;
    }

    ExifData* exif_data{ exif_data_new() };
    if (exif_data == nullptr)
    {
        LogWarning("Failed allocating exif data, assuming default orientation...");
        return c_DefaultOrientation;
    }
    AtScopeExit unref_exif_data{
        [exif_data]()
        {
            exif_data_unref(exif_data);
        }
    };

    // Otherwise libexif synthesizes mandatory tags that are not actually in the file
    exif_data_unset_option(exif_data, EXIF_DATA_OPTION_FOLLOW_SPECIFICATION);
    exif_data_load_data(exif_data,
                        reinterpret_cast<const unsigned char*>(exif_segment->data()),
                        static_cast<unsigned int>(exif_segment->size()));

    if (!HasAnyEntries(*exif_data))
    {
        LogDebug("Could not parse {} bytes of exif data, assuming default orientation...", exif_segment->size());
        return c_DefaultOrientation;
    }

    const ExifEntry* orientation_entry{
        exif_content_get_entry(exif_data->ifd[EXIF_IFD_0], EXIF_TAG_ORIENTATION)
    };
    if (orientation_entry == nullptr)
    {
        return c_DefaultOrientation;
    }

    const auto orientation{ ReadUnsigned(*orientation_entry, exif_data_get_byte_order(exif_data)) };
    if (!orientation.has_value())
    {
        const char* format_name{ exif_format_get_name(orientation_entry->format) };
        LogDebug("Exif orientation has unexpected format {}, assuming default orientation...",
                 format_name != nullptr ? format_name : "Unknown");
        return c_DefaultOrientation;
    }

    return orientation.value();
}
