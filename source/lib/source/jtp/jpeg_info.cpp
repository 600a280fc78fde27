#include <jtp/jpeg_info.hpp>

#include <csetjmp>
#include <cstdio>

#include <jpeglib.h>

#include <jtp/util/at_scope_exit.hpp>
#include <jtp/util/log.hpp>

namespace
{
struct JpegErrorManager
{
    jpeg_error_mgr m_Base;
    std::jmp_buf m_Jump;
    char m_Message[JMSG_LENGTH_MAX];
};

// libjpeg must not return from error_exit, we jump back into ReadJpegInfo instead
void JumpingErrorExit(j_common_ptr cinfo)
{
    auto* error_manager{ reinterpret_cast<JpegErrorManager*>(cinfo->err) };
    (*cinfo->err->format_message)(cinfo, error_manager->m_Message);
    std::longjmp(error_manager->m_Jump, 1);
}

void DiscardOutputMessage(j_common_ptr /*cinfo*/)
{
}

std::optional<ColorFormat> ColorFormatFromComponents(int num_components)
{
    switch (num_components)
    {
    case 1:
        return ColorFormat::Grayscale;
    case 3:
        return ColorFormat::Rgb;
    case 4:
        return ColorFormat::Cmyk;
    default:
        return std::nullopt;
    }
}
} // namespace

std::optional<JpegInfo> ReadJpegInfo(EncodedImageView jpeg)
{
    if (jpeg.empty())
    {
        throw JpegInfoError{ "Empty jpeg data" };
    }

    jpeg_decompress_struct cinfo{};
    JpegErrorManager error_manager{};
    cinfo.err = jpeg_std_error(&error_manager.m_Base);
    error_manager.m_Base.error_exit = JumpingErrorExit;
    error_manager.m_Base.output_message = DiscardOutputMessage;

    // Destroying a zero-initialized struct is a no-op, so this is safe even if creation fails
    AtScopeExit destroy_decompress{
        [&cinfo]()
        {
            jpeg_destroy_decompress(&cinfo);
        }
    };

    // Nothing with a non-trivial destructor may be created between here and the last libjpeg call
    if (setjmp(error_manager.m_Jump) != 0)
    {
        throw JpegInfoError{ error_manager.m_Message };
    }

    jpeg_create_decompress(&cinfo);
    jpeg_mem_src(&cinfo,
                 reinterpret_cast<const unsigned char*>(jpeg.data()),
                 static_cast<unsigned long>(jpeg.size()));

    if (jpeg_read_header(&cinfo, TRUE) != JPEG_HEADER_OK)
    {
        throw JpegInfoError{ "No image found in jpeg data" };
    }

    const auto color_format{ ColorFormatFromComponents(cinfo.num_components) };
    if (cinfo.image_width == 0 || cinfo.image_height == 0 || !color_format.has_value())
    {
        LogDebug("Jpeg header decoded but unusable: {}x{} pixels, {} components",
                 cinfo.image_width,
                 cinfo.image_height,
                 cinfo.num_components);
        return std::nullopt;
    }

    return JpegInfo{
        static_cast<uint32_t>(cinfo.image_width),
        static_cast<uint32_t>(cinfo.image_height),
        color_format.value(),
    };
}
