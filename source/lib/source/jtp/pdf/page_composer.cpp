#include <jtp/pdf/page_composer.hpp>

#include <magic_enum/magic_enum.hpp>

#include <jtp/error.hpp>
#include <jtp/exif_orientation.hpp>
#include <jtp/jpeg_info.hpp>
#include <jtp/jpeg_sections.hpp>
#include <jtp/orientation.hpp>

#include <jtp/pdf/backend.hpp>
#include <jtp/pdf/util.hpp>

#include <jtp/util/log.hpp>

namespace
{
JpegInfo ReadRequiredJpegInfo(EncodedImageView jpeg)
{
    std::optional<JpegInfo> info;
    try
    {
        info = ReadJpegInfo(jpeg);
    }
    catch (const JpegInfoError& e)
    {
        throw PageCompositionError{ ErrorCause::ImageInfoDecodeFailure, e.what() };
    }

    if (!info.has_value())
    {
        throw PageCompositionError{
            ErrorCause::MissingImageInfo,
            "header has no usable dimensions or color format",
        };
    }
    return info.value();
}

JpegSections ReadJpegSections(EncodedImageView jpeg)
{
    try
    {
        return JpegSections::Parse(jpeg);
    }
    catch (const JpegSectionsError& e)
    {
        throw PageCompositionError{ ErrorCause::ImageSectionsFailure, e.what() };
    }
}
} // namespace

void ComposePage(PdfDocument& document, EncodedImageView jpeg, const ComposeOptions& options)
{
    const JpegInfo info{ ReadRequiredJpegInfo(jpeg) };
    JpegSections sections{ ReadJpegSections(jpeg) };

    const Orientation orientation{
        .m_Code{ ResolveOrientation(sections.Exif()) },
        .m_Width{ info.m_Width },
        .m_Height{ info.m_Height },
    };
    if (orientation.m_Code < 1 || orientation.m_Code > 8)
    {
        LogWarning("Ignoring invalid orientation {}, using default orientation...", orientation.m_Code);
    }

    // Only owns data when the EXIF segments are stripped, otherwise the input is embedded
    EncodedImage stripped_jpeg;
    EncodedImageView embedded_jpeg{ jpeg };
    if (options.m_StripExif)
    {
        const size_t removed{ sections.RemoveExif() };
        if (removed > 0)
        {
            stripped_jpeg = sections.Encode();
            embedded_jpeg = stripped_jpeg;
        }
        LogDebug("Stripped {} EXIF segments", removed);
    }

    const PageSpec page_spec{ ComputePageSpec(orientation, options.m_Dpi) };
    const ImagePlacement placement{ ComputeImagePlacement(orientation, options.m_Dpi) };
    LogDebug("{}x{} {} image with orientation {} on {}x{}pt page, offset ({}, {})pt, rotation {}, mirror {}",
             info.m_Width,
             info.m_Height,
             magic_enum::enum_name(info.m_ColorFormat),
             orientation.m_Code,
             page_spec.m_Width,
             page_spec.m_Height,
             placement.m_TranslateX,
             placement.m_TranslateY,
             magic_enum::enum_name(placement.m_Rotation),
             placement.m_ScaleX);

    try
    {
        PdfPage* page{ document.NextPage(page_spec) };
        page->DrawJpegImage(PdfPage::JpegImageData{
            .m_Data{ embedded_jpeg },
            .m_PixelWidth{ info.m_Width },
            .m_PixelHeight{ info.m_Height },
            .m_ColorFormat{ info.m_ColorFormat },
            .m_Placement{ placement },
            .m_Dpi{ options.m_Dpi },
        });
        page->Finish();
    }
    catch (const PdfWriteError& e)
    {
        throw PageCompositionError{ ErrorCause::PdfWriteFailure, e.what() };
    }
}
