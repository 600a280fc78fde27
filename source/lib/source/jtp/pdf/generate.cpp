#include <jtp/pdf/generate.hpp>

#include <cmath>
#include <stdexcept>

#include <fmt/format.h>

#include <jtp/error.hpp>

#include <jtp/pdf/page_composer.hpp>

#include <jtp/util/log.hpp>

namespace
{
void ValidateDpi(double dpi)
{
    if (!std::isfinite(dpi) || dpi <= 0.0)
    {
        throw std::invalid_argument{ fmt::format("dpi has to be a positive number, got {}", dpi) };
    }
}
} // namespace

JpegToPdf::JpegToPdf(DocumentConfig config)
    : m_Config{ std::move(config) }
{
    ValidateDpi(m_Config.m_Dpi);
}

JpegToPdf& JpegToPdf::AddImage(EncodedImage image)
{
    m_Config.m_Images.push_back(std::move(image));
    return *this;
}

JpegToPdf& JpegToPdf::AddImages(std::vector<EncodedImage> images)
{
    m_Config.m_Images.reserve(m_Config.m_Images.size() + images.size());
    for (EncodedImage& image : images)
    {
        m_Config.m_Images.push_back(std::move(image));
    }
    return *this;
}

JpegToPdf& JpegToPdf::SetDpi(double dpi)
{
    ValidateDpi(dpi);
    m_Config.m_Dpi = dpi;
    return *this;
}

JpegToPdf& JpegToPdf::StripExif(bool strip_exif)
{
    m_Config.m_StripExif = strip_exif;
    return *this;
}

JpegToPdf& JpegToPdf::SetTitle(std::string title)
{
    m_Config.m_Title = std::move(title);
    return *this;
}

JpegToPdf& JpegToPdf::SetCreationDate(PdfTimestamp date)
{
    m_Config.m_CreationDate = date;
    return *this;
}

JpegToPdf& JpegToPdf::SetModificationDate(PdfTimestamp date)
{
    m_Config.m_ModificationDate = date;
    return *this;
}

const DocumentConfig& JpegToPdf::Config() const
{
    return m_Config;
}

void JpegToPdf::Compose(PdfDocument& document) const
{
    const ComposeOptions options{
        .m_Dpi{ m_Config.m_Dpi },
        .m_StripExif{ m_Config.m_StripExif },
    };

    document.ReservePages(m_Config.m_Images.size());
    for (size_t i = 0; i < m_Config.m_Images.size(); i++)
    {
        LogInfo("Composing page {} of {}...", i + 1, m_Config.m_Images.size());

        try
        {
            ComposePage(document, m_Config.m_Images[i], options);
        }
        catch (const PageCompositionError& e)
        {
            throw JpegToPdfError{ i, e.Cause(), e.what() };
        }
    }
}

void JpegToPdf::Build(std::ostream& out) const
{
    const auto now{ std::chrono::system_clock::now() };
    const PdfDocumentInfo info{
        .m_Title{ m_Config.m_Title },
        .m_CreationDate{ m_Config.m_CreationDate.value_or(now) },
        .m_ModificationDate{ m_Config.m_ModificationDate.value_or(now) },
    };

    std::unique_ptr<PdfDocument> document;
    try
    {
        document = CreatePdfDocument(info);
    }
    catch (const PdfWriteError& e)
    {
        throw JpegToPdfError{ 0, ErrorCause::PdfWriteFailure, e.what() };
    }

    Compose(*document);

    try
    {
        document->Write(out);
    }
    catch (const PdfWriteError& e)
    {
        throw JpegToPdfError{ 0, ErrorCause::PdfWriteFailure, e.what() };
    }

    LogInfo("Wrote pdf with {} pages", m_Config.m_Images.size());
}

void CreatePdfFromJpegs(std::vector<EncodedImage> images, std::ostream& out, std::optional<double> dpi)
{
    JpegToPdf builder{};
    builder.AddImages(std::move(images));
    if (dpi.has_value())
    {
        builder.SetDpi(dpi.value());
    }
    builder.Build(out);
}
