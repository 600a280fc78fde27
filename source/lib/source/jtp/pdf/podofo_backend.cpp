#include <jtp/pdf/podofo_backend.hpp>

#include <podofo/podofo.h>

#include <jtp/constants.hpp>
#include <jtp/error.hpp>
#include <jtp/version.hpp>

#include <jtp/util/at_scope_exit.hpp>
#include <jtp/util/log.hpp>

namespace
{
auto Save(PoDoFo::PdfPainter& painter)
{
    painter.Save();
    return AtScopeExit{
        [&painter]
        {
            painter.Restore();
        }
    };
}

PoDoFo::PdfColorSpace ToPoDoFoColorSpace(ColorFormat color_format)
{
    switch (color_format)
    {
    case ColorFormat::Grayscale:
        return PoDoFo::PdfColorSpace::DeviceGray;
    case ColorFormat::Cmyk:
        return PoDoFo::PdfColorSpace::DeviceCMYK;
    case ColorFormat::Rgb:
    default:
        return PoDoFo::PdfColorSpace::DeviceRGB;
    }
}

PoDoFo::PdfDate ToPoDoFoDate(PdfTimestamp timestamp)
{
    const auto seconds{ std::chrono::duration_cast<std::chrono::seconds>(timestamp.time_since_epoch()) };
    return PoDoFo::PdfDate{ seconds, std::chrono::minutes{ 0 } };
}

template<class FunT>
decltype(auto) RethrowPoDoFoErrors(std::string_view action, FunT&& fun)
{
    try
    {
        return fun();
    }
    catch (const PoDoFo::PdfError& e)
    {
        // Rethrow as a std::exception so the agnostic code can catch it
        throw PdfWriteError{ fmt::format("{}: {}", action, e.what()) };
    }
}
} // namespace

PoDoFoPage::PoDoFoPage(PoDoFo::PdfPage* page,
                       PoDoFo::PdfPainter* painter,
                       PoDoFoDocument* document)
    : m_Page{ page }
    , m_Painter{ painter }
    , m_Document{ document }
{
    m_Painter->SetCanvas(*m_Page, PoDoFo::PdfPainterFlags::NoSaveRestorePrior);
}

void PoDoFoPage::DrawJpegImage(JpegImageData data)
{
    RethrowPoDoFoErrors(
        "failed embedding image",
        [&]()
        {
            auto* image{ m_Document->MakeImage() };

            PoDoFo::PdfImageInfo image_info{};
            image_info.Width = data.m_PixelWidth;
            image_info.Height = data.m_PixelHeight;
            image_info.Filters = PoDoFo::PdfFilterList{ PoDoFo::PdfFilterType::DCTDecode };
            image_info.BitsPerComponent = 8;
            image_info.ColorSpace = ToPoDoFoColorSpace(data.m_ColorFormat);

            image->SetDataRaw(
                PoDoFo::bufferview{
                    reinterpret_cast<const char*>(data.m_Data.data()),
                    data.m_Data.size(),
                },
                image_info);

            // The image is drawn at the origin with its size in points, everything
            // else happens through the transformation matrix
            const auto [a, b, c, d, e, f]{ ComputePlacementMatrix(data.m_Placement) };
            const auto scale{ c_PointsPerInch / data.m_Dpi };

            auto save{ Save(*m_Painter) };
            m_Painter->GraphicsState.SetCurrentMatrix(PoDoFo::Matrix::FromCoefficients(a, b, c, d, e, f));
            m_Painter->DrawImage(*image, 0.0, 0.0, scale, scale);
        });
}

void PoDoFoPage::Finish()
{
    RethrowPoDoFoErrors(
        "failed finishing page",
        [&]()
        {
            m_Painter->FinishDrawing();
        });
}

PoDoFoDocument::PoDoFoDocument(const PdfDocumentInfo& info)
{
    RethrowPoDoFoErrors(
        "failed setting document info",
        [&]()
        {
            auto& metadata{ m_Document.GetMetadata() };
            if (!info.m_Title.empty())
            {
                metadata.SetTitle(PoDoFo::PdfString{ info.m_Title });
            }
            metadata.SetCreationDate(ToPoDoFoDate(info.m_CreationDate));
            metadata.SetModifyDate(ToPoDoFoDate(info.m_ModificationDate));
            metadata.SetProducer(PoDoFo::PdfString{ fmt::format("jpeg2pdf {}", Jpeg2PdfVersion()) });
        });
}

void PoDoFoDocument::ReservePages(size_t pages)
{
    m_Pages.reserve(pages);
    m_Painters.reserve(pages);
    m_Images.reserve(pages);
}

PoDoFoPage* PoDoFoDocument::NextPage(PageSpec page_spec)
{
    return RethrowPoDoFoErrors(
        "failed creating page",
        [&]()
        {
            const unsigned new_page_idx{ static_cast<unsigned>(m_Pages.size()) };
            PoDoFo::PdfPage* page{
                &m_Document.GetPages().CreatePageAt(
                    new_page_idx,
                    PoDoFo::Rect(
                        0.0,
                        0.0,
                        page_spec.m_Width,
                        page_spec.m_Height))
            };

            auto* painter{ m_Painters.emplace_back(new PoDoFo::PdfPainter).get() };

            m_Pages.emplace_back(new PoDoFoPage{ page, painter, this });
            return m_Pages.back().get();
        });
}

void PoDoFoDocument::Write(std::ostream& out)
{
    std::string buffer;
    RethrowPoDoFoErrors(
        "failed serializing document",
        [&]()
        {
            PoDoFo::StringStreamDevice device{ buffer };

            // Dates were set from the document info already, don't let PoDoFo overwrite them
            m_Document.Save(device, PoDoFo::PdfSaveOptions::NoMetadataUpdate);
        });

    LogDebug("Serialized {} pages into {} bytes", m_Pages.size(), buffer.size());

    out.write(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    if (!out)
    {
        throw PdfWriteError{ "failed writing document to output stream" };
    }
}

PoDoFo::PdfImage* PoDoFoDocument::MakeImage()
{
    return m_Images.emplace_back(m_Document.CreateImage()).get();
}
