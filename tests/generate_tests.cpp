#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include <fmt/format.h>
#include <podofo/podofo.h>

#include <jtp/error.hpp>
#include <jtp/jpeg_sections.hpp>
#include <jtp/version.hpp>

#include <jtp/pdf/backend.hpp>
#include <jtp/pdf/generate.hpp>
#include <jtp/pdf/podofo_backend.hpp>

#include <jtp/util/log.hpp>

#include <test_jpegs.hpp>

class RecordingPage final : public PdfPage
{
  public:
    RecordingPage(PageSpec page_spec)
        : m_PageSpec{ page_spec }
    {
    }

    virtual void DrawJpegImage(JpegImageData data) override
    {
        m_Images.push_back({
            EncodedImage{ data.m_Data.begin(), data.m_Data.end() },
            data,
        });
    }

    virtual void Finish() override
    {
        m_Finished = true;
    }

    struct RecordedImage
    {
        EncodedImage m_Data;
        JpegImageData m_ImageData;
    };

    PageSpec m_PageSpec;
    std::vector<RecordedImage> m_Images;
    bool m_Finished{ false };
};

class RecordingDocument final : public PdfDocument
{
  public:
    virtual void ReservePages(size_t /*pages*/) override
    {
    }

    virtual PdfPage* NextPage(PageSpec page_spec) override
    {
        if (m_FailOnPage.has_value() && m_FailOnPage.value() == m_Pages.size())
        {
            throw PdfWriteError{ "out of paper" };
        }

        m_Pages.push_back(std::make_unique<RecordingPage>(page_spec));
        return m_Pages.back().get();
    }

    virtual void Write(std::ostream& /*out*/) override
    {
        throw std::logic_error{ "RecordingDocument can't be written" };
    }

    std::optional<size_t> m_FailOnPage;
    std::vector<std::unique_ptr<RecordingPage>> m_Pages;
};

std::unique_ptr<PoDoFo::PdfMemDocument> LoadPdf(const std::string& pdf)
{
    auto document{ std::make_unique<PoDoFo::PdfMemDocument>() };
    document->LoadFromBuffer(PoDoFo::bufferview{ pdf.data(), pdf.size() });
    return document;
}

// Resolves the single image XObject drawn on a page
const PoDoFo::PdfObject& GetPageImage(PoDoFo::PdfMemDocument& document, PoDoFo::PdfPage& page)
{
    auto* resources{ page.GetResources() };
    REQUIRE(resources != nullptr);
    const auto* xobjects{ resources->GetDictionary().FindKey("XObject") };
    REQUIRE(xobjects != nullptr);
    REQUIRE(xobjects->IsDictionary());

    const auto& xobject_dict{ xobjects->GetDictionary() };
    REQUIRE(xobject_dict.GetSize() == 1);
    const PoDoFo::PdfObject& entry{ xobject_dict.begin()->second };
    if (!entry.IsReference())
    {
        return entry;
    }

    const auto* image{ document.GetObjects().GetObject(entry.GetReference()) };
    REQUIRE(image != nullptr);
    return *image;
}

// Decoded content of a page, all streams concatenated
std::string GetPageContents(PoDoFo::PdfMemDocument& document, PoDoFo::PdfPage& page)
{
    REQUIRE(page.GetContents() != nullptr);

    std::string contents;
    const auto append_stream{
        [&](const PoDoFo::PdfObject& object)
        {
            const auto* stream{ object.GetStream() };
            REQUIRE(stream != nullptr);
            const auto data{ stream->GetCopy() };
            contents.append(data.data(), data.size());
            contents += '\n';
        }
    };

    const auto& object{ page.GetContents()->GetObject() };
    if (object.IsArray())
    {
        for (const auto& item : object.GetArray())
        {
            const auto* stream_object{ document.GetObjects().GetObject(item.GetReference()) };
            REQUIRE(stream_object != nullptr);
            append_stream(*stream_object);
        }
    }
    else
    {
        append_stream(object);
    }
    return contents;
}

// Operands of every cm operator in a content stream
std::vector<std::array<double, 6>> FindTransforms(const std::string& contents)
{
    std::vector<std::string> tokens;
    std::istringstream stream{ contents };
    for (std::string token; stream >> token;)
    {
        tokens.push_back(std::move(token));
    }

    std::vector<std::array<double, 6>> transforms;
    for (size_t i = 6; i < tokens.size(); i++)
    {
        if (tokens[i] != "cm")
        {
            continue;
        }

        std::array<double, 6> matrix{};
        for (size_t j = 0; j < 6; j++)
        {
            matrix[j] = std::stod(tokens[i - 6 + j]);
        }
        transforms.push_back(matrix);
    }
    return transforms;
}

bool HasTransform(const std::string& contents, const std::array<double, 6>& expected)
{
    return std::ranges::any_of(FindTransforms(contents),
                               [&](const std::array<double, 6>& matrix)
                               {
                                   for (size_t i = 0; i < 6; i++)
                                   {
                                       if (std::abs(matrix[i] - expected[i]) > 1e-6)
                                       {
                                           return false;
                                       }
                                   }
                                   return true;
                               });
}

std::string GetNameKey(const PoDoFo::PdfObject& object, std::string_view key)
{
    const auto* value{ object.GetDictionary().FindKey(key) };
    REQUIRE(value != nullptr);
    if (value->IsArray())
    {
        // A filter list with a single entry
        REQUIRE(value->GetArray().GetSize() == 1);
        value = &value->GetArray()[0];
    }
    REQUIRE(value->IsName());
    return std::string{ value->GetName().GetString() };
}

int64_t GetNumberKey(const PoDoFo::PdfObject& object, std::string_view key)
{
    const auto* value{ object.GetDictionary().FindKey(key) };
    REQUIRE(value != nullptr);
    REQUIRE(value->IsNumber());
    return value->GetNumber();
}

EncodedImageView AsBytes(const std::string& str)
{
    return EncodedImageView{ reinterpret_cast<const std::byte*>(str.data()), str.size() };
}

TEST_CASE("One page per image", "[generate_pages]")
{
    const auto landscape{ EncodeTestJpeg(600, 300) };
    const auto rotated{ WithExifOrientation(EncodeTestJpeg(600, 300, ColorFormat::Grayscale), 6) };
    const auto mirrored{ WithExifOrientation(EncodeTestJpeg(150, 450, ColorFormat::Cmyk), 2) };

    RecordingDocument document;
    JpegToPdf{}
        .AddImage(landscape)
        .AddImages({ rotated, mirrored })
        .Compose(document);

    REQUIRE(document.m_Pages.size() == 3);
    for (const auto& page : document.m_Pages)
    {
        REQUIRE(page->m_Finished);
        REQUIRE(page->m_Images.size() == 1);
    }

    {
        const auto& page{ *document.m_Pages[0] };
        REQUIRE(page.m_PageSpec.m_Width == 144.0);
        REQUIRE(page.m_PageSpec.m_Height == 72.0);

        const auto& image{ page.m_Images[0].m_ImageData };
        REQUIRE(image.m_PixelWidth == 600);
        REQUIRE(image.m_PixelHeight == 300);
        REQUIRE(image.m_ColorFormat == ColorFormat::Rgb);
        REQUIRE(image.m_Dpi == 300.0);
        REQUIRE(image.m_Placement.m_Rotation == ImageRotation::None);
        REQUIRE(image.m_Placement.m_TranslateX == 0.0);
        REQUIRE(image.m_Placement.m_TranslateY == 0.0);
        REQUIRE(image.m_Placement.m_ScaleX == 1.0);
        REQUIRE(image.m_Placement.m_ScaleY == 1.0);
    }

    {
        const auto& page{ *document.m_Pages[1] };
        REQUIRE(page.m_PageSpec.m_Width == 72.0);
        REQUIRE(page.m_PageSpec.m_Height == 144.0);

        const auto& image{ page.m_Images[0].m_ImageData };
        REQUIRE(image.m_PixelWidth == 600);
        REQUIRE(image.m_PixelHeight == 300);
        REQUIRE(image.m_ColorFormat == ColorFormat::Grayscale);
        REQUIRE(image.m_Placement.m_Rotation == ImageRotation::Degree270);
        REQUIRE(image.m_Placement.m_TranslateX == 0.0);
        REQUIRE(image.m_Placement.m_TranslateY == 144.0);
        REQUIRE(image.m_Placement.m_ScaleX == 1.0);
    }

    {
        const auto& page{ *document.m_Pages[2] };
        REQUIRE(page.m_PageSpec.m_Width == 36.0);
        REQUIRE(page.m_PageSpec.m_Height == 108.0);

        const auto& image{ page.m_Images[0].m_ImageData };
        REQUIRE(image.m_ColorFormat == ColorFormat::Cmyk);
        REQUIRE(image.m_Placement.m_Rotation == ImageRotation::None);
        REQUIRE(image.m_Placement.m_TranslateX == 36.0);
        REQUIRE(image.m_Placement.m_ScaleX == -1.0);
    }
}

TEST_CASE("Images are embedded without changes", "[generate_embed_unchanged]")
{
    const auto jpeg{ WithExifOrientation(EncodeTestJpeg(64, 48), 8) };

    RecordingDocument document;
    JpegToPdf{}.AddImage(jpeg).Compose(document);

    REQUIRE(document.m_Pages.size() == 1);
    REQUIRE(document.m_Pages[0]->m_Images[0].m_Data == jpeg);
}

TEST_CASE("Strip exif before embedding", "[generate_strip_exif]")
{
    const auto original{ EncodeTestJpeg(64, 48) };
    const auto jpeg{ WithExifOrientation(original, 6) };

    RecordingDocument document;
    JpegToPdf{}.AddImage(jpeg).StripExif(true).Compose(document);

    REQUIRE(document.m_Pages.size() == 1);
    const auto& page{ *document.m_Pages[0] };
    const auto& embedded{ page.m_Images[0].m_Data };
    REQUIRE(embedded == original);
    REQUIRE(!JpegSections::Parse(embedded).Exif().has_value());
    REQUIRE(JpegSections::Parse(embedded).ScanData().size() == JpegSections::Parse(jpeg).ScanData().size());

    // Orientation is still taken from the exif that was stripped
    REQUIRE(page.m_Images[0].m_ImageData.m_Placement.m_Rotation == ImageRotation::Degree270);
    REQUIRE(page.m_PageSpec.m_Width == 48.0 * 72.0 / 300.0);
}

TEST_CASE("Dpi decides the page size", "[generate_dpi]")
{
    RecordingDocument document;
    JpegToPdf{}.AddImage(EncodeTestJpeg(144, 72)).SetDpi(72.0).Compose(document);

    REQUIRE(document.m_Pages.size() == 1);
    REQUIRE(document.m_Pages[0]->m_PageSpec.m_Width == 144.0);
    REQUIRE(document.m_Pages[0]->m_PageSpec.m_Height == 72.0);
    REQUIRE(document.m_Pages[0]->m_Images[0].m_ImageData.m_Dpi == 72.0);

    JpegToPdf builder{};
    REQUIRE_THROWS_AS(builder.SetDpi(0.0), std::invalid_argument);
    REQUIRE_THROWS_AS(builder.SetDpi(-300.0), std::invalid_argument);
    REQUIRE_THROWS_AS(builder.SetDpi(std::numeric_limits<double>::infinity()), std::invalid_argument);
    REQUIRE_THROWS_AS(builder.SetDpi(std::numeric_limits<double>::quiet_NaN()), std::invalid_argument);
    REQUIRE(builder.Config().m_Dpi == c_DefaultDpi);

    REQUIRE_THROWS_AS(JpegToPdf{ DocumentConfig{ .m_Dpi{ -1.0 } } }, std::invalid_argument);
}

TEST_CASE("Report the failing image", "[generate_errors]")
{
    const auto good{ EncodeTestJpeg(32, 32) };

    SECTION("Undecodable header")
    {
        const auto corrupt{ ToBytes("this is not a jpeg at all") };

        std::ostringstream out;
        try
        {
            JpegToPdf{}.AddImages({ good, good, corrupt, good }).Build(out);
            FAIL("Expected JpegToPdfError");
        }
        catch (const JpegToPdfError& e)
        {
            REQUIRE(e.Index() == 2);
            REQUIRE(e.Cause() == ErrorCause::ImageInfoDecodeFailure);
            REQUIRE(std::string_view{ e.what() }.starts_with("error with JPEG index 2: failed to read image info: "));
        }
        REQUIRE(out.str().empty());
    }

    SECTION("Broken segments after a valid header")
    {
        // libjpeg skips stray bytes in front of a marker, the segment parser does not
        auto corrupt{ good };
        const std::array start_of_scan{ std::byte{ 0xFF }, std::byte{ 0xDA } };
        const auto sos_it{ std::ranges::search(corrupt, start_of_scan).begin() };
        REQUIRE(sos_it != corrupt.end());
        corrupt.insert(sos_it, std::byte{ 0x00 });

        RecordingDocument document;
        try
        {
            JpegToPdf{}.AddImages({ good, corrupt }).Compose(document);
            FAIL("Expected JpegToPdfError");
        }
        catch (const JpegToPdfError& e)
        {
            REQUIRE(e.Index() == 1);
            REQUIRE(e.Cause() == ErrorCause::ImageSectionsFailure);
        }
        REQUIRE(document.m_Pages.size() == 1);
    }

    SECTION("Truncated inside the scan data")
    {
        // The header and all segments are intact, only the entropy-coded data is cut short
        const auto full{ EncodeTestJpeg(256, 256) };
        const EncodedImage truncated{ full.begin(), full.begin() + full.size() * 2 / 3 };

        std::ostringstream out;
        try
        {
            JpegToPdf{}.AddImages({ good, good, truncated }).Build(out);
            FAIL("Expected JpegToPdfError");
        }
        catch (const JpegToPdfError& e)
        {
            REQUIRE(e.Index() == 2);
            REQUIRE(e.Cause() == ErrorCause::ImageSectionsFailure);
        }
        REQUIRE(out.str().empty());
    }

    SECTION("Backend failure while composing")
    {
        RecordingDocument document;
        document.m_FailOnPage = 1;
        try
        {
            JpegToPdf{}.AddImages({ good, good, good }).Compose(document);
            FAIL("Expected JpegToPdfError");
        }
        catch (const JpegToPdfError& e)
        {
            REQUIRE(e.Index() == 1);
            REQUIRE(e.Cause() == ErrorCause::PdfWriteFailure);
            REQUIRE(std::string_view{ e.what() } == "failed to write PDF: out of paper");
        }
    }
}

TEST_CASE("Error messages", "[generate_error_messages]")
{
    const JpegToPdfError sections_error{ 3, ErrorCause::ImageSectionsFailure, "bad marker" };
    REQUIRE(std::string_view{ sections_error.what() } == "error with JPEG index 3: failed to read image sections: bad marker");
    REQUIRE(sections_error.Detail() == "bad marker");

    const JpegToPdfError info_error{ 0, ErrorCause::MissingImageInfo, "no dimensions" };
    REQUIRE(std::string_view{ info_error.what() } == "error with JPEG index 0: unexpectedly failed to read image info: no dimensions");

    const JpegToPdfError write_error{ 0, ErrorCause::PdfWriteFailure, "disk full" };
    REQUIRE(std::string_view{ write_error.what() } == "failed to write PDF: disk full");
}

TEST_CASE("Write a pdf", "[generate_write]")
{
    const auto landscape{ EncodeTestJpeg(600, 300) };
    const auto rotated{ WithExifOrientation(EncodeTestJpeg(600, 300), 6) };
    const auto gray{ EncodeTestJpeg(300, 300, ColorFormat::Grayscale) };

    std::ostringstream out;
    JpegToPdf{}
        .AddImages({ landscape, rotated, gray })
        .SetTitle("Holidays")
        .Build(out);

    const std::string pdf{ out.str() };
    REQUIRE(pdf.starts_with("%PDF-"));
    REQUIRE(ContainsBytes(AsBytes(pdf), landscape));
    REQUIRE(ContainsBytes(AsBytes(pdf), rotated));
    REQUIRE(ContainsBytes(AsBytes(pdf), gray));

    auto document{ LoadPdf(pdf) };
    auto& pages{ document->GetPages() };
    REQUIRE(pages.GetCount() == 3);

    const auto expect_page_size{
        [&](unsigned index, double width, double height)
        {
            const auto media_box{ pages.GetPageAt(index).GetMediaBox() };
            REQUIRE(media_box.Width == width);
            REQUIRE(media_box.Height == height);
        }
    };
    expect_page_size(0, 144.0, 72.0);
    expect_page_size(1, 72.0, 144.0);
    expect_page_size(2, 72.0, 72.0);

    const auto title{ document->GetMetadata().GetTitle() };
    REQUIRE(title.has_value());
    REQUIRE(title->GetString() == "Holidays");
}

TEST_CASE("Written images keep their raw encoding", "[generate_write_images]")
{
    const auto landscape{ EncodeTestJpeg(600, 300) };
    const auto rotated{ WithExifOrientation(EncodeTestJpeg(600, 300, ColorFormat::Grayscale), 6) };
    const auto mirrored{ WithExifOrientation(EncodeTestJpeg(150, 450, ColorFormat::Cmyk), 2) };

    const auto creation_date{ PdfTimestamp{ std::chrono::seconds{ 1600000000 } } };
    const auto modification_date{ PdfTimestamp{ std::chrono::seconds{ 1700000000 } } };

    std::ostringstream out;
    JpegToPdf{}
        .AddImages({ landscape, rotated, mirrored })
        .SetCreationDate(creation_date)
        .SetModificationDate(modification_date)
        .Build(out);

    auto document{ LoadPdf(out.str()) };
    auto& pages{ document->GetPages() };
    REQUIRE(pages.GetCount() == 3);

    struct ExpectedPage
    {
        int64_t m_Width;
        int64_t m_Height;
        std::string_view m_ColorSpace;
        std::array<double, 6> m_Transform;
    };
    const std::array expected_pages{
        ExpectedPage{ 600, 300, "DeviceRGB", { 1.0, 0.0, 0.0, 1.0, 0.0, 0.0 } },
        ExpectedPage{ 600, 300, "DeviceGray", { 0.0, -1.0, 1.0, 0.0, 0.0, 144.0 } },
        ExpectedPage{ 150, 450, "DeviceCMYK", { -1.0, 0.0, 0.0, 1.0, 36.0, 0.0 } },
    };

    for (unsigned i = 0; i < expected_pages.size(); i++)
    {
        const auto& expected{ expected_pages[i] };
        auto& page{ pages.GetPageAt(i) };

        // Raw pixel size even when the page is rotated
        const auto& image{ GetPageImage(*document, page) };
        REQUIRE(GetNameKey(image, "Subtype") == "Image");
        REQUIRE(GetNameKey(image, "Filter") == "DCTDecode");
        REQUIRE(GetNameKey(image, "ColorSpace") == expected.m_ColorSpace);
        REQUIRE(GetNumberKey(image, "BitsPerComponent") == 8);
        REQUIRE(GetNumberKey(image, "Width") == expected.m_Width);
        REQUIRE(GetNumberKey(image, "Height") == expected.m_Height);

        const auto contents{ GetPageContents(*document, page) };
        REQUIRE(contents.find(" cm") != std::string::npos);
        // An identity placement need not show up as its own cm
        if (i != 0)
        {
            REQUIRE(HasTransform(contents, expected.m_Transform));
        }
    }

    auto& metadata{ document->GetMetadata() };
    const auto written_creation_date{ metadata.GetCreationDate() };
    REQUIRE(written_creation_date.has_value());
    REQUIRE(written_creation_date->GetSecondsFromEpoch() == std::chrono::seconds{ 1600000000 });

    const auto written_modification_date{ metadata.GetModifyDate() };
    REQUIRE(written_modification_date.has_value());
    REQUIRE(written_modification_date->GetSecondsFromEpoch() == std::chrono::seconds{ 1700000000 });

    const auto producer{ metadata.GetProducer() };
    REQUIRE(producer.has_value());
    REQUIRE(producer->GetString() == fmt::format("jpeg2pdf {}", Jpeg2PdfVersion()));
}

TEST_CASE("PoDoFo documents are created from document info", "[generate_podofo_document]")
{
    STATIC_REQUIRE(!std::is_convertible_v<const PdfDocumentInfo&, PoDoFoDocument>);

    const PdfDocumentInfo info{
        .m_Title{ "Explicit" },
        .m_CreationDate{ PdfTimestamp{ std::chrono::seconds{ 1700000000 } } },
        .m_ModificationDate{ PdfTimestamp{ std::chrono::seconds{ 1700000000 } } },
    };
    auto document{ CreatePdfDocument(info) };
    REQUIRE(dynamic_cast<PoDoFoDocument*>(document.get()) != nullptr);

    std::ostringstream out;
    document->Write(out);
    REQUIRE(LoadPdf(out.str())->GetPages().GetCount() == 0);
}

TEST_CASE("Write a pdf without exif", "[generate_write_strip_exif]")
{
    const auto original{ EncodeTestJpeg(64, 64) };
    const auto exif_payload{ MakeExifPayload(3) };
    const auto jpeg{ InsertSegment(original, JpegMarker::c_App1, exif_payload) };

    std::ostringstream out;
    JpegToPdf{}.AddImage(jpeg).StripExif(true).Build(out);

    const std::string pdf{ out.str() };
    REQUIRE(ContainsBytes(AsBytes(pdf), original));
    REQUIRE(!ContainsBytes(AsBytes(pdf), exif_payload));
}

TEST_CASE("Building twice gives the same document", "[generate_reproducible]")
{
    const auto date{ PdfTimestamp{ std::chrono::seconds{ 1700000000 } } };
    const JpegToPdf builder{
        JpegToPdf{}
            .AddImages({ EncodeTestJpeg(40, 20), WithExifOrientation(EncodeTestJpeg(20, 40), 7) })
            .SetCreationDate(date)
            .SetModificationDate(date)
    };

    RecordingDocument first;
    RecordingDocument second;
    builder.Compose(first);
    builder.Compose(second);

    REQUIRE(first.m_Pages.size() == second.m_Pages.size());
    for (size_t i = 0; i < first.m_Pages.size(); i++)
    {
        const auto& a{ *first.m_Pages[i] };
        const auto& b{ *second.m_Pages[i] };
        REQUIRE(a.m_PageSpec.m_Width == b.m_PageSpec.m_Width);
        REQUIRE(a.m_PageSpec.m_Height == b.m_PageSpec.m_Height);
        REQUIRE(a.m_Images[0].m_Data == b.m_Images[0].m_Data);
        REQUIRE(a.m_Images[0].m_ImageData.m_Placement.m_Rotation == b.m_Images[0].m_ImageData.m_Placement.m_Rotation);
        REQUIRE(a.m_Images[0].m_ImageData.m_Placement.m_TranslateX == b.m_Images[0].m_ImageData.m_Placement.m_TranslateX);
        REQUIRE(a.m_Images[0].m_ImageData.m_Placement.m_TranslateY == b.m_Images[0].m_ImageData.m_Placement.m_TranslateY);
        REQUIRE(a.m_Images[0].m_ImageData.m_Placement.m_ScaleX == b.m_Images[0].m_ImageData.m_Placement.m_ScaleX);
    }

    std::ostringstream first_out;
    std::ostringstream second_out;
    builder.Build(first_out);
    builder.Build(second_out);
    REQUIRE(LoadPdf(first_out.str())->GetPages().GetCount() == 2);
    REQUIRE(LoadPdf(second_out.str())->GetPages().GetCount() == 2);
}

TEST_CASE("Empty image list", "[generate_empty]")
{
    RecordingDocument document;
    JpegToPdf{}.Compose(document);
    REQUIRE(document.m_Pages.empty());

    std::ostringstream out;
    JpegToPdf{}.Build(out);
    REQUIRE(LoadPdf(out.str())->GetPages().GetCount() == 0);
}

TEST_CASE("Convenience function", "[generate_convenience]")
{
#if defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#endif
    std::ostringstream out;
    CreatePdfFromJpegs({ EncodeTestJpeg(300, 600) }, out, 150.0);
#if defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

    auto document{ LoadPdf(out.str()) };
    REQUIRE(document->GetPages().GetCount() == 1);
    const auto media_box{ document->GetPages().GetPageAt(0).GetMediaBox() };
    REQUIRE(media_box.Width == 144.0);
    REQUIRE(media_box.Height == 288.0);
}

TEST_CASE("Warn about invalid orientations", "[generate_invalid_orientation]")
{
    Log log{ LogFlags::None, Log::c_MainLogName };

    std::vector<std::string> warnings;
    std::vector<std::string> warning_files;
    log.InstallHook(
        [&](const Log::DetailInformation& detail_info, Log::LogLevel level, std::string_view message)
        {
            if (level == Log::LogLevel::Warning)
            {
                warnings.push_back(std::string{ message });
                warning_files.push_back(std::string{ detail_info.m_File });
            }
        });

    RecordingDocument document;
    JpegToPdf{}.AddImage(WithExifOrientation(EncodeTestJpeg(60, 30), 9)).Compose(document);

    REQUIRE(warnings.size() == 1);
    REQUIRE(warnings[0].find("9") != std::string::npos);
    REQUIRE(warning_files[0].ends_with("page_composer.cpp"));

    REQUIRE(document.m_Pages.size() == 1);
    REQUIRE(document.m_Pages[0]->m_PageSpec.m_Width == 60.0 * 72.0 / 300.0);
    REQUIRE(document.m_Pages[0]->m_Images[0].m_ImageData.m_Placement.m_Rotation == ImageRotation::None);
}
