#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <jtp/constants.hpp>
#include <jtp/util.hpp>

#include <jtp/pdf/backend.hpp>

struct DocumentConfig
{
    std::vector<EncodedImage> m_Images;
    double m_Dpi{ c_DefaultDpi };
    bool m_StripExif{ false };
    std::string m_Title;

    // Unset dates are taken at the time of building
    std::optional<PdfTimestamp> m_CreationDate;
    std::optional<PdfTimestamp> m_ModificationDate;
};

/*
        Builds a pdf with one page per jpeg, in the order they were added

        Each page is exactly as large as the upright image at the configured dpi and
        the compressed image data is embedded without re-encoding:

            std::ostringstream out;
            JpegToPdf{}
                .AddImage(ReadBinaryFile("a.jpg"))
                .SetDpi(150.0)
                .StripExif(true)
                .Build(out);

        Failures are reported as JpegToPdfError
*/
class JpegToPdf
{
  public:
    JpegToPdf() = default;
    explicit JpegToPdf(DocumentConfig config);

    JpegToPdf& AddImage(EncodedImage image);
    JpegToPdf& AddImages(std::vector<EncodedImage> images);

    // Throws std::invalid_argument unless dpi is finite and positive
    JpegToPdf& SetDpi(double dpi);
    JpegToPdf& StripExif(bool strip_exif);
    JpegToPdf& SetTitle(std::string title);
    JpegToPdf& SetCreationDate(PdfTimestamp date);
    JpegToPdf& SetModificationDate(PdfTimestamp date);

    const DocumentConfig& Config() const;

    // Adds one page per image to the document, does not write it
    void Compose(PdfDocument& document) const;

    // Writes the complete document to out, nothing is written if anything fails
    void Build(std::ostream& out) const;

  private:
    DocumentConfig m_Config;
};

[[deprecated("Use JpegToPdf instead")]] void CreatePdfFromJpegs(std::vector<EncodedImage> images,
                                                                std::ostream& out,
                                                                std::optional<double> dpi = std::nullopt);
