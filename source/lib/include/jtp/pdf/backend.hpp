#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>

#include <jtp/jpeg_info.hpp>
#include <jtp/util.hpp>

#include <jtp/pdf/util.hpp>

class PdfDocument;

using PdfTimestamp = std::chrono::system_clock::time_point;

struct PdfDocumentInfo
{
    std::string m_Title;
    PdfTimestamp m_CreationDate;
    PdfTimestamp m_ModificationDate;
};

std::unique_ptr<PdfDocument> CreatePdfDocument(const PdfDocumentInfo& info);

class PdfPage
{
  public:
    virtual ~PdfPage() = default;

    struct JpegImageData
    {
        // Embedded as is, only valid for the duration of the call
        EncodedImageView m_Data;
        uint32_t m_PixelWidth;
        uint32_t m_PixelHeight;
        ColorFormat m_ColorFormat;
        ImagePlacement m_Placement;
        double m_Dpi;
    };

    virtual void DrawJpegImage(JpegImageData data) = 0;

    virtual void Finish() = 0;
};

/*
        Backends report any failure with a PdfWriteError
*/
class PdfDocument
{
  public:
    virtual ~PdfDocument() = default;

    virtual void ReservePages(size_t pages) = 0;
    virtual PdfPage* NextPage(PageSpec page_spec) = 0;

    virtual void Write(std::ostream& out) = 0;
};
