#pragma once

#include <memory>
#include <vector>

#include <podofo/main/PdfImage.h>
#include <podofo/main/PdfMemDocument.h>
#include <podofo/main/PdfPainter.h>

#include <jtp/pdf/backend.hpp>

class PoDoFoDocument;

class PoDoFoPage final : public PdfPage
{
    friend class PoDoFoDocument;

  public:
    virtual ~PoDoFoPage() override = default;

    virtual void DrawJpegImage(JpegImageData data) override;

    virtual void Finish() override;

  private:
    PoDoFoPage(PoDoFo::PdfPage* page,
               PoDoFo::PdfPainter* painter,
               PoDoFoDocument* document);

    PoDoFo::PdfPage* m_Page{ nullptr };
    PoDoFo::PdfPainter* m_Painter{ nullptr };
    PoDoFoDocument* m_Document{ nullptr };
};

class PoDoFoDocument final : public PdfDocument
{
  public:
    explicit PoDoFoDocument(const PdfDocumentInfo& info);
    virtual ~PoDoFoDocument() override = default;

    virtual void ReservePages(size_t pages) override;
    virtual PoDoFoPage* NextPage(PageSpec page_spec) override;

    virtual void Write(std::ostream& out) override;

    PoDoFo::PdfImage* MakeImage();

  private:
    PoDoFo::PdfMemDocument m_Document;
    std::vector<std::unique_ptr<PoDoFoPage>> m_Pages;
    std::vector<std::unique_ptr<PoDoFo::PdfPainter>> m_Painters;
    std::vector<std::unique_ptr<PoDoFo::PdfImage>> m_Images;
};
