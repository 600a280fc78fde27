#include <jtp/pdf/backend.hpp>

#include <jtp/pdf/podofo_backend.hpp>

std::unique_ptr<PdfDocument> CreatePdfDocument(const PdfDocumentInfo& info)
{
    return std::make_unique<PoDoFoDocument>(info);
}
