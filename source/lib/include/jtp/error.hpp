#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

enum class ErrorCause
{
    ImageInfoDecodeFailure,
    MissingImageInfo,
    ImageSectionsFailure,
    PdfWriteFailure,
};

std::string_view ErrorCauseDescription(ErrorCause cause);

// Thrown by pdf backends when creating or serializing the document fails
class PdfWriteError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

// A failure while putting a single image onto its page, not yet attributed to an index
class PageCompositionError : public std::runtime_error
{
  public:
    PageCompositionError(ErrorCause cause, const std::string& detail);

    ErrorCause Cause() const;

  private:
    ErrorCause m_Cause;
};

class JpegToPdfError : public std::runtime_error
{
  public:
    JpegToPdfError(size_t index, ErrorCause cause, std::string detail);

    // Zero-based index of the offending image, 0 for PdfWriteFailure
    size_t Index() const;
    ErrorCause Cause() const;
    const std::string& Detail() const;

  private:
    size_t m_Index;
    ErrorCause m_Cause;
    std::string m_Detail;
};
