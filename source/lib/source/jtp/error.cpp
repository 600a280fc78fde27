#include <jtp/error.hpp>

#include <fmt/format.h>

namespace
{
std::string FormatErrorMessage(size_t index, ErrorCause cause, std::string_view detail)
{
    if (cause == ErrorCause::PdfWriteFailure)
    {
        return fmt::format("{}: {}", ErrorCauseDescription(cause), detail);
    }
    return fmt::format("error with JPEG index {}: {}: {}", index, ErrorCauseDescription(cause), detail);
}
} // namespace

std::string_view ErrorCauseDescription(ErrorCause cause)
{
    switch (cause)
    {
    case ErrorCause::ImageInfoDecodeFailure:
        return "failed to read image info";
    case ErrorCause::MissingImageInfo:
        return "unexpectedly failed to read image info";
    case ErrorCause::ImageSectionsFailure:
        return "failed to read image sections";
    case ErrorCause::PdfWriteFailure:
        return "failed to write PDF";
    }
    return "unknown error";
}

PageCompositionError::PageCompositionError(ErrorCause cause, const std::string& detail)
    : std::runtime_error{ detail }
    , m_Cause{ cause }
{
}

ErrorCause PageCompositionError::Cause() const
{
    return m_Cause;
}

JpegToPdfError::JpegToPdfError(size_t index, ErrorCause cause, std::string detail)
    : std::runtime_error{ FormatErrorMessage(index, cause, detail) }
    , m_Index{ index }
    , m_Cause{ cause }
    , m_Detail{ std::move(detail) }
{
}

size_t JpegToPdfError::Index() const
{
    return m_Index;
}

ErrorCause JpegToPdfError::Cause() const
{
    return m_Cause;
}

const std::string& JpegToPdfError::Detail() const
{
    return m_Detail;
}
