#include <jtp/version.hpp>

#define STRINGIFY(x) #x
#define TOSTRING(x) STRINGIFY(x)

std::string_view Jpeg2PdfVersion()
{
#ifdef JPEG2PDF_VERSION
    return TOSTRING(JPEG2PDF_VERSION);
#else
    return "<unknown version>";
#endif
}

std::string_view Jpeg2PdfBuildTime()
{
#ifdef JPEG2PDF_NOW
    return TOSTRING(JPEG2PDF_NOW);
#else
    return "<unknown build time>";
#endif
}
