#pragma once

#include <jtp/constants.hpp>
#include <jtp/util.hpp>

class PdfDocument;

struct ComposeOptions
{
    double m_Dpi{ c_DefaultDpi };
    bool m_StripExif{ false };
};

/*
        Puts a single jpeg onto a new page of the document, upright according to its EXIF orientation
        The compressed data is embedded without re-encoding, optionally with its EXIF segments removed

        Throws PageCompositionError on failure, the document may then contain a partial page
*/
void ComposePage(PdfDocument& document, EncodedImageView jpeg, const ComposeOptions& options);
