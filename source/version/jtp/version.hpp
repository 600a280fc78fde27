#pragma once

#include <string_view>

std::string_view Jpeg2PdfVersion();
std::string_view Jpeg2PdfBuildTime();
