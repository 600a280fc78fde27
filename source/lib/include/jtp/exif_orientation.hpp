#pragma once

#include <cstdint>
#include <optional>

#include <jtp/util.hpp>

/*
        Resolves the orientation code stored in an EXIF APP1 payload
        Never fails, anything that does not yield an unsigned orientation value
        resolves to c_DefaultOrientation
*/
uint32_t ResolveOrientation(std::optional<EncodedImageView> exif_segment);
