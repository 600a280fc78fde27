#pragma once

#include <cstdint>

#include <jtp/util/bit_field.hpp>

enum class LogFlags : uint32_t
{
    None = 0x0,

    Console = 0x1,
    File = 0x2,
    FatalQuit = 0x4,

    // Order of the detail bits is the order in which they are printed
    DetailTime = 0x10,
    DetailFile = 0x20,
    DetailLine = 0x40,
    DetailColumn = 0x80,
    DetailFunction = 0x100,
    DetailAll = DetailTime | DetailFile | DetailLine | DetailColumn | DetailFunction,

    DetailErrorStacktrace = 0x1000,
    DetailFatalStacktrace = 0x2000,
    DetailStacktrace = DetailErrorStacktrace | DetailFatalStacktrace,
};
ENABLE_BITFIELD_OPERATORS(LogFlags);
