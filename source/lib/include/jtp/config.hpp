#pragma once

#include <string>

#include <jtp/constants.hpp>
#include <jtp/util.hpp>

struct Config
{
    double m_Dpi{ c_DefaultDpi };
    bool m_StripExif{ false };
    std::string m_Title;
};

/*
        Loads a config from a json file, e.g.

            { "dpi": 150, "strip_exif": true, "title": "Holidays" }

        A missing file or missing keys fall back to the defaults, anything malformed throws std::runtime_error
*/
Config LoadConfig(const fs::path& config_path = c_DefaultConfigFile);
