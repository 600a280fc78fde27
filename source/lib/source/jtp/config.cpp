#include <jtp/config.hpp>

#include <cmath>
#include <fstream>
#include <stdexcept>

#include <fmt/format.h>

#include <nlohmann/json.hpp>

#include <jtp/util/log.hpp>

Config LoadConfig(const fs::path& config_path)
{
    Config config{};
    if (!fs::exists(config_path))
    {
        LogDebug("No config at {}, using defaults...", config_path.string());
        return config;
    }

    LogInfo("Loading config from {}...", config_path.string());

    try
    {
        const nlohmann::json json{ nlohmann::json::parse(std::ifstream{ config_path }) };
        if (!json.is_object())
        {
            throw std::runtime_error{ "expected a json object" };
        }

        if (json.contains("dpi"))
        {
            config.m_Dpi = json["dpi"].get<double>();
            if (!std::isfinite(config.m_Dpi) || config.m_Dpi <= 0.0)
            {
                throw std::runtime_error{ fmt::format("dpi has to be a positive number, got {}", config.m_Dpi) };
            }
        }
        if (json.contains("strip_exif"))
        {
            config.m_StripExif = json["strip_exif"].get<bool>();
        }
        if (json.contains("title"))
        {
            config.m_Title = json["title"].get<std::string>();
        }
    }
    catch (const nlohmann::json::exception& e)
    {
        throw std::runtime_error{ fmt::format("Failed loading config {}: {}", config_path.string(), e.what()) };
    }
    catch (const std::runtime_error& e)
    {
        throw std::runtime_error{ fmt::format("Failed loading config {}: {}", config_path.string(), e.what()) };
    }

    return config;
}
