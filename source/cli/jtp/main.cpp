#include <charconv>
#include <fstream>
#include <iostream>
#include <optional>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fmt/format.h>

#include <jtp/config.hpp>
#include <jtp/constants.hpp>
#include <jtp/error.hpp>
#include <jtp/util.hpp>
#include <jtp/version.hpp>

#include <jtp/pdf/generate.hpp>

#include <jtp/util/at_scope_exit.hpp>
#include <jtp/util/log.hpp>

struct CommandLineOptions
{
    bool m_HelpDisplayed{ false };
    bool m_VersionDisplayed{ false };

    std::optional<std::string> m_Output{ std::nullopt };
    std::optional<double> m_Dpi{ std::nullopt };
    std::optional<bool> m_StripExif{ std::nullopt };
    std::optional<std::string> m_Title{ std::nullopt };
    fs::path m_ConfigFile{ c_DefaultConfigFile };
    std::vector<fs::path> m_Inputs{};
};

constexpr const char c_HelpStr[]{
    R"(
Usage: jpeg2pdf --output <file> [options] <image|dir>...

Converts jpeg images into a pdf with one page per image, without re-encoding
them and upright according to their EXIF orientation.

    --help              Display this information.
    --version           Display the version.
    --output <file>     Write the pdf to this file, - for stdout.
    --dpi <n>           Resolution of the images, decides the page size.
    --strip-exif        Remove EXIF data from the embedded images.
    --no-strip-exif     Keep EXIF data, even if the config strips it.
    --title <title>     Title of the pdf document.
    --config <file>     Load defaults from this json file instead
                        of jpeg2pdf.json.
    --log-file          Also write the log to a file in logs/.

Directories are expanded to the .jpg and .jpeg files they contain,
sorted by name.
)"
};

bool HasArgument(std::span<char*> argv, std::string_view arg)
{
    for (const char* a : argv)
    {
        if (a == arg)
        {
            return true;
        }
    }
    return false;
}

std::optional<double> ParseDouble(std::string_view str)
{
    double val{};
#ifdef __clang__
    // Clang and AppleClang do not support std::from_chars overloads with floating points
    try
    {
        size_t parsed{};
        val = std::stod(std::string{ str }, &parsed);
        if (parsed != str.size())
        {
            return std::nullopt;
        }
    }
    catch (const std::logic_error&)
    {
        return std::nullopt;
    }
#else
    const auto [ptr, ec]{ std::from_chars(str.data(), str.data() + str.size(), val) };
    if (ec != std::errc{} || ptr != str.data() + str.size())
    {
        return std::nullopt;
    }
#endif
    return val;
}

std::optional<CommandLineOptions> ParseCommandLine(int argc, char** raw_argv)
{
    std::span argv{ raw_argv, static_cast<size_t>(argc) };

    CommandLineOptions cli;

    if (HasArgument(argv, "--help"))
    {
        fmt::print("{}", c_HelpStr);
        cli.m_HelpDisplayed = true;
        return cli;
    }

    if (HasArgument(argv, "--version"))
    {
        fmt::print("jpeg2pdf {} (built {})\n", Jpeg2PdfVersion(), Jpeg2PdfBuildTime());
        cli.m_VersionDisplayed = true;
        return cli;
    }

    const auto next_param{
        [&](size_t& i, std::string_view arg) -> std::optional<std::string_view>
        {
            if (i + 1 >= argv.size())
            {
                LogError("Missing value for command line option {}", arg);
                return std::nullopt;
            }
            ++i;
            return argv[i];
        }
    };

    for (size_t i = 1; i < argv.size(); i++)
    {
        const std::string_view arg{ argv[i] };
        if (arg == "--output")
        {
            const auto param{ next_param(i, arg) };
            if (!param.has_value())
            {
                return std::nullopt;
            }
            cli.m_Output = std::string{ param.value() };
        }
        else if (arg == "--dpi")
        {
            const auto param{ next_param(i, arg) };
            if (!param.has_value())
            {
                return std::nullopt;
            }

            cli.m_Dpi = ParseDouble(param.value());
            if (!cli.m_Dpi.has_value())
            {
                LogError("Expected a number for --dpi but got {}", param.value());
                return std::nullopt;
            }
        }
        else if (arg == "--strip-exif")
        {
            cli.m_StripExif = true;
        }
        else if (arg == "--no-strip-exif")
        {
            cli.m_StripExif = false;
        }
        else if (arg == "--title")
        {
            const auto param{ next_param(i, arg) };
            if (!param.has_value())
            {
                return std::nullopt;
            }
            cli.m_Title = std::string{ param.value() };
        }
        else if (arg == "--config")
        {
            const auto param{ next_param(i, arg) };
            if (!param.has_value())
            {
                return std::nullopt;
            }
            cli.m_ConfigFile = fs::path{ param.value() };
        }
        else if (arg == "--log-file")
        {
            // Consumed before the log is created
        }
        else if (arg.starts_with("--"))
        {
            LogError("Unknown command line option {}", arg);
            return std::nullopt;
        }
        else
        {
            cli.m_Inputs.push_back(fs::path{ arg });
        }
    }

    if (!cli.m_Output.has_value())
    {
        LogError("Missing --output, see --help");
        return std::nullopt;
    }

    return cli;
}

std::vector<fs::path> ExpandInputs(const std::vector<fs::path>& inputs)
{
    std::vector<fs::path> files;
    for (const fs::path& input : inputs)
    {
        if (fs::is_directory(input))
        {
            const auto dir_files{ ListFiles(input, g_JpegExtensions) };
            if (dir_files.empty())
            {
                LogWarning("No jpeg files in directory {}", input.string());
            }
            files.insert(files.end(), dir_files.begin(), dir_files.end());
        }
        else
        {
            files.push_back(input);
        }
    }
    return files;
}

void WriteOutput(const std::string& output, const std::string& pdf)
{
    if (output == "-")
    {
        std::cout.write(pdf.data(), static_cast<std::streamsize>(pdf.size()));
        std::cout.flush();
        if (!std::cout)
        {
            throw std::runtime_error{ "Failed writing pdf to stdout" };
        }
        return;
    }

    std::ofstream file{ output, std::ios::binary | std::ios::trunc };
    if (!file)
    {
        throw std::runtime_error{ fmt::format("Failed opening {} for writing", output) };
    }

    // Never leave a truncated pdf behind
    AtScopeExit remove_partial_file{
        [&]()
        {
            file.close();
            std::error_code error;
            fs::remove(output, error);
        }
    };

    file.write(pdf.data(), static_cast<std::streamsize>(pdf.size()));
    file.close();
    if (!file)
    {
        throw std::runtime_error{ fmt::format("Failed writing pdf to {}", output) };
    }
    remove_partial_file.Dismiss();
}

int main(int argc, char** argv)
{
    LogFlags log_flags{
        LogFlags::Console |
        LogFlags::FatalQuit |
        LogFlags::DetailFile |
        LogFlags::DetailLine |
        LogFlags::DetailColumn |
        LogFlags::DetailStacktrace
    };
    if (HasArgument(std::span{ argv, static_cast<size_t>(argc) }, "--log-file"))
    {
        log_flags = log_flags | LogFlags::File;
    }
    Log main_log{ log_flags, Log::c_MainLogName };

    const std::optional<CommandLineOptions> cli{ ParseCommandLine(argc, argv) };
    if (!cli.has_value())
    {
        return 1;
    }
    if (cli->m_HelpDisplayed || cli->m_VersionDisplayed)
    {
        return 0;
    }

    std::vector<fs::path> files;
    try
    {
        const Config config{ LoadConfig(cli->m_ConfigFile) };

        files = ExpandInputs(cli->m_Inputs);
        if (files.empty())
        {
            LogError("No input images, see --help");
            return 1;
        }

        JpegToPdf builder{};
        builder
            .SetDpi(cli->m_Dpi.value_or(config.m_Dpi))
            .StripExif(cli->m_StripExif.value_or(config.m_StripExif))
            .SetTitle(cli->m_Title.value_or(config.m_Title));

        for (const fs::path& file : files)
        {
            LogDebug("Reading {}...", file.string());
            builder.AddImage(ReadBinaryFile(file));
        }

        std::ostringstream pdf;
        builder.Build(pdf);

        WriteOutput(cli->m_Output.value(), pdf.str());
        if (cli->m_Output.value() != "-")
        {
            LogInfo("Wrote {} pages to {}", files.size(), cli->m_Output.value());
        }
    }
    catch (const JpegToPdfError& e)
    {
        LogError("{}", e.what());
        if (e.Cause() != ErrorCause::PdfWriteFailure && e.Index() < files.size())
        {
            LogError("Offending file: {}", files[e.Index()].string());
        }
        return 1;
    }
    catch (const std::exception& e)
    {
        LogError("{}", e.what());
        return 1;
    }

    return 0;
}
