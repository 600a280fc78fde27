#include <jtp/util.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

bool HasExtension(const fs::path& path, const std::span<const fs::path> extensions)
{
    std::string extension{ path.extension().string() };
    std::ranges::transform(extension,
                           extension.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
    return std::ranges::find(extensions, fs::path{ extension }) != extensions.end();
}

std::vector<fs::path> ListFiles(const fs::path& path, const std::span<const fs::path> extensions)
{
    std::vector<fs::path> files;
    ForEachFile(
        path,
        [&files](const fs::path& path)
        {
            files.push_back(path);
        },
        extensions);
    std::ranges::sort(files);
    return files;
}

EncodedImage ReadBinaryFile(const fs::path& path)
{
    std::ifstream file{ path, std::ios::binary | std::ios::ate };
    if (!file)
    {
        throw std::runtime_error{ fmt::format("Could not open file {}", path.string()) };
    }

    const std::streamsize size{ file.tellg() };
    file.seekg(0, std::ios::beg);

    EncodedImage buffer(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size))
    {
        throw std::runtime_error{ fmt::format("Could not read file {}", path.string()) };
    }
    return buffer;
}
