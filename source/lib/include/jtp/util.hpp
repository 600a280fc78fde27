#pragma once

#include <cstddef>
#include <filesystem>
#include <span>
#include <vector>

namespace fs = std::filesystem;

using EncodedImage = std::vector<std::byte>;
using EncodedImageView = std::span<const std::byte>;

// clang-format off
inline auto operator""_p(const char *str, size_t len) { return fs::path(str, str + len); }
// clang-format on

bool HasExtension(const fs::path& path, const std::span<const fs::path> extensions);

template<class FunT>
void ForEachFile(const fs::path& path, FunT&& fun, const std::span<const fs::path> extensions)
{
    if (!fs::is_directory(path))
    {
        return;
    }

    for (auto& child : fs::directory_iterator(path))
    {
        if (!child.is_directory())
        {
            const bool is_matching_extension{
                extensions.empty() || HasExtension(child.path(), extensions)
            };
            if (is_matching_extension)
            {
                fun(child.path());
            }
        }
    }
}

// Full paths of all matching files in the folder, sorted by name
std::vector<fs::path> ListFiles(const fs::path& path, const std::span<const fs::path> extensions = {});

EncodedImage ReadBinaryFile(const fs::path& path);
