#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace tkd::file
{
    bool isReadableFile(const std::filesystem::path & path);

    std::optional<std::string> loadTextFile(const std::filesystem::path & path);
}
