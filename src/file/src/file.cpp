#include "file.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

#include <spdlog/spdlog.h>

namespace tkd::file
{
    bool isReadableFile(const std::filesystem::path & path)
    {
        std::error_code ec;
        if(!std::filesystem::is_regular_file(path, ec) || ec)
        {
            return false;
        }

        std::ifstream file(path, std::ios::in);
        return file.good();
    }

    std::optional<std::string> loadTextFile(const std::filesystem::path & path)
    {
        std::error_code ec;
        if(std::filesystem::exists(path, ec) == false)
        {
            spdlog::error("Cannot find file {}", path.string());
            return std::nullopt;
        }

        std::ifstream file(path, std::ios::in);

        if(file.good() == false)
        {
            spdlog::error("Failed to open file {}", path.string());
            return std::nullopt;
        }

        const std::string file_content = std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

        file.close();

        return file_content;
    }
}
