module;
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

module Core.IOBackend;

import Core.Error;

namespace Core::IO
{
    Expected<std::string> ReadTextFile(std::string_view path)
    {
        namespace fs = std::filesystem;

        if (path.empty())
            return Err<std::string>(ErrorCode::InvalidPath);

        const fs::path p{std::string(path)};
        std::error_code ec;
        if (!fs::exists(p, ec) || ec)
            return Err<std::string>(ErrorCode::FileNotFound);

        std::ifstream file(p, std::ios::binary | std::ios::ate);
        if (!file.is_open())
            return Err<std::string>(ErrorCode::FileReadError);

        const auto fileSize = static_cast<std::size_t>(file.tellg());
        file.seekg(0, std::ios::beg);
        if (!file)
            return Err<std::string>(ErrorCode::FileReadError);

        std::string text(fileSize, '\0');
        file.read(text.data(), static_cast<std::streamsize>(fileSize));
        if (!file)
            return Err<std::string>(ErrorCode::FileReadError);

        return text;
    }

    Result WriteFile(std::string_view path, std::span<const std::byte> data)
    {
        namespace fs = std::filesystem;

        if (path.empty())
            return Err(ErrorCode::InvalidPath);

        // Create parent directories if they don't exist
        const fs::path p{std::string(path)};
        std::error_code ec;
        const auto parent = p.parent_path();
        if (!parent.empty())
            fs::create_directories(parent, ec);

        std::ofstream file(p, std::ios::binary | std::ios::trunc);
        if (!file.is_open())
            return Err(ErrorCode::FileWriteError);

        if (!data.empty())
        {
            file.write(reinterpret_cast<const char*>(data.data()),
                       static_cast<std::streamsize>(data.size()));
            if (!file)
                return Err(ErrorCode::FileWriteError);
        }

        return Ok();
    }

    Result WriteTextFile(std::string_view path, std::string_view text)
    {
        return WriteFile(path, std::as_bytes(std::span<const char>(text.data(), text.size())));
    }
}
