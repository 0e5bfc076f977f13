module;
#include <cstddef>
#include <span>
#include <string>
#include <string_view>

export module Core.IOBackend;

import Core.Error;

export namespace Core::IO
{
    // Whole-file reads and writes on loose files. Writes create missing
    // parent directories and replace existing content.

    [[nodiscard]] Expected<std::string> ReadTextFile(std::string_view path);

    [[nodiscard]] Result WriteFile(std::string_view path, std::span<const std::byte> data);

    [[nodiscard]] Result WriteTextFile(std::string_view path, std::string_view text);
}
