#include "RomFile.hpp"

#include <cstdio>
#include <fstream>

namespace RomFile {

std::optional<std::vector<u8>> load(const std::filesystem::path& path) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        std::fprintf(stderr, "[Rom] '%s' is a directory\n", path.string().c_str());
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        std::fprintf(stderr, "[Rom] cannot open '%s'\n", path.string().c_str());
        return std::nullopt;
    }

    // Unseekable inputs report no end position.
    const std::streamoff end = file.tellg();
    if (file.fail() || end < 0) {
        std::fprintf(stderr, "[Rom] '%s' is not a readable file\n", path.string().c_str());
        return std::nullopt;
    }

    const auto file_size = static_cast<std::size_t>(end);
    std::vector<u8> data(file_size);

    file.seekg(0);
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(file_size));
    if (!file.good() && file_size != 0u) {
        std::fprintf(stderr, "[Rom] short read on '%s'\n", path.string().c_str());
        return std::nullopt;
    }

    std::fprintf(stdout, "[Rom] read %zu bytes from '%s'\n", file_size, path.string().c_str());
    return data;
}

} // namespace RomFile
