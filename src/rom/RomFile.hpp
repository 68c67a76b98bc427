#pragma once

#include <filesystem>
#include <optional>
#include <vector>
#include "common/Types.hpp"

// ── Cartridge image file ──────────────────────────────────────────────────────
// Reads a .z64/.v64/.n64 dump verbatim.  No byte-order conversion happens
// here; the bytes go to Rdram::load_image() exactly as stored on disk.
namespace RomFile {

// nullopt when the file cannot be opened or read.  An empty file is returned
// as an empty buffer and rejected later by load_image().
[[nodiscard]] std::optional<std::vector<u8>> load(const std::filesystem::path& path);

} // namespace RomFile
