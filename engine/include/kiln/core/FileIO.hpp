#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <vector>

namespace kiln::core {

    // Whole-file read; nullopt when the file cannot be opened or read
    std::optional<std::vector<std::byte>> readFileBytes(const std::filesystem::path& path);

}
