#include "kiln/core/FileIO.hpp"

#include <fstream>

namespace kiln::core {

    std::optional<std::vector<std::byte>> readFileBytes(const std::filesystem::path& path)
    {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec))
        {
            return std::nullopt;
        }

        std::ifstream file(path, std::ios::binary);
        if (!file)
        {
            return std::nullopt;
        }

        file.seekg(0, std::ios::end);
        const std::streamoff size = file.tellg();
        if (size < 0)
        {
            return std::nullopt;
        }
        file.seekg(0, std::ios::beg);

        std::vector<std::byte> out(static_cast<size_t>(size));
        if (size != 0)
        {
            file.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(size));
            if (!file)
            {
                return std::nullopt;
            }
        }
        return out;
    }

}
