#pragma once

#include "kiln/core/result.hpp"
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace kiln::assets
{
    enum class LoadErrorKind
    {
        InvalidPath,            // File missing or unreadable
        InvalidGltf,            // Parser rejected the bytes
        NoScene,                // Document declares zero scenes
        MalformedDocument,      // Out-of-range index, count mismatch, broken hierarchy
        UnsupportedFeature,     // Cubic spline, morph target weights
        UnsupportedPixelFormat, // Image that is not 8-bit RGB or RGBA
        HandleOverflow          // Index does not fit a 32-bit handle
    };

    std::string_view toString(LoadErrorKind kind);

    struct LoadError
    {
        LoadErrorKind kind;
        std::string message;

        // "MalformedDocument: node 3 lists child 9 (only 4 nodes)"
        std::string describe() const;
    };

    template <typename T>
    using LoadResult = core::Result<T, LoadError>;

    template <typename... Args>
    core::Unexpected<LoadError> loadError(LoadErrorKind kind, std::format_string<Args...> fmt, Args&&... args)
    {
        return core::Unexpected<LoadError>(
            LoadError{kind, std::format(fmt, std::forward<Args>(args)...)});
    }
}
