#include "kiln/assets/LoadError.hpp"

namespace kiln::assets
{
    std::string_view toString(LoadErrorKind kind)
    {
        switch (kind)
        {
        case LoadErrorKind::InvalidPath: return "InvalidPath";
        case LoadErrorKind::InvalidGltf: return "InvalidGltf";
        case LoadErrorKind::NoScene: return "NoScene";
        case LoadErrorKind::MalformedDocument: return "MalformedDocument";
        case LoadErrorKind::UnsupportedFeature: return "UnsupportedFeature";
        case LoadErrorKind::UnsupportedPixelFormat: return "UnsupportedPixelFormat";
        case LoadErrorKind::HandleOverflow: return "HandleOverflow";
        }
        return "Unknown";
    }

    std::string LoadError::describe() const
    {
        return std::format("{}: {}", toString(kind), message);
    }
}
