#pragma once

#include <cstdint>
#include <limits>
#include <compare>
#include <functional>

namespace kiln::core {

template <typename Tag>
struct Handle {
    uint32_t id = std::numeric_limits<uint32_t>::max();

    constexpr bool isValid() const { return id != std::numeric_limits<uint32_t>::max(); }

    auto operator<=>(const Handle&) const = default;
    explicit operator bool() const { return isValid(); }
};

struct NodeTag {};
struct MeshTag {};

} // namespace kiln::core

using NodeIndex = kiln::core::Handle<kiln::core::NodeTag>;
using MeshIndex = kiln::core::Handle<kiln::core::MeshTag>;

template <typename Tag>
struct std::hash<kiln::core::Handle<Tag>> {
    size_t operator()(const kiln::core::Handle<Tag>& handle) const noexcept {
        return std::hash<uint32_t>{}(handle.id);
    }
};
