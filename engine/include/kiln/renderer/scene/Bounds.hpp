#pragma once

#include <glm/vec3.hpp>
#include <glm/common.hpp>
#include <limits>
#include <span>

namespace kiln::renderer::scene
{
    // Axis-aligned box. Default-constructed boxes are empty and act as the
    // identity for unite().
    struct Aabb
    {
        glm::vec3 min{std::numeric_limits<float>::max()};
        glm::vec3 max{std::numeric_limits<float>::lowest()};

        static Aabb fromMinMax(const glm::vec3& lo, const glm::vec3& hi)
        {
            return Aabb{lo, hi};
        }

        static Aabb fromPoints(std::span<const glm::vec3> points)
        {
            Aabb box{};
            for (const auto& p : points)
            {
                box.expand(p);
            }
            return box;
        }

        bool isEmpty() const
        {
            return min.x > max.x || min.y > max.y || min.z > max.z;
        }

        void expand(const glm::vec3& p)
        {
            min = glm::min(min, p);
            max = glm::max(max, p);
        }

        void unite(const Aabb& other)
        {
            if (other.isEmpty())
            {
                return;
            }
            min = glm::min(min, other.min);
            max = glm::max(max, other.max);
        }

        glm::vec3 center() const
        {
            return isEmpty() ? glm::vec3(0.0F) : (min + max) * 0.5F;
        }

        glm::vec3 extent() const
        {
            return isEmpty() ? glm::vec3(0.0F) : max - min;
        }
    };
}
