#pragma once

#include "kiln/assets/LoadError.hpp"
#include "kiln/core/Handle.h"
#include <glm/gtc/quaternion.hpp>
#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>
#include <span>
#include <variant>
#include <vector>

namespace fastgltf { class Asset; struct Animation; struct AnimationChannel; }

namespace kiln::renderer::scene
{
    enum class AnimationProperty
    {
        Translation,
        Rotation,
        Scale,
        MorphTargetWeights // declared by glTF, rejected at load
    };

    enum class AnimationInterpolation
    {
        Step,
        Linear,
        CubicSpline // rejected at load
    };

    // Floats per keyframe: T=3, R=4 (x,y,z,w), S=3, weights=1
    constexpr size_t componentCount(AnimationProperty property)
    {
        switch (property)
        {
        case AnimationProperty::Translation: return 3;
        case AnimationProperty::Rotation: return 4;
        case AnimationProperty::Scale: return 3;
        case AnimationProperty::MorphTargetWeights: return 1;
        }
        return 0;
    }

    const char* toString(AnimationProperty property);
    const char* toString(AnimationInterpolation interpolation);

    struct TranslationValue { glm::vec3 value{0.0F}; };
    struct RotationValue { glm::quat value{1.0F, 0.0F, 0.0F, 0.0F}; };
    struct ScaleValue { glm::vec3 value{1.0F}; };

    using PropertyValue = std::variant<TranslationValue, RotationValue, ScaleValue>;

    glm::mat4 toMatrix(const PropertyValue& value);

    // One keyframe track driving one property of one node
    class AnimationChannel
    {
    public:
        // Validates the track: times non-empty and non-decreasing, values sized
        // componentCount(property) * times.size()
        static assets::LoadResult<AnimationChannel> create(NodeIndex target,
                                                           AnimationProperty property,
                                                           AnimationInterpolation interpolation,
                                                           std::vector<float> times,
                                                           std::vector<float> values);

        // Reads one document channel; cubic spline and morph weights are UnsupportedFeature
        static assets::LoadResult<AnimationChannel> parse(const fastgltf::Asset& gltf,
                                                          const fastgltf::Animation& animation,
                                                          const fastgltf::AnimationChannel& channel);

        // Value at time seconds, looping over [0, duration)
        PropertyValue interpolate(float time) const;

        PropertyValue sample(size_t keyframe) const;

        NodeIndex targetNode() const { return m_target; }
        AnimationProperty property() const { return m_property; }
        AnimationInterpolation interpolation() const { return m_interpolation; }
        std::span<const float> times() const { return m_times; }
        size_t keyframeCount() const { return m_times.size(); }
        float duration() const { return m_times.back(); }

    private:
        AnimationChannel() = default;

        NodeIndex m_target;
        AnimationProperty m_property = AnimationProperty::Translation;
        AnimationInterpolation m_interpolation = AnimationInterpolation::Linear;
        std::vector<float> m_times;
        std::vector<float> m_values;
    };

    // Every targeted channel of every animation, in document order
    assets::LoadResult<std::vector<AnimationChannel>> parseAnimations(const fastgltf::Asset& gltf);
}
