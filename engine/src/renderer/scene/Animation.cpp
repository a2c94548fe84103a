#include "kiln/renderer/scene/Animation.hpp"

#include "kiln/core/Settings.hpp"
#include "kiln/core/common.hpp"
#include "kiln/core/logger.hpp"
#include <algorithm>
#include <cmath>
#include <cpptrace/cpptrace.hpp>
#include <fastgltf/glm_element_traits.hpp>
#include <fastgltf/tools.hpp>
#include <fastgltf/types.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <limits>

namespace kiln::renderer::scene
{
    using assets::LoadErrorKind;
    using assets::loadError;

    const char* toString(AnimationProperty property)
    {
        switch (property)
        {
        case AnimationProperty::Translation: return "translation";
        case AnimationProperty::Rotation: return "rotation";
        case AnimationProperty::Scale: return "scale";
        case AnimationProperty::MorphTargetWeights: return "weights";
        }
        return "unknown";
    }

    const char* toString(AnimationInterpolation interpolation)
    {
        switch (interpolation)
        {
        case AnimationInterpolation::Step: return "STEP";
        case AnimationInterpolation::Linear: return "LINEAR";
        case AnimationInterpolation::CubicSpline: return "CUBICSPLINE";
        }
        return "unknown";
    }

    glm::mat4 toMatrix(const PropertyValue& value)
    {
        return std::visit(
            [](const auto& v) -> glm::mat4 {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, TranslationValue>) {
                    return glm::translate(glm::mat4(1.0F), v.value);
                } else if constexpr (std::is_same_v<T, RotationValue>) {
                    return glm::mat4_cast(v.value);
                } else {
                    return glm::scale(glm::mat4(1.0F), v.value);
                }
            },
            value);
    }

    namespace
    {
        AnimationProperty toProperty(fastgltf::AnimationPath path)
        {
            switch (path)
            {
            case fastgltf::AnimationPath::Translation: return AnimationProperty::Translation;
            case fastgltf::AnimationPath::Rotation: return AnimationProperty::Rotation;
            case fastgltf::AnimationPath::Scale: return AnimationProperty::Scale;
            case fastgltf::AnimationPath::Weights: return AnimationProperty::MorphTargetWeights;
            }
            return AnimationProperty::MorphTargetWeights;
        }

        AnimationInterpolation toInterpolation(fastgltf::AnimationInterpolation interpolation)
        {
            switch (interpolation)
            {
            case fastgltf::AnimationInterpolation::Step: return AnimationInterpolation::Step;
            case fastgltf::AnimationInterpolation::Linear: return AnimationInterpolation::Linear;
            case fastgltf::AnimationInterpolation::CubicSpline: return AnimationInterpolation::CubicSpline;
            }
            return AnimationInterpolation::Linear;
        }
    }

    assets::LoadResult<AnimationChannel> AnimationChannel::create(NodeIndex target,
                                                                  AnimationProperty property,
                                                                  AnimationInterpolation interpolation,
                                                                  std::vector<float> times,
                                                                  std::vector<float> values)
    {
        if (times.empty())
        {
            return loadError(LoadErrorKind::MalformedDocument,
                             "{} channel for node {} has no keyframes", toString(property), target.id);
        }
        const size_t expected = componentCount(property) * times.size();
        if (values.size() != expected)
        {
            return loadError(LoadErrorKind::MalformedDocument,
                             "{} channel for node {} has {} values, expected {} for {} keyframes",
                             toString(property), target.id, values.size(), expected, times.size());
        }
        if (!std::ranges::is_sorted(times))
        {
            return loadError(LoadErrorKind::MalformedDocument,
                             "{} channel for node {} has decreasing keyframe times",
                             toString(property), target.id);
        }

        AnimationChannel channel;
        channel.m_target = target;
        channel.m_property = property;
        channel.m_interpolation = interpolation;
        channel.m_times = std::move(times);
        channel.m_values = std::move(values);
        return channel;
    }

    assets::LoadResult<AnimationChannel> AnimationChannel::parse(const fastgltf::Asset& gltf,
                                                                 const fastgltf::Animation& animation,
                                                                 const fastgltf::AnimationChannel& channel)
    {
        if (!channel.nodeIndex.has_value() || channel.nodeIndex.value() >= gltf.nodes.size())
        {
            return loadError(LoadErrorKind::MalformedDocument,
                             "animation '{}' channel targets a missing node", animation.name);
        }
        auto node = util::checkedU32(channel.nodeIndex.value());
        if (!node)
        {
            return loadError(LoadErrorKind::HandleOverflow,
                             "animation '{}' targets node {}", animation.name, channel.nodeIndex.value());
        }
        const NodeIndex target{*node};

        const AnimationProperty property = toProperty(channel.path);
        if (property == AnimationProperty::MorphTargetWeights)
        {
            return loadError(LoadErrorKind::UnsupportedFeature,
                             "animation '{}' drives morph target weights of node {}", animation.name,
                             target.id);
        }

        if (channel.samplerIndex >= animation.samplers.size())
        {
            return loadError(LoadErrorKind::MalformedDocument,
                             "animation '{}' channel uses sampler {} (only {})", animation.name,
                             channel.samplerIndex, animation.samplers.size());
        }
        const auto& sampler = animation.samplers[channel.samplerIndex];

        const AnimationInterpolation interpolation = toInterpolation(sampler.interpolation);
        if (interpolation == AnimationInterpolation::CubicSpline)
        {
            return loadError(LoadErrorKind::UnsupportedFeature,
                             "animation '{}' uses CUBICSPLINE interpolation on node {}", animation.name,
                             target.id);
        }

        if (sampler.inputAccessor >= gltf.accessors.size() || sampler.outputAccessor >= gltf.accessors.size())
        {
            return loadError(LoadErrorKind::MalformedDocument,
                             "animation '{}' sampler references a missing accessor", animation.name);
        }
        const auto& inputAcc = gltf.accessors[sampler.inputAccessor];
        const auto& outputAcc = gltf.accessors[sampler.outputAccessor];

        if (inputAcc.type != fastgltf::AccessorType::Scalar)
        {
            return loadError(LoadErrorKind::MalformedDocument,
                             "animation '{}' keyframe times are not scalar", animation.name);
        }

        std::vector<float> times(inputAcc.count);
        fastgltf::iterateAccessorWithIndex<float>(gltf, inputAcc, [&](float t, size_t idx)
        {
            times[idx] = t;
        });

        // Normalized integer inputs are rescaled to [0, 1] over the observed range
        if (inputAcc.normalized && !times.empty())
        {
            auto [lo, hi] = std::ranges::minmax_element(times);
            const float min = *lo;
            const float range = *hi - min;
            for (float& t : times)
            {
                t = range > 0.0F ? (t - min) / range : 0.0F;
            }
        }

        const size_t components = componentCount(property);
        const auto expectedType = components == 4 ? fastgltf::AccessorType::Vec4 : fastgltf::AccessorType::Vec3;
        if (outputAcc.type != expectedType)
        {
            return loadError(LoadErrorKind::MalformedDocument,
                             "animation '{}' {} output accessor has the wrong element type", animation.name,
                             toString(property));
        }

        std::vector<float> values(outputAcc.count * components);
        if (property == AnimationProperty::Rotation)
        {
            fastgltf::iterateAccessorWithIndex<glm::vec4>(gltf, outputAcc, [&](glm::vec4 q, size_t idx)
            {
                if (outputAcc.normalized)
                {
                    const float len = glm::length(q);
                    if (len > 0.0F)
                    {
                        q /= len;
                    }
                }
                values[(idx * 4) + 0] = q.x;
                values[(idx * 4) + 1] = q.y;
                values[(idx * 4) + 2] = q.z;
                values[(idx * 4) + 3] = q.w;
            });
        }
        else
        {
            fastgltf::iterateAccessorWithIndex<glm::vec3>(gltf, outputAcc, [&](glm::vec3 v, size_t idx)
            {
                values[(idx * 3) + 0] = v.x;
                values[(idx * 3) + 1] = v.y;
                values[(idx * 3) + 2] = v.z;
            });
        }

        auto result = create(target, property, interpolation, std::move(times), std::move(values));
        if (result && core::settings::verboseAssets.get())
        {
            core::Logger::Scene.debug("  animates {} ({}) of node {} over {} keyframes, {:.3f}s",
                                      toString(property), toString(interpolation), target.id,
                                      result->keyframeCount(), result->duration());
        }
        return result;
    }

    PropertyValue AnimationChannel::sample(size_t keyframe) const
    {
        if (keyframe >= m_times.size())
        {
            throw cpptrace::logic_error("AnimationChannel::sample: keyframe " + std::to_string(keyframe) +
                                        " out of range");
        }
        const float* data = m_values.data() + (keyframe * componentCount(m_property));
        switch (m_property)
        {
        case AnimationProperty::Translation:
            return TranslationValue{glm::vec3(data[0], data[1], data[2])};
        case AnimationProperty::Rotation:
            return RotationValue{glm::quat(data[3], data[0], data[1], data[2])};
        case AnimationProperty::Scale:
            return ScaleValue{glm::vec3(data[0], data[1], data[2])};
        case AnimationProperty::MorphTargetWeights:
            break;
        }
        throw cpptrace::runtime_error("Morph target weight animation is not supported");
    }

    PropertyValue AnimationChannel::interpolate(float time) const
    {
        if (m_property == AnimationProperty::MorphTargetWeights)
        {
            throw cpptrace::runtime_error("Morph target weight animation is not supported");
        }
        if (m_interpolation == AnimationInterpolation::CubicSpline)
        {
            throw cpptrace::runtime_error("Cubic spline interpolation is not supported");
        }

        const float duration = m_times.back();
        if (m_times.size() == 1 || duration <= 0.0F)
        {
            return sample(0);
        }

        float local = std::fmod(time, duration);
        if (local < 0.0F)
        {
            local += duration;
        }

        auto it = std::ranges::lower_bound(m_times, local);
        const size_t insertion = static_cast<size_t>(it - m_times.begin());
        if (it != m_times.end() && *it == local)
        {
            return sample(insertion);
        }
        if (insertion == 0)
        {
            return sample(0);
        }

        const size_t left = insertion - 1;
        if (left + 1 >= m_times.size())
        {
            return sample(left);
        }

        if (m_interpolation == AnimationInterpolation::Step)
        {
            return sample(left);
        }

        const float t0 = m_times[left];
        const float t1 = m_times[left + 1];
        const float ratio = (local - t0) / (t1 - t0);

        const PropertyValue first = sample(left);
        const PropertyValue second = sample(left + 1);
        switch (m_property)
        {
        case AnimationProperty::Translation:
            return TranslationValue{glm::mix(std::get<TranslationValue>(first).value,
                                             std::get<TranslationValue>(second).value, ratio)};
        case AnimationProperty::Scale:
            return ScaleValue{glm::mix(std::get<ScaleValue>(first).value,
                                       std::get<ScaleValue>(second).value, ratio)};
        case AnimationProperty::Rotation:
            return RotationValue{glm::normalize(glm::slerp(std::get<RotationValue>(first).value,
                                                           std::get<RotationValue>(second).value, ratio))};
        case AnimationProperty::MorphTargetWeights:
            break;
        }
        throw cpptrace::runtime_error("Morph target weight animation is not supported");
    }

    assets::LoadResult<std::vector<AnimationChannel>> parseAnimations(const fastgltf::Asset& gltf)
    {
        std::vector<AnimationChannel> channels;
        for (const auto& gAnim : gltf.animations)
        {
            core::Logger::Scene.debug("Animation '{}' with {} channels", gAnim.name, gAnim.channels.size());
            for (const auto& gChannel : gAnim.channels)
            {
                if (!gChannel.nodeIndex.has_value())
                {
                    core::Logger::Scene.warn("Animation '{}' has a channel without target node, skipped",
                                             gAnim.name);
                    continue;
                }
                auto channel = AnimationChannel::parse(gltf, gAnim, gChannel);
                if (!channel)
                {
                    return core::Unexpected<assets::LoadError>(std::move(channel.error()));
                }
                channels.push_back(std::move(*channel));
            }
        }
        return channels;
    }
}
