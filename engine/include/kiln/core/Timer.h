#pragma once

#include <chrono>

namespace kiln::core {

    // Wall-clock source driving animation evaluation
    class Clock {
    public:
        virtual ~Clock() = default;

        // Seconds since a fixed start instant
        [[nodiscard]] virtual float elapsed() const = 0;
    };

    class Timer : public Clock {
    public:
        Timer() { reset(); }

        void reset() {
            m_start = std::chrono::steady_clock::now();
            m_lastFrame = m_start;
        }

        [[nodiscard]] float deltaTime() {
            auto now = std::chrono::steady_clock::now();
            std::chrono::duration<float> delta = now - m_lastFrame;
            m_lastFrame = now;
            return delta.count();
        }

        [[nodiscard]] float elapsed() const override {
            auto now = std::chrono::steady_clock::now();
            std::chrono::duration<float> delta = now - m_start;
            return delta.count();
        }

    private:
        std::chrono::steady_clock::time_point m_start;
        std::chrono::steady_clock::time_point m_lastFrame;
    };

    // Externally driven clock (tests, offline stepping)
    class ManualClock : public Clock {
    public:
        explicit ManualClock(float seconds = 0.0F) : m_seconds(seconds) {}

        void set(float seconds) { m_seconds = seconds; }
        void advance(float seconds) { m_seconds += seconds; }

        [[nodiscard]] float elapsed() const override { return m_seconds; }

    private:
        float m_seconds;
    };

}
