#pragma once

namespace Metronome::ECS {

// ---------------------------------------------------------------------------
// Clock — monotonic time source consumed by Registry::Update.
//
// Now() returns seconds on an arbitrary epoch and must never go backwards
// between two calls on the same clock.
// ---------------------------------------------------------------------------
class Clock {
public:
    virtual ~Clock() = default;

    [[nodiscard]] virtual double Now() const = 0;
};

// Wall-clock time from std::chrono::steady_clock. The default Registry clock.
class SteadyClock final : public Clock {
public:
    [[nodiscard]] double Now() const override;

    // Shared instance used when a Registry is built without an explicit clock.
    static SteadyClock& Instance();
};

// Clock that only moves when told to. Used for fixed-step drivers and tests.
class ManualClock final : public Clock {
public:
    explicit ManualClock(double start = 0.0) noexcept : m_now(start) {}

    [[nodiscard]] double Now() const override { return m_now; }

    // Move time forward by `seconds` (must be >= 0).
    void Advance(double seconds);

private:
    double m_now;
};

} // namespace Metronome::ECS
