#pragma once

#include <functional>
#include <mutex>

// ----------------------------------------------------------
// LightState – gewünschter Zustand der Leuchte
// ----------------------------------------------------------
static constexpr int kMinBrightness = 1;
static constexpr int kMaxLevel = 255;
static constexpr int kPresetColorTemperature = 127;

// Brightness and color temperature keep the fractional part of motion
// deltas so slow rotations still add up; the fixture gets the integer part.
struct LightState
{
    bool on = false;
    double brightness = 0.0;
    double colorTemperature = 0.0;

    bool operator==(const LightState& o) const
    {
        return on == o.on && brightness == o.brightness && colorTemperature == o.colorTemperature;
    }
    bool operator!=(const LightState& o) const { return !(*this == o); }
};

// What actually goes over the wire.
struct FixtureLevels
{
    bool on = false;
    int brightness = 0;
    int colorTemperature = 0;

    bool operator==(const FixtureLevels& o) const
    {
        return on == o.on && brightness == o.brightness && colorTemperature == o.colorTemperature;
    }
    bool operator!=(const FixtureLevels& o) const { return !(*this == o); }
};

FixtureLevels toFixtureLevels(const LightState& state);

double clampBrightness(double v);
double clampColorTemperature(double v);

// ----------------------------------------------------------
// SharedLightState – von Input- und Output-Loop gemeinsam genutzt
// ----------------------------------------------------------
class SharedLightState
{
public:
    using Mutation = std::function<bool(LightState&)>;

    SharedLightState() = default;
    SharedLightState(const SharedLightState&) = delete;
    SharedLightState& operator=(const SharedLightState&) = delete;

    LightState read() const;

    // Read-modify-clamp-store under one lock. The mutation returns false
    // when it does not apply, in which case nothing is stored.
    // Returns true if the stored state changed.
    bool update(const Mutation& mutation);

private:
    mutable std::mutex mutex_;
    LightState state_;
};
