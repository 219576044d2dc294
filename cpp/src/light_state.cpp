// cpp/src/light_state.cpp
#include "light_state.h"

#include <algorithm>

// -----------------------------
// Hilfsfunktionen
// -----------------------------
static inline int toLevel(double v) {
    // int() truncation, like the fixture's own 8 bit fields
    int level = static_cast<int>(v);
    if (level < 0) return 0;
    if (level > kMaxLevel) return kMaxLevel;
    return level;
}

double clampBrightness(double v) {
    return std::clamp(v, static_cast<double>(kMinBrightness), static_cast<double>(kMaxLevel));
}

double clampColorTemperature(double v) {
    return std::clamp(v, 0.0, static_cast<double>(kMaxLevel));
}

FixtureLevels toFixtureLevels(const LightState& state) {
    FixtureLevels levels;
    levels.on = state.on;
    levels.brightness = toLevel(state.brightness);
    levels.colorTemperature = toLevel(state.colorTemperature);
    return levels;
}

// -----------------------------
// SharedLightState
// -----------------------------
LightState SharedLightState::read() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool SharedLightState::update(const Mutation& mutation) {
    std::lock_guard<std::mutex> lock(mutex_);

    LightState next = state_;
    if (!mutation(next)) return false;

    next.brightness = clampBrightness(next.brightness);
    next.colorTemperature = clampColorTemperature(next.colorTemperature);

    if (next == state_) return false;
    state_ = next;
    return true;
}
