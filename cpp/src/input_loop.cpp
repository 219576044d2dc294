// cpp/src/input_loop.cpp
#include "input_loop.h"
#include "errors.h"
#include "logger.h"

#include <sstream>

bool applyEvent(LightState& state, const InputEvent& event) {
    switch (event.type) {
        case InputEventType::Motion: {
            if (!state.on) return false;
            // X axis inverted: pushing forward makes it brighter
            state.colorTemperature = clampColorTemperature(state.colorTemperature - event.motion.rz / kMotionScale);
            state.brightness = clampBrightness(state.brightness - event.motion.rx / kMotionScale);
            return true;
        }
        case InputEventType::Button: {
            if (!event.button.pressed) return false;
            if (event.button.button == 0) {
                state.on = !state.on;
                return true;
            }
            if (event.button.button == 1) {
                state.on = true;
                state.brightness = kMaxLevel;
                state.colorTemperature = kPresetColorTemperature;
                return true;
            }
            return false;
        }
        default:
            return false;
    }
}

InputLoop::InputLoop(InputDevice& device, SharedLightState& state, const RunFlag& running,
                     const Timing& timing)
    : device_(device),
      state_(state),
      running_(running),
      timing_(timing)
{
}

// -----------------------------
// Verbindung zu spacenavd
// -----------------------------
bool InputLoop::openDevice() {
    while (running_.isRunning()) {
        try {
            device_.open();
            LOG_INFO("Connection to SpaceNav driver established.");
            return true;
        } catch (const ConnectionError& e) {
            LOG_WARN("No connection to the SpaceNav driver. Retrying...");
            LOG_DEBUG(e.what());
        }
        running_.sleepFor(timing_.retryDelay);
    }
    return false;
}

void InputLoop::run() {
    while (running_.isRunning()) {
        if (!openDevice()) break;

        try {
            while (running_.isRunning()) {
                for (int i = 0; i < kMaxEventsPerCycle; ++i) {
                    InputEvent event = device_.poll();
                    if (event.type == InputEventType::None) break;
                    handleEvent(event);
                }
                running_.sleepFor(timing_.pollInterval);
            }
        } catch (const ConnectionError& e) {
            LOG_WARN(std::string("Lost connection to the SpaceNav driver: ") + e.what());
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("Error while reading SpaceNav events: ") + e.what());
            running_.sleepFor(timing_.retryDelay);
        }

        device_.close();
    }
}

void InputLoop::handleEvent(const InputEvent& event) {
    if (!state_.update([&event](LightState& s) { return applyEvent(s, event); })) {
        return;
    }
    if (!logger.verbose()) return;

    // only this loop writes, so the read sees our own update
    LightState now = state_.read();
    std::ostringstream oss;
    if (event.type == InputEventType::Motion) {
        oss << "Color temperature: " << now.colorTemperature << ", Brightness: " << now.brightness;
    } else if (event.button.button == 0) {
        oss << "Switched " << (now.on ? "on" : "off");
    } else {
        oss << "Set color temperature: " << now.colorTemperature
            << ", Brightness: " << now.brightness << ", Switched on";
    }
    LOG_DEBUG(oss.str());
}
