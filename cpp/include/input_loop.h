#pragma once

#include "input_device.h"
#include "light_state.h"
#include "run_flag.h"
#include "timing.h"

// Motion is scaled down by this before it touches the light state.
static constexpr double kMotionScale = 300.0;

// Applies one input event to `state`. Returns false for events that do not
// apply (motion while off, releases, unknown buttons, empty polls).
//
//  motion (only while on):  cct -= rz / 300,  brightness -= rx / 300
//  button 0 press:          toggle on
//  button 1 press:          on, brightness 255, cct 127
bool applyEvent(LightState& state, const InputEvent& event);

// ----------------------------------------------------------
// InputLoop – spacenavd -> SharedLightState
// ----------------------------------------------------------
class InputLoop
{
public:
    InputLoop(InputDevice& device, SharedLightState& state, const RunFlag& running,
              const Timing& timing);

    // Blocks until the RunFlag is cleared.
    void run();

private:
    bool openDevice();
    void handleEvent(const InputEvent& event);

    // upper bound per cycle so the RunFlag is still checked under a flood
    static constexpr int kMaxEventsPerCycle = 64;

    InputDevice& device_;
    SharedLightState& state_;
    const RunFlag& running_;
    Timing timing_;
};
