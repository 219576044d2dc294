#pragma once

#include <string>

#include "fixture_client.h"
#include "input_device.h"
#include "input_loop.h"
#include "light_state.h"
#include "output_loop.h"
#include "run_flag.h"
#include "timing.h"

// ----------------------------------------------------------
// Coordinator – startet beide Loops parallel, wartet auf beide
// ----------------------------------------------------------
class Coordinator
{
public:
    Coordinator(InputDevice& device, FixtureFactory factory, const RunFlag& running,
                const Timing& timing = Timing());

    // Blocks until the RunFlag is cleared and both loops have returned.
    void run();

    const SharedLightState& lightState() const { return state_; }
    const OutputLoop& outputLoop() const { return outputLoop_; }

private:
    SharedLightState state_;
    InputLoop inputLoop_;
    OutputLoop outputLoop_;
};

// spacenavd + WLED at `fixtureAddress`; blocks until `running` is cleared
void runDaemon(const std::string& fixtureAddress, const RunFlag& running);
