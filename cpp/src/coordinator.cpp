// cpp/src/coordinator.cpp
#include "coordinator.h"
#include "logger.h"
#include "spacenav_device.h"
#include "wled_client.h"

#include <memory>
#include <thread>
#include <utility>

Coordinator::Coordinator(InputDevice& device, FixtureFactory factory, const RunFlag& running,
                         const Timing& timing)
    : inputLoop_(device, state_, running, timing),
      outputLoop_(std::move(factory), state_, running, timing)
{
}

void Coordinator::run() {
    LOG_INFO("Daemon started");

    std::thread inputThread([this]() { inputLoop_.run(); });
    std::thread outputThread([this]() { outputLoop_.run(); });

    inputThread.join();
    outputThread.join();

    LOG_INFO("Daemon stopped");
}

void runDaemon(const std::string& fixtureAddress, const RunFlag& running) {
    SpacenavDevice device;
    Coordinator coordinator(device, [fixtureAddress]() -> std::unique_ptr<FixtureClient> {
        return std::make_unique<WledClient>(fixtureAddress);
    }, running);

    coordinator.run();
}
