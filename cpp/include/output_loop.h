#pragma once

#include <atomic>
#include <memory>
#include <optional>

#include "fixture_client.h"
#include "light_state.h"
#include "run_flag.h"
#include "timing.h"

// Master brightness stays at full, dimming happens per segment.
static constexpr int kMasterBrightness = 255;
static constexpr int kSegmentIndex = 0;

enum class ConnectionState
{
    Disconnected,
    Connecting,
    Connected
};

const char* connectionStateName(ConnectionState state);

// ----------------------------------------------------------
// FixtureSession – hält einen Client und ruft close() auf jedem Pfad
// ----------------------------------------------------------
class FixtureSession
{
public:
    explicit FixtureSession(std::unique_ptr<FixtureClient> client);
    ~FixtureSession();

    FixtureSession(const FixtureSession&) = delete;
    FixtureSession& operator=(const FixtureSession&) = delete;

    FixtureClient* operator->() const { return client_.get(); }
    FixtureClient& operator*() const { return *client_; }

    // shared with a connect that may still be running after we gave up on it
    const std::shared_ptr<FixtureClient>& client() const { return client_; }

private:
    std::shared_ptr<FixtureClient> client_;
};

// ----------------------------------------------------------
// OutputLoop – SharedLightState -> Leuchte
//
//  Disconnected -> Connecting -> Connected -> (Disconnected on error)
//
// While connected the current state is compared with the last pushed one
// every poll interval; a difference sends a master and a segment update.
// An idle connection gets a heartbeat every liveness interval.
// The baseline starts empty on every connection, so a reconnect always
// pushes the latest state.
// ----------------------------------------------------------
class OutputLoop
{
public:
    OutputLoop(FixtureFactory factory, const SharedLightState& state, const RunFlag& running,
               const Timing& timing);

    // Blocks until the RunFlag is cleared.
    void run();

    ConnectionState connectionState() const { return connState_.load(); }
    unsigned long pushCount() const { return pushCount_.load(); }

private:
    void attempt();
    bool connectWithin(const std::shared_ptr<FixtureClient>& client);
    void syncConnected(FixtureClient& client);
    void setConnectionState(ConnectionState next);

    FixtureFactory factory_;
    const SharedLightState& state_;
    const RunFlag& running_;
    Timing timing_;

    std::atomic<ConnectionState> connState_;
    std::atomic<unsigned long> pushCount_;
};
