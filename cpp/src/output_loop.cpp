// cpp/src/output_loop.cpp
#include "output_loop.h"
#include "errors.h"
#include "logger.h"

#include <chrono>
#include <exception>
#include <future>
#include <sstream>
#include <thread>
#include <utility>

const char* connectionStateName(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Connected:    return "connected";
    }
    return "?";
}

// -----------------------------
// FixtureSession
// -----------------------------
FixtureSession::FixtureSession(std::unique_ptr<FixtureClient> client)
    : client_(std::move(client))
{
    if (!client_) {
        throw ConnectionError("no fixture client");
    }
}

FixtureSession::~FixtureSession() {
    try {
        client_->close();
    } catch (const std::exception& e) {
        LOG_WARN(std::string("Error while closing the fixture connection: ") + e.what());
    }
}

// -----------------------------
// OutputLoop
// -----------------------------
OutputLoop::OutputLoop(FixtureFactory factory, const SharedLightState& state, const RunFlag& running,
                       const Timing& timing)
    : factory_(std::move(factory)),
      state_(state),
      running_(running),
      timing_(timing),
      connState_(ConnectionState::Disconnected),
      pushCount_(0)
{
}

void OutputLoop::setConnectionState(ConnectionState next) {
    ConnectionState prev = connState_.exchange(next);
    if (prev != next) {
        LOG_DEBUG(std::string("Fixture ") + connectionStateName(prev) + " -> " + connectionStateName(next));
    }
}

void OutputLoop::run() {
    while (running_.isRunning()) {
        try {
            attempt();
        } catch (const ConnectTimeout&) {
            LOG_WARN("Connection to WLED timed out. Retrying...");
        } catch (const ConnectionError& e) {
            LOG_ERROR(std::string("Could not connect to WLED: ") + e.what());
        } catch (const TransportError& e) {
            LOG_ERROR(std::string("Lost connection to WLED: ") + e.what());
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("An error occurred while talking to WLED: ") + e.what());
        }
        setConnectionState(ConnectionState::Disconnected);

        running_.sleepFor(timing_.cooldown);
    }
}

// one connection, from connect to the first error (or shutdown)
void OutputLoop::attempt() {
    setConnectionState(ConnectionState::Connecting);
    FixtureSession session(factory_());

    if (!connectWithin(session.client())) return;
    if (!session->connected()) {
        throw ConnectionError("fixture reported not connected after connect");
    }
    setConnectionState(ConnectionState::Connected);
    LOG_INFO("Connected to WLED!");

    // instabile Verbindung nicht sofort befeuern
    if (!running_.sleepFor(timing_.settleDelay)) return;

    syncConnected(*session);
}

// The client is handed the timeout as well, but name resolution inside
// connect() is not bounded by it, so the deadline is enforced here.
// Returns false when stopped while waiting.
bool OutputLoop::connectWithin(const std::shared_ptr<FixtureClient>& client) {
    auto done = std::make_shared<std::promise<void>>();
    std::future<void> result = done->get_future();
    const std::chrono::milliseconds timeout = timing_.connectTimeout;

    std::thread([client, done, timeout]() {
        try {
            client->connect(timeout);
            done->set_value();
        } catch (...) {
            done->set_exception(std::current_exception());
        }
    }).detach();

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (result.wait_for(timing_.pollInterval) != std::future_status::ready) {
        if (!running_.isRunning()) return false;
        if (std::chrono::steady_clock::now() >= deadline) {
            throw ConnectTimeout("no answer within " + std::to_string(timeout.count()) + " ms");
        }
    }
    result.get();   // rethrows the client's error
    return true;
}

void OutputLoop::syncConnected(FixtureClient& client) {
    std::optional<FixtureLevels> lastPushed;
    auto lastContact = std::chrono::steady_clock::now();

    while (running_.isRunning()) {
        if (!client.connected()) {
            throw TransportError("fixture dropped the connection");
        }

        FixtureLevels levels = toFixtureLevels(state_.read());
        if (!lastPushed || *lastPushed != levels) {
            client.setMaster(levels.on, kMasterBrightness);
            client.setSegment(kSegmentIndex, levels.brightness, levels.colorTemperature);
            lastPushed = levels;
            lastContact = std::chrono::steady_clock::now();
            ++pushCount_;

            std::ostringstream oss;
            oss << "Pushed on=" << (levels.on ? "true" : "false")
                << " brightness=" << levels.brightness
                << " cct=" << levels.colorTemperature;
            LOG_DEBUG(oss.str());
        } else if (std::chrono::steady_clock::now() - lastContact >= timing_.livenessInterval) {
            client.heartbeat();
            lastContact = std::chrono::steady_clock::now();
        }

        running_.sleepFor(timing_.pollInterval);
    }
}
