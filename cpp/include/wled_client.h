#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

#include "fixture_client.h"

static constexpr uint16_t kWledHttpPort = 80;
static constexpr std::chrono::milliseconds kWledRequestTimeout{5000};

struct HttpResponse
{
    int status = 0;
    std::string body;
};

// ----------------------------------------------------------
// WledClient – WLED JSON API über HTTP/1.1
//
//  connect      GET  /json/info   (must identify a WLED build)
//  heartbeat    GET  /json/info
//  setMaster    POST /json/state  {"on":..,"bri":..}
//  setSegment   POST /json/state  {"seg":[{"id":..,"bri":..,"cct":..}]}
//
// Every request uses its own TCP connection ("Connection: close").
// `connected()` is the session state: set by a good /json/info,
// cleared by close() or by any failed request.
// ----------------------------------------------------------
class WledClient : public FixtureClient
{
public:
    explicit WledClient(const std::string& host, uint16_t port = kWledHttpPort,
                        std::chrono::milliseconds requestTimeout = kWledRequestTimeout);
    ~WledClient() override;

    void connect(std::chrono::milliseconds timeout) override;
    bool connected() const override { return connected_; }
    void heartbeat() override;
    void setMaster(bool on, int brightness) override;
    void setSegment(int index, int brightness, int colorTemperature) override;
    void close() override;

    const std::string& version() const { return version_; }

private:
    HttpResponse request(const std::string& method, const std::string& path,
                         const std::string& body,
                         std::chrono::steady_clock::time_point deadline);
    std::string fetchVersion(std::chrono::steady_clock::time_point deadline);
    void postState(const std::string& payload);

    std::string host_;
    uint16_t port_;
    std::chrono::milliseconds requestTimeout_;
    // written by a connect the output loop may already have given up on
    std::atomic<bool> connected_;
    std::string version_;
};

// JSON payloads, exposed for tests
std::string masterStateJson(bool on, int brightness);
std::string segmentStateJson(int index, int brightness, int colorTemperature);

// Throws TransportError on a malformed status line.
HttpResponse parseHttpResponse(const std::string& raw);

// "ver" of a /json/info reply, empty if the reply is no WLED info object.
// Throws ConnectionError when the body is not JSON at all.
std::string wledVersion(const std::string& infoBody);
