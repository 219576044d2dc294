#pragma once

#include <chrono>
#include <functional>
#include <memory>

// ----------------------------------------------------------
// Netzwerk-Leuchte (Master + Segmente)
// ----------------------------------------------------------
class FixtureClient
{
public:
    virtual ~FixtureClient() = default;

    // throws ConnectTimeout when nothing answers within `timeout`,
    // ConnectionError for every other failure
    virtual void connect(std::chrono::milliseconds timeout) = 0;

    virtual bool connected() const = 0;

    // cheap round trip while idle; marks the client disconnected and
    // throws TransportError when the fixture no longer answers
    virtual void heartbeat() = 0;

    // fixture-wide power and global brightness; throws TransportError
    virtual void setMaster(bool on, int brightness) = 0;

    // one segment's brightness and color temperature; throws TransportError
    virtual void setSegment(int index, int brightness, int colorTemperature) = 0;

    virtual void close() = 0;
};

// A fresh client per connection attempt.
using FixtureFactory = std::function<std::unique_ptr<FixtureClient>()>;
