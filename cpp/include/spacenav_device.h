#pragma once

#include <cstddef>
#include <string>

#include "input_device.h"

static constexpr const char* kSpacenavSocket = "/var/run/spnav.sock";

// ----------------------------------------------------------
// SpacenavDevice – spricht direkt mit spacenavd über den UNIX-Socket
// ----------------------------------------------------------
class SpacenavDevice : public InputDevice
{
public:
    explicit SpacenavDevice(const std::string& socketPath = kSpacenavSocket);
    ~SpacenavDevice() override;

    SpacenavDevice(const SpacenavDevice&) = delete;
    SpacenavDevice& operator=(const SpacenavDevice&) = delete;

    void open() override;
    InputEvent poll() override;
    void close() override;

    bool isOpen() const { return fd_ >= 0; }

private:
    // one spacenavd event = 8 native ints
    static constexpr size_t kEventWords = 8;
    static constexpr size_t kEventBytes = kEventWords * sizeof(int);

    std::string socketPath_;
    int fd_;
    unsigned char pending_[kEventBytes];
    size_t pendingLen_;
};

// Decodes one raw spacenavd packet. Unknown event types give a None event.
InputEvent decodeSpacenavEvent(const int (&data)[8]);
