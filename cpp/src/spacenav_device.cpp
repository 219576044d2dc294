// cpp/src/spacenav_device.cpp
#include "spacenav_device.h"
#include "errors.h"

#include <sys/socket.h>
#include <sys/un.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

// spacenavd event types
static constexpr int UEV_MOTION = 0;
static constexpr int UEV_PRESS = 1;
static constexpr int UEV_RELEASE = 2;

InputEvent decodeSpacenavEvent(const int (&data)[8]) {
    InputEvent ev;
    switch (data[0]) {
        case UEV_MOTION:
            ev.type = InputEventType::Motion;
            ev.motion.x = data[1];
            ev.motion.y = data[2];
            ev.motion.z = data[3];
            ev.motion.rx = data[4];
            ev.motion.ry = data[5];
            ev.motion.rz = data[6];
            ev.motion.period = static_cast<unsigned int>(data[7]);
            break;
        case UEV_PRESS:
        case UEV_RELEASE:
            ev.type = InputEventType::Button;
            ev.button.button = data[1];
            ev.button.pressed = data[0] == UEV_PRESS;
            break;
        default:
            break;
    }
    return ev;
}

SpacenavDevice::SpacenavDevice(const std::string& socketPath)
    : socketPath_(socketPath),
      fd_(-1),
      pendingLen_(0)
{
}

SpacenavDevice::~SpacenavDevice() {
    close();
}

// -----------------------------
// Socket open/close
// -----------------------------
void SpacenavDevice::open() {
    close();

    sockaddr_un addr{};
    if (socketPath_.size() >= sizeof(addr.sun_path)) {
        throw ConnectionError("spacenavd socket path too long: " + socketPath_);
    }
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, socketPath_.c_str(), sizeof(addr.sun_path) - 1);

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) {
        throw ConnectionError(systemErrorText("socket", errno));
    }

    if (connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        ::close(fd);
        throw ConnectionError(systemErrorText("connect " + socketPath_, err));
    }

    fd_ = fd;
    pendingLen_ = 0;
}

void SpacenavDevice::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    pendingLen_ = 0;
}

// -----------------------------
// Poll (non-blocking)
// -----------------------------
InputEvent SpacenavDevice::poll() {
    if (fd_ < 0) {
        throw ConnectionError("spacenavd connection not open");
    }

    while (pendingLen_ < kEventBytes) {
        pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLIN;

        int ready = ::poll(&pfd, 1, 0);
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw ConnectionError(systemErrorText("poll spacenavd", errno));
        }
        if (ready == 0) return InputEvent{};   // nichts da

        ssize_t n = read(fd_, pending_ + pendingLen_, kEventBytes - pendingLen_);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            close();
            throw ConnectionError(systemErrorText("read spacenavd", err));
        }
        if (n == 0) {
            close();
            throw ConnectionError("spacenavd closed the connection");
        }
        pendingLen_ += static_cast<size_t>(n);
    }

    int data[kEventWords];
    std::memcpy(data, pending_, kEventBytes);
    pendingLen_ = 0;

    return decodeSpacenavEvent(data);
}
