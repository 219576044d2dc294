// cpp/src/wled_client.cpp
#include "wled_client.h"
#include "errors.h"
#include "light_state.h"

#include <sys/socket.h>
#include <sys/types.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <sstream>

using Clock = std::chrono::steady_clock;
using json = nlohmann::json;

// -----------------------------
// Hilfsfunktionen
// -----------------------------
static inline int clamp255(int v) {
    if (v < 0) return 0;
    if (v > kMaxLevel) return kMaxLevel;
    return v;
}

static int msLeft(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

// closes the socket on every exit path
class ScopedFd
{
public:
    explicit ScopedFd(int fd = -1) : fd_(fd) {}
    ~ScopedFd() { reset(); }

    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    int get() const { return fd_; }
    void reset(int fd = -1) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }

private:
    int fd_;
};

// Waits for `events` on fd until the deadline. Throws ConnectTimeout on expiry.
static void waitFor(int fd, short events, Clock::time_point deadline, const std::string& what) {
    for (;;) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = events;

        int ready = ::poll(&pfd, 1, msLeft(deadline));
        if (ready > 0) return;
        if (ready == 0) throw ConnectTimeout("timed out while " + what);
        if (errno != EINTR) throw ConnectionError(systemErrorText("poll", errno));
    }
}

static void connectTcp(ScopedFd& sock, const std::string& host, uint16_t port,
                       Clock::time_point deadline) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* result = nullptr;
    const std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &result);
    if (rc != 0) {
        throw ConnectionError("cannot resolve " + host + ": " + gai_strerror(rc));
    }

    std::string lastError = "no address for " + host;
    bool timedOut = false;

    for (addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        sock.reset(socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, ai->ai_protocol));
        if (sock.get() < 0) {
            lastError = systemErrorText("socket", errno);
            continue;
        }

        if (::connect(sock.get(), ai->ai_addr, ai->ai_addrlen) == 0) {
            freeaddrinfo(result);
            return;
        }
        if (errno != EINPROGRESS) {
            lastError = systemErrorText("connect " + host, errno);
            continue;
        }

        try {
            waitFor(sock.get(), POLLOUT, deadline, "connecting to " + host);
        } catch (const ConnectTimeout& e) {
            lastError = e.what();
            timedOut = true;
            break;
        }

        int soError = 0;
        socklen_t len = sizeof(soError);
        if (getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &soError, &len) < 0) {
            lastError = systemErrorText("getsockopt", errno);
            continue;
        }
        if (soError == 0) {
            freeaddrinfo(result);
            return;
        }
        lastError = systemErrorText("connect " + host, soError);
    }

    freeaddrinfo(result);
    sock.reset();
    if (timedOut) throw ConnectTimeout(lastError);
    throw ConnectionError(lastError);
}

static void sendAll(int fd, const std::string& data, Clock::time_point deadline) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            waitFor(fd, POLLOUT, deadline, "sending request");
            continue;
        }
        throw ConnectionError(systemErrorText("send", errno));
    }
}

static std::string readAll(int fd, Clock::time_point deadline) {
    std::string raw;
    char buf[1024];

    for (;;) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            raw.append(buf, n);
            continue;
        }
        if (n == 0) break;   // server closed -> response complete
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            waitFor(fd, POLLIN, deadline, "waiting for the response");
            continue;
        }
        throw ConnectionError(systemErrorText("read", errno));
    }
    return raw;
}

static std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::string decodeChunked(const std::string& body) {
    std::string out;
    size_t pos = 0;
    for (;;) {
        size_t lineEnd = body.find("\r\n", pos);
        if (lineEnd == std::string::npos) {
            throw TransportError("truncated chunked body");
        }
        size_t size = std::strtoul(body.substr(pos, lineEnd - pos).c_str(), nullptr, 16);
        pos = lineEnd + 2;
        if (size == 0) break;
        if (pos + size > body.size()) {
            throw TransportError("truncated chunked body");
        }
        out.append(body, pos, size);
        pos += size + 2;
    }
    return out;
}

// -----------------------------
// Payloads / parsing
// -----------------------------
std::string masterStateJson(bool on, int brightness) {
    json state = { {"on", on}, {"bri", clamp255(brightness)} };
    return state.dump();
}

std::string segmentStateJson(int index, int brightness, int colorTemperature) {
    json state = { {"seg", json::array({
        { {"id", index}, {"bri", clamp255(brightness)}, {"cct", clamp255(colorTemperature)} }
    })} };
    return state.dump();
}

HttpResponse parseHttpResponse(const std::string& raw) {
    HttpResponse resp;

    size_t lineEnd = raw.find("\r\n");
    std::istringstream status(raw.substr(0, lineEnd));
    std::string version;
    if (!(status >> version >> resp.status) || version.compare(0, 5, "HTTP/") != 0) {
        throw TransportError("malformed HTTP status line");
    }

    size_t headerEnd = raw.find("\r\n\r\n");
    if (headerEnd == std::string::npos) {
        return resp;
    }

    std::string headers = toLower(raw.substr(0, headerEnd));
    resp.body = raw.substr(headerEnd + 4);
    if (headers.find("transfer-encoding: chunked") != std::string::npos) {
        resp.body = decodeChunked(resp.body);
    }
    return resp;
}

std::string wledVersion(const std::string& infoBody) {
    try {
        json info = json::parse(infoBody);
        if (!info.is_object()) return "";
        return info.value("ver", std::string());
    } catch (const json::exception& e) {
        throw ConnectionError(std::string("unreadable /json/info reply: ") + e.what());
    }
}

// -----------------------------
// WledClient
// -----------------------------
WledClient::WledClient(const std::string& host, uint16_t port,
                       std::chrono::milliseconds requestTimeout)
    : host_(host),
      port_(port),
      requestTimeout_(requestTimeout),
      connected_(false)
{
}

WledClient::~WledClient() {
    close();
}

HttpResponse WledClient::request(const std::string& method, const std::string& path,
                                 const std::string& body, Clock::time_point deadline) {
    ScopedFd sock;
    connectTcp(sock, host_, port_, deadline);

    std::ostringstream req;
    req << method << " " << path << " HTTP/1.1\r\n"
        << "Host: " << host_ << "\r\n"
        << "Accept: application/json\r\n"
        << "Connection: close\r\n";
    if (!body.empty()) {
        req << "Content-Type: application/json\r\n"
            << "Content-Length: " << body.size() << "\r\n";
    }
    req << "\r\n" << body;

    sendAll(sock.get(), req.str(), deadline);
    std::string raw = readAll(sock.get(), deadline);
    if (raw.empty()) {
        throw ConnectionError(host_ + " closed the connection without a response");
    }
    return parseHttpResponse(raw);
}

std::string WledClient::fetchVersion(Clock::time_point deadline) {
    HttpResponse resp;
    try {
        resp = request("GET", "/json/info", "", deadline);
    } catch (const TransportError& e) {
        throw ConnectionError(e.what());
    }

    if (resp.status != 200) {
        throw ConnectionError("GET /json/info on " + host_ + " returned HTTP " + std::to_string(resp.status));
    }

    std::string version = wledVersion(resp.body);
    if (version.empty()) {
        throw ConnectionError(host_ + " does not look like a WLED device");
    }
    return version;
}

void WledClient::connect(std::chrono::milliseconds timeout) {
    connected_ = false;
    version_ = fetchVersion(Clock::now() + timeout);
    connected_ = true;
}

void WledClient::heartbeat() {
    if (!connected_) {
        throw TransportError("not connected to " + host_);
    }
    try {
        fetchVersion(Clock::now() + requestTimeout_);
    } catch (const ConnectionError& e) {
        connected_ = false;
        throw TransportError(std::string("heartbeat failed: ") + e.what());
    }
}

void WledClient::postState(const std::string& payload) {
    if (!connected_) {
        throw TransportError("not connected to " + host_);
    }

    HttpResponse resp;
    try {
        resp = request("POST", "/json/state", payload, Clock::now() + requestTimeout_);
    } catch (const ConnectionError& e) {
        connected_ = false;
        throw TransportError(e.what());
    } catch (const TransportError&) {
        connected_ = false;
        throw;
    }

    if (resp.status < 200 || resp.status >= 300) {
        connected_ = false;
        throw TransportError("POST /json/state on " + host_ + " returned HTTP " + std::to_string(resp.status));
    }
}

void WledClient::setMaster(bool on, int brightness) {
    postState(masterStateJson(on, brightness));
}

void WledClient::setSegment(int index, int brightness, int colorTemperature) {
    postState(segmentStateJson(index, brightness, colorTemperature));
}

void WledClient::close() {
    connected_ = false;
}
