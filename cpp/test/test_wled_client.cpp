/**
 * spacelight - WLED Client Tests
 *
 * - JSON payloads, /json/info version check and HTTP response parsing
 * - connect / heartbeat / setMaster / setSegment against a local HTTP server
 * - Timeout, refusal and error status handling
 */

#include <unity.h>

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "errors.h"
#include "wled_client.h"

using json = nlohmann::json;

static const char* kInfoBody = "{\"ver\":\"0.14.4\",\"vid\":2405180,\"name\":\"CCT Lamp\",\"brand\":\"WLED\"}";

//==============================================================================
// Minimal HTTP server, one canned response per accepted connection
//==============================================================================

class TestHttpServer
{
public:
    TestHttpServer() : fd_(-1), port_(0) {
        fd_ = socket(AF_INET, SOCK_STREAM, 0);
        int opt = 1;
        setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        listen(fd_, 8);

        socklen_t len = sizeof(addr);
        getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
    }

    ~TestHttpServer() {
        join();
        if (fd_ >= 0) close(fd_);
    }

    uint16_t port() const { return port_; }

    void serve(const std::vector<std::string>& responses) {
        thread_ = std::thread([this, responses]() {
            for (const auto& response : responses) {
                int client = accept(fd_, nullptr, nullptr);
                if (client < 0) return;

                std::string request = readRequest(client);
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    requests_.push_back(request);
                }
                size_t sent = 0;
                while (sent < response.size()) {
                    ssize_t n = write(client, response.data() + sent, response.size() - sent);
                    if (n <= 0) break;
                    sent += static_cast<size_t>(n);
                }
                close(client);
            }
        });
    }

    void join() {
        if (thread_.joinable()) thread_.join();
    }

    std::vector<std::string> requests() {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    static std::string readRequest(int client) {
        std::string data;
        char buf[512];
        size_t headerEnd = std::string::npos;
        size_t expected = 0;

        for (;;) {
            if (headerEnd != std::string::npos && data.size() >= headerEnd + 4 + expected) break;

            ssize_t n = read(client, buf, sizeof(buf));
            if (n <= 0) break;
            data.append(buf, n);

            if (headerEnd == std::string::npos) {
                headerEnd = data.find("\r\n\r\n");
                if (headerEnd != std::string::npos) {
                    size_t cl = data.find("Content-Length: ");
                    if (cl != std::string::npos && cl < headerEnd) {
                        expected = std::stoul(data.substr(cl + 16));
                    }
                }
            }
        }
        return data;
    }

    int fd_;
    uint16_t port_;
    std::thread thread_;
    std::mutex mutex_;
    std::vector<std::string> requests_;
};

static std::string httpResponse(int status, const std::string& body) {
    return "HTTP/1.1 " + std::to_string(status) + " X\r\n"
           "Content-Type: application/json\r\n"
           "Content-Length: " + std::to_string(body.size()) + "\r\n"
           "Connection: close\r\n\r\n" + body;
}

static std::string bodyOf(const std::string& request) {
    size_t pos = request.find("\r\n\r\n");
    return pos == std::string::npos ? "" : request.substr(pos + 4);
}

void setUp() {}

void tearDown() {}

//==============================================================================
// Payloads / parsing
//==============================================================================

void test_master_json() {
    json on = json::parse(masterStateJson(true, 255));
    TEST_ASSERT_EQUAL_INT(2, static_cast<int>(on.size()));
    TEST_ASSERT_TRUE(on["on"].get<bool>());
    TEST_ASSERT_EQUAL_INT(255, on["bri"].get<int>());

    json off = json::parse(masterStateJson(false, -3));
    TEST_ASSERT_FALSE(off["on"].get<bool>());
    TEST_ASSERT_EQUAL_INT(0, off["bri"].get<int>());
}

void test_segment_json() {
    json state = json::parse(segmentStateJson(0, 255, 127));
    TEST_ASSERT_EQUAL_INT(1, static_cast<int>(state.size()));
    TEST_ASSERT_TRUE(state["seg"].is_array());
    TEST_ASSERT_EQUAL_INT(1, static_cast<int>(state["seg"].size()));
    const json& seg = state["seg"][0];
    TEST_ASSERT_EQUAL_INT(0, seg["id"].get<int>());
    TEST_ASSERT_EQUAL_INT(255, seg["bri"].get<int>());
    TEST_ASSERT_EQUAL_INT(127, seg["cct"].get<int>());

    const json clamped = json::parse(segmentStateJson(2, 400, -1))["seg"][0];
    TEST_ASSERT_EQUAL_INT(2, clamped["id"].get<int>());
    TEST_ASSERT_EQUAL_INT(255, clamped["bri"].get<int>());
    TEST_ASSERT_EQUAL_INT(0, clamped["cct"].get<int>());
}

void test_parse_response() {
    HttpResponse resp = parseHttpResponse(httpResponse(200, "{\"success\":true}"));
    TEST_ASSERT_EQUAL_INT(200, resp.status);
    TEST_ASSERT_EQUAL_STRING("{\"success\":true}", resp.body.c_str());
}

void test_parse_chunked_response() {
    std::string raw = "HTTP/1.1 200 OK\r\nTransfer-Encoding: Chunked\r\n\r\n"
                      "7\r\n{\"ver\":\r\n"
                      "8\r\n\"0.14.4\"\r\n"
                      "1\r\n}\r\n"
                      "0\r\n\r\n";
    HttpResponse resp = parseHttpResponse(raw);
    TEST_ASSERT_EQUAL_STRING("{\"ver\":\"0.14.4\"}", resp.body.c_str());
}

void test_parse_garbage_throws() {
    bool thrown = false;
    try {
        parseHttpResponse("SSH-2.0-OpenSSH_9.6\r\n");
    } catch (const TransportError&) {
        thrown = true;
    }
    TEST_ASSERT_TRUE(thrown);
}

void test_wled_version() {
    TEST_ASSERT_EQUAL_STRING("0.14.4", wledVersion(kInfoBody).c_str());
    // a string value that merely contains "ver" is not the field
    TEST_ASSERT_EQUAL_STRING("0.14.4",
        wledVersion("{\"name\":\"\\\"ver\\\":\\\"1\\\"\",\"ver\":\"0.14.4\"}").c_str());
    TEST_ASSERT_EQUAL_STRING("0.14.4", wledVersion("{\"name\":\"ver\",\"ver\":\"0.14.4\"}").c_str());
    TEST_ASSERT_EQUAL_STRING("0.14.4",
        wledVersion("{\"fs\":{\"ver\":\"nested\"},\"ver\":\"0.14.4\"}").c_str());
    // only the top-level field counts
    TEST_ASSERT_EQUAL_STRING("", wledVersion("{\"fs\":{\"ver\":\"0.14.4\"}}").c_str());
    TEST_ASSERT_EQUAL_STRING("0.150", wledVersion("{\"ver\":\"0.15\\u0030\"}").c_str());
    TEST_ASSERT_EQUAL_STRING("", wledVersion("{\"hello\":\"world\"}").c_str());
    TEST_ASSERT_EQUAL_STRING("", wledVersion("[\"ver\",\"0.14.4\"]").c_str());
}

void test_wled_version_of_garbage_throws() {
    bool thrown = false;
    try {
        wledVersion("<html>router login</html>");
    } catch (const ConnectionError&) {
        thrown = true;
    }
    TEST_ASSERT_TRUE(thrown);
}

//==============================================================================
// Against a local server
//==============================================================================

void test_connect_and_push() {
    TestHttpServer server;
    server.serve({httpResponse(200, kInfoBody),
                  httpResponse(200, "{\"success\":true}"),
                  httpResponse(200, "{\"success\":true}")});

    WledClient client("127.0.0.1", server.port(), std::chrono::milliseconds(1000));
    client.connect(std::chrono::milliseconds(1000));
    TEST_ASSERT_TRUE(client.connected());
    TEST_ASSERT_EQUAL_STRING("0.14.4", client.version().c_str());

    client.setMaster(true, 255);
    client.setSegment(0, 200, 127);
    server.join();

    std::vector<std::string> requests = server.requests();
    TEST_ASSERT_EQUAL_INT(3, static_cast<int>(requests.size()));
    TEST_ASSERT_EQUAL_INT(0, static_cast<int>(requests[0].find("GET /json/info HTTP/1.1\r\n")));
    TEST_ASSERT_EQUAL_INT(0, static_cast<int>(requests[1].find("POST /json/state HTTP/1.1\r\n")));
    TEST_ASSERT_TRUE(json::parse(bodyOf(requests[1])) == json::parse(masterStateJson(true, 255)));
    json seg = json::parse(bodyOf(requests[2]))["seg"][0];
    TEST_ASSERT_EQUAL_INT(200, seg["bri"].get<int>());
    TEST_ASSERT_EQUAL_INT(127, seg["cct"].get<int>());

    client.close();
    TEST_ASSERT_FALSE(client.connected());
}

void test_connect_rejects_non_wled() {
    TestHttpServer server;
    server.serve({httpResponse(200, "{\"hello\":\"world\"}")});

    WledClient client("127.0.0.1", server.port());
    bool thrown = false;
    bool timedOut = false;
    try {
        client.connect(std::chrono::milliseconds(1000));
    } catch (const ConnectTimeout&) {
        timedOut = true;
    } catch (const ConnectionError&) {
        thrown = true;
    }
    TEST_ASSERT_TRUE(thrown);
    TEST_ASSERT_FALSE(timedOut);
    TEST_ASSERT_FALSE(client.connected());
}

void test_connect_http_error() {
    TestHttpServer server;
    server.serve({httpResponse(404, "not found")});

    WledClient client("127.0.0.1", server.port());
    bool thrown = false;
    try {
        client.connect(std::chrono::milliseconds(1000));
    } catch (const ConnectionError& e) {
        thrown = std::string(e.what()).find("404") != std::string::npos;
    }
    TEST_ASSERT_TRUE(thrown);
}

void test_connect_times_out_on_silent_host() {
    // listening but never answering: the kernel completes the handshake,
    // the response never comes
    TestHttpServer server;

    WledClient client("127.0.0.1", server.port());
    auto start = std::chrono::steady_clock::now();
    bool timedOut = false;
    try {
        client.connect(std::chrono::milliseconds(100));
    } catch (const ConnectTimeout&) {
        timedOut = true;
    }
    auto took = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    TEST_ASSERT_TRUE(timedOut);
    TEST_ASSERT_GREATER_OR_EQUAL(90, static_cast<int>(took.count()));
    TEST_ASSERT_LESS_THAN(1000, static_cast<int>(took.count()));
}

void test_connect_refused() {
    uint16_t port;
    {
        TestHttpServer gone;
        port = gone.port();
    }

    WledClient client("127.0.0.1", port);
    bool refused = false;
    bool timedOut = false;
    try {
        client.connect(std::chrono::milliseconds(500));
    } catch (const ConnectTimeout&) {
        timedOut = true;
    } catch (const ConnectionError&) {
        refused = true;
    }
    TEST_ASSERT_TRUE(refused);
    TEST_ASSERT_FALSE(timedOut);
}

void test_push_without_connect_throws() {
    WledClient client("127.0.0.1", 9);
    bool thrown = false;
    try {
        client.setMaster(true, 255);
    } catch (const TransportError&) {
        thrown = true;
    }
    TEST_ASSERT_TRUE(thrown);
}

void test_heartbeat_while_fixture_answers() {
    TestHttpServer server;
    server.serve({httpResponse(200, kInfoBody), httpResponse(200, kInfoBody)});

    WledClient client("127.0.0.1", server.port(), std::chrono::milliseconds(1000));
    client.connect(std::chrono::milliseconds(1000));
    client.heartbeat();
    server.join();

    TEST_ASSERT_TRUE(client.connected());
    std::vector<std::string> requests = server.requests();
    TEST_ASSERT_EQUAL_INT(2, static_cast<int>(requests.size()));
    TEST_ASSERT_EQUAL_INT(0, static_cast<int>(requests[1].find("GET /json/info HTTP/1.1\r\n")));
}

void test_heartbeat_notices_vanished_fixture() {
    std::unique_ptr<WledClient> client;
    {
        TestHttpServer server;
        server.serve({httpResponse(200, kInfoBody)});
        client = std::make_unique<WledClient>("127.0.0.1", server.port(), std::chrono::milliseconds(300));
        client->connect(std::chrono::milliseconds(1000));
        server.join();
    }
    // listener gone: the next request is refused
    TEST_ASSERT_TRUE(client->connected());

    bool thrown = false;
    try {
        client->heartbeat();
    } catch (const TransportError& e) {
        thrown = std::string(e.what()).find("heartbeat failed") != std::string::npos;
    }
    TEST_ASSERT_TRUE(thrown);
    TEST_ASSERT_FALSE(client->connected());
}

void test_push_error_status_disconnects() {
    TestHttpServer server;
    server.serve({httpResponse(200, kInfoBody), httpResponse(500, "")});

    WledClient client("127.0.0.1", server.port(), std::chrono::milliseconds(1000));
    client.connect(std::chrono::milliseconds(1000));

    bool thrown = false;
    try {
        client.setSegment(0, 10, 10);
    } catch (const TransportError&) {
        thrown = true;
    }
    server.join();

    TEST_ASSERT_TRUE(thrown);
    TEST_ASSERT_FALSE(client.connected());
}

//==============================================================================
// Test Suite Runner
//==============================================================================

int main() {
    UNITY_BEGIN();

    RUN_TEST(test_master_json);
    RUN_TEST(test_segment_json);
    RUN_TEST(test_parse_response);
    RUN_TEST(test_parse_chunked_response);
    RUN_TEST(test_parse_garbage_throws);
    RUN_TEST(test_wled_version);
    RUN_TEST(test_wled_version_of_garbage_throws);

    RUN_TEST(test_connect_and_push);
    RUN_TEST(test_connect_rejects_non_wled);
    RUN_TEST(test_connect_http_error);
    RUN_TEST(test_connect_times_out_on_silent_host);
    RUN_TEST(test_connect_refused);
    RUN_TEST(test_push_without_connect_throws);
    RUN_TEST(test_heartbeat_while_fixture_answers);
    RUN_TEST(test_heartbeat_notices_vanished_fixture);
    RUN_TEST(test_push_error_status_disconnects);

    return UNITY_END();
}
