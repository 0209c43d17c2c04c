#include <gtest/gtest.h>
#include "../src/status_server.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <vector>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

constexpr int kTestPort = 18931;

TargetHealthSnapshot api_snapshot() {
    TargetHealthSnapshot snap;
    snap.name = "api";
    snap.url = "https://api.example.test";
    snap.current_status = HealthStatus::Healthy;
    snap.total_checks = 4;
    snap.successful_checks = 4;
    snap.uptime_percentage = 100.0;
    return snap;
}

} // namespace

class StatusServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        server = std::make_unique<StatusServer>("127.0.0.1", kTestPort, [this]() {
            if (fail_provider) {
                throw std::runtime_error("snapshot unavailable");
            }
            return std::vector<TargetHealthSnapshot>{api_snapshot()};
        });
        server->start();
        ASSERT_TRUE(server->is_running());
    }

    void TearDown() override {
        server->stop();
    }

    std::unique_ptr<StatusServer> server;
    std::atomic<bool> fail_provider{false};
};

TEST_F(StatusServerTest, HealthEndpoint) {
    httplib::Client client("127.0.0.1", kTestPort);
    auto res = client.Get("/health");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);

    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["status"], "healthy");
    EXPECT_EQ(body["service"], "httpmon");
}

TEST_F(StatusServerTest, StatusEndpointServesSnapshots) {
    httplib::Client client("127.0.0.1", kTestPort);
    auto res = client.Get("/status");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);

    auto body = nlohmann::json::parse(res->body);
    ASSERT_EQ(body["targets"].size(), 1u);
    EXPECT_EQ(body["targets"][0]["name"], "api");
    EXPECT_EQ(body["targets"][0]["total_checks"], 4);
}

TEST_F(StatusServerTest, ProviderFailureIsServerError) {
    fail_provider = true;
    httplib::Client client("127.0.0.1", kTestPort);
    auto res = client.Get("/status");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 500);
}

TEST(StatusServerBindTest, PortInUseFailsStart) {
    // A plain listener without SO_REUSEPORT, so no later socket can share the port
    int holder = ::socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(holder, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ASSERT_EQ(::bind(holder, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
    ASSERT_EQ(::listen(holder, 1), 0);
    socklen_t len = sizeof(addr);
    ASSERT_EQ(::getsockname(holder, reinterpret_cast<sockaddr*>(&addr), &len), 0);
    int taken_port = ntohs(addr.sin_port);

    StatusServer server("127.0.0.1", taken_port, []() { return std::vector<TargetHealthSnapshot>{}; });
    EXPECT_THROW(server.start(), std::runtime_error);
    EXPECT_FALSE(server.is_running());

    ::close(holder);
}
