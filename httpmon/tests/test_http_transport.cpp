#include <gtest/gtest.h>
#include "../src/http_transport.hpp"
#include <httplib.h>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>

using namespace std::chrono_literals;

namespace {

constexpr std::size_t kChunkSize = 64 * 1024;
constexpr std::size_t kChunkCount = 200;

} // namespace

class CprTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        server.Get("/small", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("all good", "text/plain");
        });

        // Roughly 12 MiB trickled out over at least two seconds
        server.Get("/large", [this](const httplib::Request&, httplib::Response& res) {
            res.set_chunked_content_provider("application/octet-stream",
                [this](std::size_t, httplib::DataSink& sink) {
                    std::string chunk(kChunkSize, 'x');
                    for (std::size_t i = 0; i < kChunkCount; ++i) {
                        if (!sink.is_writable() || !sink.write(chunk.data(), chunk.size())) {
                            return false;
                        }
                        chunks_written++;
                        std::this_thread::sleep_for(10ms);
                    }
                    sink.done();
                    return true;
                });
        });

        port = server.bind_to_any_port("127.0.0.1");
        ASSERT_GT(port, 0);
        listener = std::thread([this]() { server.listen_after_bind(); });
        while (!server.is_running()) {
            std::this_thread::sleep_for(1ms);
        }
    }

    void TearDown() override {
        server.stop();
        if (listener.joinable()) {
            listener.join();
        }
    }

    HttpRequest get(const std::string& path, bool read_body) const {
        HttpRequest request;
        request.url = "http://127.0.0.1:" + std::to_string(port) + path;
        request.timeout = 10s;
        request.read_body = read_body;
        return request;
    }

    httplib::Server server;
    std::thread listener;
    int port = 0;
    std::atomic<std::size_t> chunks_written{0};
    CprTransport transport;
};

TEST_F(CprTransportTest, ReadsBodyWhenAsked) {
    auto response = transport.send(get("/small", true));

    EXPECT_TRUE(response.received());
    EXPECT_EQ(response.status_code, 200);
    EXPECT_EQ(response.body, "all good");
    EXPECT_FALSE(response.body_error.has_value());
}

TEST_F(CprTransportTest, StatusOnlyRequestStopsAfterHeaders) {
    auto start = std::chrono::steady_clock::now();
    auto response = transport.send(get("/large", false));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(response.received());
    EXPECT_EQ(response.status_code, 200);
    EXPECT_TRUE(response.body.empty());
    EXPECT_FALSE(response.body_error.has_value());

    // The full stream takes two seconds or more
    EXPECT_LT(elapsed, 1s);
    EXPECT_LT(chunks_written.load(), kChunkCount);
}

TEST_F(CprTransportTest, RefusedConnectionIsTransportError) {
    HttpRequest request;
    request.url = "http://127.0.0.1:1/";
    request.timeout = 2s;

    auto response = transport.send(request);

    EXPECT_FALSE(response.received());
    EXPECT_EQ(response.status_code, 0);
}
