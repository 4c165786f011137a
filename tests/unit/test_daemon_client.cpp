#include <atomic>
#include <chrono>
#include <cstring>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include "engine/daemon_client.hpp"
#include "engine/remote_stores.hpp"
#include "fake_engine.hpp"

namespace {

using continuity::core::errors::ErrorKind;
using continuity::core::errors::get_error;
using continuity::core::errors::get_value;
using continuity::core::errors::is_error;
using continuity::engine::DaemonClient;
using continuity::engine::DaemonClientOptions;
using continuity::engine::RemoteContextPredictor;
using continuity::engine::RemoteEmbeddingIndex;
using continuity::engine::RemoteTemporalGraph;
using continuity::engine::StoreError;
using continuity::fakes::TempDir;
using nlohmann::json;

// Minimal line-delimited JSON daemon: one request per connection, answered by `reply`.
// An empty reply closes the connection without answering.
class FakeDaemon {
public:
    using Reply = std::function<std::string(const json& request)>;

    FakeDaemon(const std::filesystem::path& socket_path, Reply reply)
        : path_(socket_path), reply_(std::move(reply)) {
        listen_fd_ = socket(AF_UNIX, SOCK_STREAM, 0);
        sockaddr_un addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, path_.c_str(), sizeof(addr.sun_path) - 1);
        bound_ = bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 &&
                 listen(listen_fd_, 8) == 0;
        thread_ = std::thread([this]() { serve(); });
    }

    ~FakeDaemon() {
        stop_.store(true);
        shutdown(listen_fd_, SHUT_RDWR);
        close(listen_fd_);
        thread_.join();
        unlink(path_.c_str());
    }

    bool bound() const { return bound_; }
    json last_request() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_request_;
    }

private:
    void serve() {
        while (!stop_.load()) {
            const int client = accept(listen_fd_, nullptr, nullptr);
            if (client < 0) {
                return;
            }
            std::string buffer;
            char chunk[1024];
            while (buffer.find('\n') == std::string::npos) {
                const ssize_t n = read(client, chunk, sizeof(chunk));
                if (n <= 0) {
                    break;
                }
                buffer.append(chunk, static_cast<std::size_t>(n));
            }
            const json request = json::parse(buffer.substr(0, buffer.find('\n')), nullptr, false);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                last_request_ = request;
            }
            const std::string answer = reply_(request);
            if (!answer.empty()) {
                const std::string line = answer + "\n";
                static_cast<void>(write(client, line.data(), line.size()));
            }
            close(client);
        }
    }

    std::filesystem::path path_;
    Reply reply_;
    int listen_fd_ = -1;
    bool bound_ = false;
    std::atomic<bool> stop_{false};
    mutable std::mutex mutex_;
    json last_request_;
    std::thread thread_;
};

std::string result_for(const json& request, const json& result) {
    return json{{"id", request["id"]}, {"result", result}}.dump();
}

DaemonClientOptions options_for(const std::filesystem::path& socket_path) {
    DaemonClientOptions options;
    options.socket_path = socket_path;
    options.connect_timeout_ms = 500;
    options.response_timeout_ms = 500;
    return options;
}

TEST(DaemonClientTest, CallReturnsResultForMatchingId) {
    TempDir dir("daemon_client");
    const auto socket_path = dir.root() / "engine.sock";
    FakeDaemon daemon(socket_path, [](const json& request) {
        return result_for(request, {{"echo", request["method"]}});
    });
    ASSERT_TRUE(daemon.bound());

    DaemonClient client(options_for(socket_path));
    auto result = client.call("graph.stats", json::object());
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result)["echo"], "graph.stats");
    EXPECT_FALSE(is_error(client.ping()));
}

TEST(DaemonClientTest, MissingSocketIsUnreachable) {
    TempDir dir("daemon_client");
    DaemonClient client(options_for(dir.root() / "absent.sock"));
    auto result = client.ping();
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::HandlerFailure);
    EXPECT_EQ(get_error(result).store, "engine_daemon");
    EXPECT_EQ(get_error(result).code, "daemon_unreachable");
}

TEST(DaemonClientTest, DaemonErrorIsReported) {
    TempDir dir("daemon_client");
    const auto socket_path = dir.root() / "engine.sock";
    FakeDaemon daemon(socket_path, [](const json& request) {
        return json{{"id", request["id"]}, {"error", {{"message", "collection missing"}}}}.dump();
    });
    ASSERT_TRUE(daemon.bound());

    DaemonClient client(options_for(socket_path));
    auto result = client.call("embeddings.stats", json::object());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "daemon_error");
    EXPECT_NE(get_error(result).message.find("collection missing"), std::string::npos);
}

TEST(DaemonClientTest, MismatchedIdAndGarbageAreBadResponses) {
    TempDir dir("daemon_client");
    const auto socket_path = dir.root() / "engine.sock";
    std::atomic<int> calls{0};
    FakeDaemon daemon(socket_path, [&calls](const json& request) {
        if (calls.fetch_add(1) == 0) {
            return json{{"id", request["id"].get<int>() + 100}, {"result", true}}.dump();
        }
        return std::string("not json");
    });
    ASSERT_TRUE(daemon.bound());

    DaemonClient client(options_for(socket_path));
    auto mismatched = client.call("ping", json::object());
    ASSERT_TRUE(is_error(mismatched));
    EXPECT_EQ(get_error(mismatched).code, "daemon_bad_response");

    auto garbage = client.call("ping", json::object());
    ASSERT_TRUE(is_error(garbage));
    EXPECT_EQ(get_error(garbage).code, "daemon_bad_response");
}

TEST(DaemonClientTest, ClosedWithoutAnswer) {
    TempDir dir("daemon_client");
    const auto socket_path = dir.root() / "engine.sock";
    FakeDaemon daemon(socket_path, [](const json&) { return std::string(); });
    ASSERT_TRUE(daemon.bound());

    DaemonClient client(options_for(socket_path));
    auto result = client.call("ping", json::object());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "daemon_closed");
}

TEST(RemoteStoresTest, SearchSendsCollectionAndParsesResults) {
    TempDir dir("daemon_client");
    const auto socket_path = dir.root() / "engine.sock";
    FakeDaemon daemon(socket_path, [](const json& request) {
        return result_for(request,
                          {{"results", json::array({{{"activity_id", "a1"},
                                                     {"document", "edited parser"},
                                                     {"score", 0.9}}})}});
    });
    ASSERT_TRUE(daemon.bound());

    auto client = std::make_shared<const DaemonClient>(options_for(socket_path));
    RemoteEmbeddingIndex index(client, "activities");
    const auto hits = index.search("parser", 5);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].activity_id, "a1");
    EXPECT_DOUBLE_EQ(hits[0].score, 0.9);

    const json request = daemon.last_request();
    EXPECT_EQ(request["method"], "embeddings.search");
    EXPECT_EQ(request["params"]["collection"], "activities");
    EXPECT_EQ(request["params"]["n_results"], 5);
}

TEST(RemoteStoresTest, GraphAcceptsBooleanOrExistsObject) {
    TempDir dir("daemon_client");
    const auto socket_path = dir.root() / "engine.sock";
    FakeDaemon daemon(socket_path, [](const json& request) {
        if (request["params"]["activity_id"] == "a1") {
            return result_for(request, true);
        }
        return result_for(request, {{"exists", false}});
    });
    ASSERT_TRUE(daemon.bound());

    RemoteTemporalGraph graph(std::make_shared<const DaemonClient>(options_for(socket_path)));
    EXPECT_TRUE(graph.has_activity("a1"));
    EXPECT_FALSE(graph.has_activity("a2"));
}

TEST(RemoteStoresTest, RelatedDistanceSentAsFloatKeepsItsValue) {
    TempDir dir("daemon_client");
    const auto socket_path = dir.root() / "engine.sock";
    FakeDaemon daemon(socket_path, [](const json& request) {
        return result_for(
            request, {{"related", json::array({{{"activity", {{"id", "a3"}}},
                                                {"distance", 3.0},
                                                {"path", json::array({"a1", "a2", "a3"})}}})}});
    });
    ASSERT_TRUE(daemon.bound());

    RemoteTemporalGraph graph(std::make_shared<const DaemonClient>(options_for(socket_path)));
    const auto related = graph.related("a1", 5);
    ASSERT_EQ(related.size(), 1u);
    EXPECT_EQ(related[0].distance, 3);
    EXPECT_EQ(related[0].path.size(), 3u);
}

TEST(RemoteStoresTest, RelatedWithoutDistanceIsAGraphFault) {
    TempDir dir("daemon_client");
    const auto socket_path = dir.root() / "engine.sock";
    FakeDaemon daemon(socket_path, [](const json& request) {
        return result_for(request,
                          {{"related", json::array({{{"activity", {{"id", "a3"}}},
                                                     {"distance", "far"}}})}});
    });
    ASSERT_TRUE(daemon.bound());

    RemoteTemporalGraph graph(std::make_shared<const DaemonClient>(options_for(socket_path)));
    try {
        static_cast<void>(graph.related("a1", 2));
        FAIL() << "expected StoreError";
    } catch (const StoreError& e) {
        EXPECT_EQ(e.store(), "graph");
        EXPECT_NE(std::string(e.what()).find("related"), std::string::npos);
    }
}

TEST(RemoteStoresTest, DaemonFailureRaisesStoreErrorForThatStore) {
    TempDir dir("daemon_client");
    RemoteContextPredictor predictor(
        std::make_shared<const DaemonClient>(options_for(dir.root() / "absent.sock")), 3600);
    try {
        static_cast<void>(predictor.predict("editing", 3));
        FAIL() << "expected StoreError";
    } catch (const StoreError& e) {
        EXPECT_EQ(e.store(), "predictor");
    }
}

}  // namespace
