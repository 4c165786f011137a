#include "engine/daemon_client.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <limits>
#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <utility>

namespace continuity::engine {

using core::errors::ContinuityError;
using core::errors::ErrorKind;
using nlohmann::json;

namespace {

constexpr const char* kDaemonStore = "engine_daemon";

class SocketHandle {
public:
    explicit SocketHandle(const int fd) : fd_(fd) {}
    ~SocketHandle() {
        if (fd_ >= 0) {
            static_cast<void>(close(fd_));
        }
    }
    SocketHandle(const SocketHandle&) = delete;
    SocketHandle& operator=(const SocketHandle&) = delete;

    int fd() const { return fd_; }

private:
    int fd_;
};

using Deadline = std::chrono::steady_clock::time_point;

int remaining_ms(const Deadline deadline) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                          deadline - std::chrono::steady_clock::now())
                          .count();
    if (left <= 0) {
        return 0;
    }
    return static_cast<int>(std::min<std::int64_t>(left, std::numeric_limits<int>::max()));
}

ContinuityError daemon_error(const std::string& message, const std::string& code) {
    ContinuityError err = core::errors::store_failure(kDaemonStore, message);
    err.code = code;
    return err;
}

// Waits for `events` on fd until the deadline; false on timeout or poll failure.
bool wait_for(const int fd, const short events, const Deadline deadline) {
    while (true) {
        pollfd pfd{fd, events, 0};
        const int rc = poll(&pfd, 1, remaining_ms(deadline));
        if (rc > 0) {
            return true;
        }
        if (rc == 0) {
            return false;
        }
        if (errno != EINTR) {
            return false;
        }
    }
}

core::errors::Result<bool> connect_socket(const int fd, const std::filesystem::path& path,
                                          const std::uint32_t timeout_ms) {
    sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    const std::string native = path.string();
    if (native.size() >= sizeof(addr.sun_path)) {
        return daemon_error("Engine socket path too long: " + native, "socket_path_too_long");
    }
    std::strncpy(addr.sun_path, native.c_str(), sizeof(addr.sun_path) - 1);

    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags != -1) {
        static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
    }

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0) {
        return true;
    }
    if (errno != EINPROGRESS && errno != EAGAIN) {
        return daemon_error("Cannot connect to engine daemon at " + native + ": " +
                                std::strerror(errno),
                            "daemon_unreachable");
    }

    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    if (!wait_for(fd, POLLOUT, deadline)) {
        return daemon_error("Timed out connecting to engine daemon at " + native,
                            "daemon_connect_timeout");
    }
    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0 || so_error != 0) {
        return daemon_error("Cannot connect to engine daemon at " + native + ": " +
                                std::strerror(so_error != 0 ? so_error : errno),
                            "daemon_unreachable");
    }
    return true;
}

core::errors::Result<bool> send_all(const int fd, const std::string& payload,
                                    const Deadline deadline) {
    std::size_t sent = 0;
    while (sent < payload.size()) {
        const ssize_t n = send(fd, payload.data() + sent, payload.size() - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            if (!wait_for(fd, POLLOUT, deadline)) {
                return daemon_error("Timed out sending to engine daemon.", "daemon_timeout");
            }
            continue;
        }
        return daemon_error(std::string("Failed to send to engine daemon: ") +
                                std::strerror(errno),
                            "daemon_io_failed");
    }
    return true;
}

core::errors::Result<std::string> read_line(const int fd, const Deadline deadline) {
    std::string buffer;
    char chunk[4096];
    while (true) {
        const auto newline = buffer.find('\n');
        if (newline != std::string::npos) {
            return buffer.substr(0, newline);
        }
        if (buffer.size() > DaemonClient::kMaxResponseBytes) {
            return daemon_error("Engine daemon response exceeds size limit.",
                                "daemon_response_too_large");
        }

        const ssize_t n = read(fd, chunk, sizeof(chunk));
        if (n > 0) {
            buffer.append(chunk, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            if (!buffer.empty()) {
                return buffer;
            }
            return daemon_error("Engine daemon closed the connection without a response.",
                                "daemon_closed");
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            if (!wait_for(fd, POLLIN, deadline)) {
                return daemon_error("Timed out waiting for engine daemon response.",
                                    "daemon_timeout");
            }
            continue;
        }
        return daemon_error(std::string("Failed to read from engine daemon: ") +
                                std::strerror(errno),
                            "daemon_io_failed");
    }
}

}  // namespace

DaemonClient::DaemonClient(DaemonClientOptions options) : options_(std::move(options)) {}

core::errors::Result<json> DaemonClient::call(const std::string& method,
                                              const json& params) const {
    SocketHandle socket_handle(socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (socket_handle.fd() < 0) {
        return daemon_error(std::string("socket() failed: ") + std::strerror(errno),
                            "daemon_io_failed");
    }

    auto connected =
        connect_socket(socket_handle.fd(), options_.socket_path, options_.connect_timeout_ms);
    if (core::errors::is_error(connected)) {
        return core::errors::get_error(connected);
    }

    const std::uint64_t request_id = next_id_.fetch_add(1);
    const json request = {{"id", request_id}, {"method", method}, {"params", params}};
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(options_.response_timeout_ms);

    auto sent = send_all(socket_handle.fd(), request.dump() + "\n", deadline);
    if (core::errors::is_error(sent)) {
        return core::errors::get_error(sent);
    }

    auto line = read_line(socket_handle.fd(), deadline);
    if (core::errors::is_error(line)) {
        return core::errors::get_error(line);
    }

    const json response = json::parse(core::errors::get_value(line), nullptr, false);
    if (response.is_discarded() || !response.is_object()) {
        return daemon_error("Engine daemon sent malformed JSON for " + method + ".",
                            "daemon_bad_response");
    }
    if (response.value("id", json()) != json(request_id)) {
        return daemon_error("Engine daemon answered a different request id.",
                            "daemon_bad_response");
    }

    auto error = response.find("error");
    if (error != response.end() && !error->is_null()) {
        const std::string message = error->is_object() ? error->value("message", "unknown error")
                                                       : error->dump();
        return daemon_error("Engine daemon rejected " + method + ": " + message,
                            "daemon_error");
    }
    auto result = response.find("result");
    if (result == response.end()) {
        return daemon_error("Engine daemon response for " + method + " has no result.",
                            "daemon_bad_response");
    }
    return *result;
}

core::errors::Result<bool> DaemonClient::ping() const {
    auto result = call("ping", json::object());
    if (core::errors::is_error(result)) {
        return core::errors::get_error(result);
    }
    return true;
}

}  // namespace continuity::engine
