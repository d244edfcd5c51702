#include "test_helpers.hpp"

#include "logger.hpp"

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

#include <cstdio>
#include <cstdint>
#include <mutex>
#include <stdexcept>

namespace {

class LoggingEnvironment final : public ::testing::Environment {
public:
    void SetUp() override {
        static std::once_flag once;
        std::call_once(once, []() { connect4::init_logging(CONNECT4_TEST_LOG_CONFIG); });
    }
};

::testing::Environment* const kLoggingEnvironment = ::testing::AddGlobalTestEnvironment(new LoggingEnvironment());

void read_exact(int fd, char* data, size_t length) {
    size_t offset = 0;
    while (offset < length) {
        ssize_t chunk = ::read(fd, data + offset, length - offset);
        if (chunk <= 0) {
            throw std::runtime_error("control socket closed or timed out");
        }
        offset += static_cast<size_t>(chunk);
    }
}

// Closes the descriptor on scope exit.
struct FdGuard {
    int fd;
    ~FdGuard() { ::close(fd); }
};

} // namespace

connect4::service::v1::ConnectionRequest make_connection_request(const std::string& client_id,
                                                                  const std::string& account_id) {
    connect4::service::v1::ConnectionRequest request;
    auto* metadata = request.mutable_metadata();
    metadata->set_client_id(client_id);
    metadata->set_account_id(account_id);
    return request;
}

int connect_control_socket(const std::string& socket_path) {
    int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) {
        throw std::runtime_error("socket failed");
    }

    timeval timeout{};
    timeout.tv_sec = 2;
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", socket_path.c_str());
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd);
        throw std::runtime_error("connect failed");
    }
    return fd;
}

void write_control_frame(int fd, const std::string& request_bytes) {
    uint32_t length_be = htonl(static_cast<uint32_t>(request_bytes.size()));
    std::string frame(reinterpret_cast<const char*>(&length_be), sizeof(length_be));
    frame += request_bytes;
    if (::write(fd, frame.data(), frame.size()) != static_cast<ssize_t>(frame.size())) {
        throw std::runtime_error("write failed");
    }
}

std::string read_control_frame(int fd) {
    uint32_t length_be = 0;
    read_exact(fd, reinterpret_cast<char*>(&length_be), sizeof(length_be));
    std::string body(ntohl(length_be), '\0');
    if (!body.empty()) {
        read_exact(fd, body.data(), body.size());
    }
    return body;
}

std::string control_round_trip(const std::string& socket_path, const std::string& request_bytes) {
    FdGuard guard{connect_control_socket(socket_path)};
    write_control_frame(guard.fd, request_bytes);
    return read_control_frame(guard.fd);
}
