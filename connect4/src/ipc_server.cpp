#include "ipc_server.hpp"

#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <arpa/inet.h>
#include <poll.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <exception>

namespace connect4::ipc {

namespace {

std::string frame(const std::string& body) {
    uint32_t length_be = htonl(static_cast<uint32_t>(body.size()));
    std::string out(reinterpret_cast<const char*>(&length_be), sizeof(length_be));
    out += body;
    return out;
}

// Non-blocking send, waiting for POLLOUT at most kWriteTimeoutMs per stall.
bool write_frame(int fd, const std::string& data) {
    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t sent = ::send(fd, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
        if (sent > 0) {
            offset += static_cast<size_t>(sent);
            continue;
        }
        if (sent < 0 && errno == EINTR) {
            continue;
        }
        if (sent < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            pollfd pfd{fd, POLLOUT, 0};
            if (::poll(&pfd, 1, IpcServer::kWriteTimeoutMs) > 0) {
                continue;
            }
        }
        return false;
    }
    return true;
}

} // namespace

IpcServer::IpcServer(std::string socket_path, RequestHandler handler, size_t thread_pool_size)
    : socket_path_(std::move(socket_path)),
      handler_(std::move(handler)),
      thread_pool_size_(thread_pool_size > 0 ? thread_pool_size : 4) {}

IpcServer::~IpcServer() {
    stop();
}

bool IpcServer::setup_socket() {
    sockaddr_un addr{};
    if (socket_path_.empty() || socket_path_.size() >= sizeof(addr.sun_path)) {
        LOG4CPLUS_ERROR(control_logger(), "Invalid control socket path: '" << socket_path_ << "'");
        return false;
    }

    server_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        LOG4CPLUS_ERROR(control_logger(), "socket: " << std::strerror(errno));
        return false;
    }

    ::unlink(socket_path_.c_str());

    addr.sun_family = AF_UNIX;
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", socket_path_.c_str());

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 || ::listen(server_fd_, 16) < 0) {
        LOG4CPLUS_ERROR(control_logger(), "bind/listen " << socket_path_ << ": " << std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    return true;
}

bool IpcServer::start() {
    if (running_) {
        return true;
    }

    if (!setup_socket()) {
        return false;
    }

    epoll_fd_ = ::epoll_create1(EPOLL_CLOEXEC);
    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = server_fd_;
    if (epoll_fd_ < 0 || ::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, server_fd_, &ev) < 0) {
        LOG4CPLUS_ERROR(control_logger(), "epoll setup: " << std::strerror(errno));
        if (epoll_fd_ >= 0) {
            ::close(epoll_fd_);
            epoll_fd_ = -1;
        }
        ::close(server_fd_);
        server_fd_ = -1;
        ::unlink(socket_path_.c_str());
        return false;
    }

    running_ = true;

    pool_running_ = true;
    for (size_t i = 0; i < thread_pool_size_; ++i) {
        worker_threads_.emplace_back(&IpcServer::worker_thread_func, this);
    }

    event_thread_ = std::thread(&IpcServer::event_loop, this);

    LOG4CPLUS_INFO(control_logger(), "Control channel listening on " << socket_path_
                                         << " with " << thread_pool_size_ << " workers");
    return true;
}

void IpcServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    // Wakes peers and any worker waiting on a stalled write.
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (const auto& entry : connections_) {
            ::shutdown(entry.first, SHUT_RDWR);
        }
    }

    if (event_thread_.joinable()) {
        event_thread_.join();
    }

    pool_running_ = false;
    queue_cv_.notify_all();
    for (auto& t : worker_threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
    worker_threads_.clear();

    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (const auto& entry : connections_) {
            ::close(entry.first);
        }
        connections_.clear();
    }

    ::close(server_fd_);
    server_fd_ = -1;
    ::close(epoll_fd_);
    epoll_fd_ = -1;

    ::unlink(socket_path_.c_str());
    LOG4CPLUS_INFO(control_logger(), "Control channel stopped");
}

void IpcServer::close_client_locked(int client_fd) {
    ::epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, client_fd, nullptr);
    if (connections_.erase(client_fd) > 0) {
        ::close(client_fd);
    }
}

void IpcServer::accept_clients() {
    while (true) {
        int client_fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                LOG4CPLUS_WARN(control_logger(), "accept: " << std::strerror(errno));
            }
            return;
        }

        epoll_event ev{};
        ev.events = EPOLLIN | EPOLLRDHUP;
        ev.data.fd = client_fd;
        if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev) < 0) {
            LOG4CPLUS_WARN(control_logger(), "epoll_ctl ADD client: " << std::strerror(errno));
            ::close(client_fd);
            continue;
        }

        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_[client_fd] = Connection{next_connection_id_++, std::string()};
    }
}

void IpcServer::read_client(int client_fd) {
    std::vector<ClientTask> ready;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        auto it = connections_.find(client_fd);
        if (it == connections_.end()) {
            return;
        }
        Connection& conn = it->second;

        bool peer_closed = false;
        char chunk[4096];
        while (true) {
            ssize_t n = ::read(client_fd, chunk, sizeof(chunk));
            if (n > 0) {
                conn.inbox.append(chunk, static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                break;
            }
            peer_closed = true;
            break;
        }

        while (conn.inbox.size() >= sizeof(uint32_t)) {
            uint32_t length_be = 0;
            std::memcpy(&length_be, conn.inbox.data(), sizeof(length_be));
            uint32_t length = ntohl(length_be);
            if (length > kMaxFrameSize) {
                LOG4CPLUS_WARN(control_logger(), "Rejecting oversized frame of " << length << " bytes");
                peer_closed = true;
                break;
            }
            if (conn.inbox.size() < sizeof(length_be) + length) {
                break;
            }
            ready.push_back({client_fd, conn.id, conn.inbox.substr(sizeof(length_be), length)});
            conn.inbox.erase(0, sizeof(length_be) + length);
        }

        if (peer_closed) {
            close_client_locked(client_fd);
        }
    }

    if (ready.empty()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        for (auto& task : ready) {
            task_queue_.push(std::move(task));
        }
    }
    queue_cv_.notify_all();
}

bool IpcServer::send_response(const ClientTask& task, const std::string& response) {
    // Holding the lock keeps the event thread from closing the fd mid-write.
    std::lock_guard<std::mutex> lock(connections_mutex_);
    auto it = connections_.find(task.client_fd);
    if (it == connections_.end() || it->second.id != task.connection_id) {
        return false;
    }
    return write_frame(task.client_fd, frame(response));
}

void IpcServer::worker_thread_func() {
    while (true) {
        ClientTask task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !task_queue_.empty() || !pool_running_; });
            if (task_queue_.empty()) {
                return;
            }
            task = std::move(task_queue_.front());
            task_queue_.pop();
        }

        std::string response;
        try {
            response = handler_(task.request_data);
        } catch (const std::exception& e) {
            LOG4CPLUS_ERROR(control_logger(), "Control handler error: " << e.what());
        }

        if (!send_response(task, response)) {
            LOG4CPLUS_WARN(control_logger(), "Dropped control response for closed connection " << task.connection_id);
        }
    }
}

void IpcServer::event_loop() {
    constexpr int kMaxEvents = 32;
    epoll_event events[kMaxEvents];

    while (running_) {
        int nfds = ::epoll_wait(epoll_fd_, events, kMaxEvents, 200);
        if (nfds < 0) {
            if (errno != EINTR) {
                LOG4CPLUS_ERROR(control_logger(), "epoll_wait: " << std::strerror(errno));
            }
            continue;
        }

        for (int i = 0; i < nfds; ++i) {
            int fd = events[i].data.fd;
            if (fd == server_fd_) {
                accept_clients();
                continue;
            }

            // read_client sees EOF itself; data sent before a hangup is still framed.
            if (events[i].events & (EPOLLIN | EPOLLRDHUP | EPOLLHUP | EPOLLERR)) {
                read_client(fd);
            }
        }
    }
}

} // namespace connect4::ipc
