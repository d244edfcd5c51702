#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace connect4::ipc {

/**
 * Control channel endpoint on a Unix domain socket.
 *
 * Frames are a 4-byte big-endian length followed by the body. One epoll
 * thread owns every socket in non-blocking mode and assembles frames per
 * connection; only complete frames reach the worker pool, which runs the
 * handler and writes the response frame back on the originating connection.
 */
class IpcServer {
public:
    /// Request handler: request frame body in, response frame body out
    using RequestHandler = std::function<std::string(const std::string& request_bytes)>;

    static constexpr uint32_t kMaxFrameSize = 1U << 20;
    static constexpr int kWriteTimeoutMs = 1000;

    /**
     * @param socket_path Path to the Unix domain socket
     * @param handler Request handler
     * @param thread_pool_size Number of worker threads (0 selects 4)
     */
    IpcServer(std::string socket_path, RequestHandler handler, size_t thread_pool_size = 4);
    ~IpcServer();

    IpcServer(const IpcServer&) = delete;
    IpcServer& operator=(const IpcServer&) = delete;

    bool start();
    void stop();

    bool is_running() const { return running_.load(); }

    const std::string& socket_path() const { return socket_path_; }

private:
    struct Connection {
        uint64_t id;
        std::string inbox;
    };

    // A descriptor number can be reused after close; connection_id tells
    // a live connection from a closed one that had the same fd.
    struct ClientTask {
        int client_fd;
        uint64_t connection_id;
        std::string request_data;
    };

    std::string socket_path_;
    RequestHandler handler_;
    size_t thread_pool_size_;
    int server_fd_ = -1;
    int epoll_fd_ = -1;
    std::atomic<bool> running_{false};

    std::thread event_thread_;

    std::vector<std::thread> worker_threads_;
    std::queue<ClientTask> task_queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::atomic<bool> pool_running_{false};

    std::unordered_map<int, Connection> connections_;
    std::mutex connections_mutex_;
    uint64_t next_connection_id_ = 1;

    bool setup_socket();
    void event_loop();
    void accept_clients();
    void read_client(int client_fd);
    void close_client_locked(int client_fd);
    void worker_thread_func();
    bool send_response(const ClientTask& task, const std::string& response);
};

} // namespace connect4::ipc
