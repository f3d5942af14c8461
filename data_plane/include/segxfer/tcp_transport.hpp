#pragma once

#include "segxfer/transport.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <list>
#include <mutex>
#include <set>
#include <string>
#include <thread>

namespace segxfer {

// Request frame:  [u32 topic_len][u32 fields_len][u64 payload_len] topic fields payload
// Response frame: [u32 status][u32 body_len] body
// Integers are big-endian. status is an ErrorKind; body holds the encoded
// fields on success and the error message otherwise.
constexpr std::uint32_t max_frame_text_bytes = 1u << 20;
constexpr std::uint64_t max_frame_payload_bytes = 64ull << 20;

class TcpTransport : public RequestTransport {
  public:
    TcpTransport(const std::string &host, std::uint16_t port, std::chrono::milliseconds timeout);
    ~TcpTransport() override;

    TcpTransport(const TcpTransport &) = delete;
    TcpTransport &operator=(const TcpTransport &) = delete;

    Response request(const Request &request) override;

  private:
    int sockfd_{-1};
    std::mutex mutex_;
};

class TcpServer {
  public:
    // Port 0 binds an ephemeral port; see port().
    TcpServer(const std::string &bind_address, std::uint16_t port, RequestHandler handler);
    ~TcpServer();

    TcpServer(const TcpServer &) = delete;
    TcpServer &operator=(const TcpServer &) = delete;

    std::uint16_t port() const noexcept;

    // Accepts connections until stop() is called. Each connection is served
    // on its own thread; threads of closed connections are joined as new
    // connections arrive.
    void run();

    void stop();

    // Connection threads not yet joined, finished or not.
    std::size_t worker_count() const;

  private:
    struct Worker {
        std::thread thread;
        std::atomic<bool> done{false};
    };

    void serve_connection(int client_fd, std::atomic<bool> &done);

    // Requires mutex_.
    void reap_finished_workers();

    int listen_fd_{-1};
    std::uint16_t port_{0};
    RequestHandler handler_;
    std::atomic<bool> stopping_{false};

    mutable std::mutex mutex_;
    std::set<int> client_fds_;
    std::list<Worker> workers_;
};

} // namespace segxfer
