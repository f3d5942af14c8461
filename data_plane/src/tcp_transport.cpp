#include "segxfer/tcp_transport.hpp"

#include "segxfer/errors.hpp"
#include "segxfer/logging.hpp"
#include "segxfer/wire.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <functional>
#include <sstream>

#if defined(__linux__)
#include <endian.h>
#elif defined(__APPLE__)
#include <libkern/OSByteOrder.h>
#define htobe64(x) OSSwapHostToBigInt64(x)
#define be64toh(x) OSSwapBigToHostInt64(x)
#endif

namespace segxfer {

namespace {

#if defined(MSG_NOSIGNAL)
constexpr int send_flags = MSG_NOSIGNAL;
#else
constexpr int send_flags = 0;
#endif

constexpr std::size_t request_header_size = 16;
constexpr std::size_t response_header_size = 8;

std::string errno_message(const char *what) {
    std::ostringstream oss;
    oss << what << ": " << std::strerror(errno);
    return oss.str();
}

void send_all(int sockfd, const void *buffer, std::size_t length) {
    const char *data = static_cast<const char *>(buffer);
    std::size_t sent = 0;
    while (sent < length) {
        ssize_t rc = ::send(sockfd, data + sent, length - sent, send_flags);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw TransportError(errno_message("socket send failed"));
        }
        sent += static_cast<std::size_t>(rc);
    }
}

// Returns false only when allow_eof is set and the peer closed the
// connection before the first byte.
bool recv_all(int sockfd, void *buffer, std::size_t length, bool allow_eof) {
    char *data = static_cast<char *>(buffer);
    std::size_t received = 0;
    while (received < length) {
        ssize_t rc = ::recv(sockfd, data + received, length - received, 0);
        if (rc == 0) {
            if (allow_eof && received == 0) {
                return false;
            }
            throw TransportError("unexpected EOF on socket");
        }
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                throw TransportError("timed out waiting on socket");
            }
            throw TransportError(errno_message("socket recv failed"));
        }
        received += static_cast<std::size_t>(rc);
    }
    return true;
}

void append_u32(std::vector<char> &out, std::uint32_t value) {
    value = htonl(value);
    const char *bytes = reinterpret_cast<const char *>(&value);
    out.insert(out.end(), bytes, bytes + sizeof(value));
}

void append_u64(std::vector<char> &out, std::uint64_t value) {
    value = htobe64(value);
    const char *bytes = reinterpret_cast<const char *>(&value);
    out.insert(out.end(), bytes, bytes + sizeof(value));
}

std::uint32_t read_u32(const char *data) {
    std::uint32_t value = 0;
    std::memcpy(&value, data, sizeof(value));
    return ntohl(value);
}

std::uint64_t read_u64(const char *data) {
    std::uint64_t value = 0;
    std::memcpy(&value, data, sizeof(value));
    return be64toh(value);
}

void write_request(int sockfd, const Request &request) {
    const std::string fields = encode_fields(request.fields);
    if (request.topic.size() > max_frame_text_bytes || fields.size() > max_frame_text_bytes ||
        request.payload.size() > max_frame_payload_bytes) {
        throw TransportError("request exceeds frame limits");
    }
    std::vector<char> header;
    header.reserve(request_header_size);
    append_u32(header, static_cast<std::uint32_t>(request.topic.size()));
    append_u32(header, static_cast<std::uint32_t>(fields.size()));
    append_u64(header, static_cast<std::uint64_t>(request.payload.size()));
    send_all(sockfd, header.data(), header.size());
    send_all(sockfd, request.topic.data(), request.topic.size());
    send_all(sockfd, fields.data(), fields.size());
    send_all(sockfd, request.payload.data(), request.payload.size());
}

// Fields stay undecoded so a malformed field block can be answered with an
// error response instead of dropping the connection.
bool read_request(int sockfd, Request &request, std::string &fields) {
    char header[request_header_size];
    if (!recv_all(sockfd, header, sizeof(header), true)) {
        return false;
    }
    const std::uint32_t topic_length = read_u32(header);
    const std::uint32_t fields_length = read_u32(header + 4);
    const std::uint64_t payload_length = read_u64(header + 8);
    if (topic_length > max_frame_text_bytes || fields_length > max_frame_text_bytes ||
        payload_length > max_frame_payload_bytes) {
        throw TransportError("request frame exceeds limits");
    }
    request.topic.assign(topic_length, '\0');
    recv_all(sockfd, &request.topic[0], topic_length, false);
    fields.assign(fields_length, '\0');
    recv_all(sockfd, &fields[0], fields_length, false);
    request.payload.resize(static_cast<std::size_t>(payload_length));
    recv_all(sockfd, request.payload.data(), request.payload.size(), false);
    return true;
}

void write_response(int sockfd, const Response &response) {
    std::string body = response.ok() ? encode_fields(response.fields) : response.error_message;
    if (body.size() > max_frame_text_bytes) {
        body.resize(max_frame_text_bytes);
    }
    std::vector<char> header;
    header.reserve(response_header_size);
    append_u32(header, static_cast<std::uint32_t>(response.error));
    append_u32(header, static_cast<std::uint32_t>(body.size()));
    send_all(sockfd, header.data(), header.size());
    send_all(sockfd, body.data(), body.size());
}

Response read_response(int sockfd) {
    char header[response_header_size];
    recv_all(sockfd, header, sizeof(header), false);
    const std::uint32_t status = read_u32(header);
    const std::uint32_t body_length = read_u32(header + 4);
    if (body_length > max_frame_text_bytes) {
        throw TransportError("response frame exceeds limits");
    }
    std::string body(body_length, '\0');
    recv_all(sockfd, &body[0], body_length, false);

    Response response;
    if (status == static_cast<std::uint32_t>(ErrorKind::none)) {
        try {
            response.fields = decode_fields(body);
        } catch (const ValidationError &err) {
            throw TransportError(std::string("malformed response: ") + err.what());
        }
        return response;
    }
    if (status > static_cast<std::uint32_t>(ErrorKind::internal)) {
        response.error = ErrorKind::internal;
    } else {
        response.error = static_cast<ErrorKind>(status);
    }
    response.error_message = body;
    return response;
}

class AddrInfo {
  public:
    AddrInfo(const std::string &host, const std::string &port, int family, int socktype) {
        struct addrinfo hints;
        std::memset(&hints, 0, sizeof(hints));
        hints.ai_family = family;
        hints.ai_socktype = socktype;
        hints.ai_flags = (host.empty() ? AI_PASSIVE : 0);

        int rc = ::getaddrinfo(host.empty() ? nullptr : host.c_str(), port.c_str(), &hints, &info_);
        if (rc != 0) {
            std::ostringstream oss;
            oss << "getaddrinfo failed: " << ::gai_strerror(rc);
            throw TransportError(oss.str());
        }
    }

    ~AddrInfo() {
        if (info_ != nullptr) {
            ::freeaddrinfo(info_);
        }
    }

    AddrInfo(const AddrInfo &) = delete;
    AddrInfo &operator=(const AddrInfo &) = delete;

    struct addrinfo *get() const { return info_; }

  private:
    struct addrinfo *info_ = nullptr;
};

void set_timeout(int sockfd, int option, std::chrono::milliseconds timeout) {
    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    if (::setsockopt(sockfd, SOL_SOCKET, option, &tv, sizeof(tv)) != 0) {
        throw TransportError(errno_message("setsockopt failed"));
    }
}

} // namespace

TcpTransport::TcpTransport(const std::string &host, std::uint16_t port,
                           std::chrono::milliseconds timeout) {
    AddrInfo info(host, std::to_string(port), AF_UNSPEC, SOCK_STREAM);
    for (struct addrinfo *ai = info.get(); ai != nullptr; ai = ai->ai_next) {
        int sockfd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sockfd < 0) {
            continue;
        }
        if (::connect(sockfd, ai->ai_addr, ai->ai_addrlen) == 0) {
            sockfd_ = sockfd;
            break;
        }
        ::close(sockfd);
    }
    if (sockfd_ < 0) {
        std::ostringstream oss;
        oss << "failed to connect to " << host << ":" << port;
        throw TransportError(oss.str());
    }
    if (timeout.count() > 0) {
        try {
            set_timeout(sockfd_, SO_RCVTIMEO, timeout);
            set_timeout(sockfd_, SO_SNDTIMEO, timeout);
        } catch (const TransportError &) {
            ::close(sockfd_);
            throw;
        }
    }
}

TcpTransport::~TcpTransport() {
    if (sockfd_ >= 0) {
        ::close(sockfd_);
    }
}

Response TcpTransport::request(const Request &request) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sockfd_ < 0) {
        throw TransportError("connection is closed");
    }
    try {
        write_request(sockfd_, request);
        return read_response(sockfd_);
    } catch (const TransportError &) {
        // The stream position is unknown after a failed exchange.
        ::close(sockfd_);
        sockfd_ = -1;
        throw;
    }
}

TcpServer::TcpServer(const std::string &bind_address, std::uint16_t port, RequestHandler handler)
    : port_(port), handler_(std::move(handler)) {
    if (!handler_) {
        throw std::invalid_argument("handler must be callable");
    }
    AddrInfo info(bind_address, std::to_string(port), AF_UNSPEC, SOCK_STREAM);
    for (struct addrinfo *ai = info.get(); ai != nullptr; ai = ai->ai_next) {
        int sockfd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sockfd < 0) {
            continue;
        }
        int enable = 1;
        ::setsockopt(sockfd, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable));
        if (::bind(sockfd, ai->ai_addr, ai->ai_addrlen) == 0 && ::listen(sockfd, 16) == 0) {
            if (port_ == 0) {
                struct sockaddr_storage addr;
                socklen_t len = sizeof(addr);
                if (::getsockname(sockfd, reinterpret_cast<struct sockaddr *>(&addr), &len) == 0) {
                    if (addr.ss_family == AF_INET) {
                        port_ = ntohs(reinterpret_cast<struct sockaddr_in *>(&addr)->sin_port);
                    } else if (addr.ss_family == AF_INET6) {
                        port_ = ntohs(reinterpret_cast<struct sockaddr_in6 *>(&addr)->sin6_port);
                    }
                }
            }
            listen_fd_ = sockfd;
            break;
        }
        ::close(sockfd);
    }
    if (listen_fd_ < 0) {
        throw TransportError("failed to bind listening socket");
    }
}

TcpServer::~TcpServer() {
    stop();
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
    }
}

std::uint16_t TcpServer::port() const noexcept { return port_; }

void TcpServer::run() {
    std::ostringstream oss;
    oss << "listening on port " << port_;
    log_info(oss.str());
    while (!stopping_) {
        int client_fd = ::accept(listen_fd_, nullptr, nullptr);
        if (client_fd < 0) {
            if (stopping_) {
                break;
            }
            if (errno == EINTR || errno == ECONNABORTED) {
                continue;
            }
            throw TransportError(errno_message("accept failed"));
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            ::close(client_fd);
            break;
        }
        reap_finished_workers();
        client_fds_.insert(client_fd);
        workers_.emplace_back();
        Worker &worker = workers_.back();
        worker.thread = std::thread(&TcpServer::serve_connection, this, client_fd, std::ref(worker.done));
    }
}

void TcpServer::reap_finished_workers() {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->done) {
            it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

std::size_t TcpServer::worker_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_.size();
}

void TcpServer::stop() {
    std::list<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        if (listen_fd_ >= 0) {
            ::shutdown(listen_fd_, SHUT_RDWR);
        }
        for (int fd : client_fds_) {
            ::shutdown(fd, SHUT_RDWR);
        }
        workers.swap(workers_);
    }
    for (auto &worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

void TcpServer::serve_connection(int client_fd, std::atomic<bool> &done) {
    try {
        while (true) {
            Request request;
            std::string fields;
            if (!read_request(client_fd, request, fields)) {
                break;
            }
            Response response;
            try {
                request.fields = decode_fields(fields);
                response = handler_(request);
            } catch (const TransferError &err) {
                response = make_error_response(err.kind(), err.what());
            } catch (const std::exception &err) {
                response = make_error_response(ErrorKind::internal, err.what());
            }
            write_response(client_fd, response);
        }
    } catch (const std::exception &err) {
        if (!stopping_) {
            log_warning(std::string("dropping connection: ") + err.what());
        }
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        client_fds_.erase(client_fd);
        ::close(client_fd);
    }
    done = true;
}

} // namespace segxfer
