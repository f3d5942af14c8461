#pragma once

#include "segxfer/message.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace segxfer {

using RequestHandler = std::function<Response(const Request &)>;

// Synchronous, topic-addressed request/response delivery. Failures of the
// delivery itself (no service, broken connection, timeout) raise
// TransportError; failures reported by the service come back as an error
// Response.
class RequestTransport {
  public:
    virtual ~RequestTransport() = default;

    virtual Response request(const Request &request) = 0;
};

// In-process fabric. Handlers run on the caller's thread.
class LoopbackFabric : public RequestTransport {
  public:
    void register_service(const std::string &topic, RequestHandler handler);

    void unregister_service(const std::string &topic);

    bool has_service(const std::string &topic) const;

    Response request(const Request &request) override;

  private:
    mutable std::mutex mutex_;
    std::map<std::string, RequestHandler> services_;
};

} // namespace segxfer
