#include "segxfer/transport.hpp"

#include "segxfer/errors.hpp"

#include <stdexcept>

namespace segxfer {

void LoopbackFabric::register_service(const std::string &topic, RequestHandler handler) {
    if (!handler) {
        throw std::invalid_argument("handler must be callable");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    services_[topic] = std::move(handler);
}

void LoopbackFabric::unregister_service(const std::string &topic) {
    std::lock_guard<std::mutex> lock(mutex_);
    services_.erase(topic);
}

bool LoopbackFabric::has_service(const std::string &topic) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return services_.count(topic) != 0;
}

Response LoopbackFabric::request(const Request &request) {
    RequestHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = services_.find(request.topic);
        if (it == services_.end()) {
            throw TransportError("no service registered for topic: " + request.topic);
        }
        handler = it->second;
    }
    return handler(request);
}

} // namespace segxfer
