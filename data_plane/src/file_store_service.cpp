#include "segxfer/file_store_service.hpp"

#include "segxfer/errors.hpp"
#include "segxfer/logging.hpp"
#include "segxfer/wire.hpp"

namespace segxfer {

std::string file_store_topic(const std::string &service_unique_id) {
    std::string topic = file_transfer_service_type;
    if (!service_unique_id.empty()) {
        topic += "/" + service_unique_id;
    }
    topic += "/";
    topic += file_store_method;
    return topic;
}

FileStoreService::FileStoreService(FileStoreManager &manager, const std::string &service_unique_id)
    : manager_(manager), topic_(file_store_topic(service_unique_id)) {}

const std::string &FileStoreService::topic() const noexcept { return topic_; }

Response FileStoreService::on_request(const Request &request) {
    try {
        if (request.topic != topic_) {
            throw ValidationError("Unexpected topic: '" + request.topic + "'");
        }
        return make_response(manager_.store_segment(segment_request_from(request)));
    } catch (const TransferError &err) {
        log_error(std::string("File store request failed (") + error_kind_name(err.kind()) +
                  "): " + err.what());
        return make_error_response(err.kind(), err.what());
    } catch (const std::exception &err) {
        log_error(std::string("File store request failed: ") + err.what());
        return make_error_response(ErrorKind::internal, err.what());
    }
}

RequestHandler FileStoreService::handler() {
    return [this](const Request &request) { return on_request(request); };
}

void FileStoreService::register_with(LoopbackFabric &fabric) {
    fabric.register_service(topic_, handler());
}

} // namespace segxfer
