#pragma once

#include "segxfer/file_store_manager.hpp"
#include "segxfer/transport.hpp"

#include <string>

namespace segxfer {

constexpr const char *file_transfer_service_type = "/segxfer/service/file-transfer";
constexpr const char *file_store_method = "file/store";

// "<service type>[/<unique id>]/file/store"
std::string file_store_topic(const std::string &service_unique_id = "");

// Binds a FileStoreManager to the file store topic. Failures are answered
// with an error response carrying the error kind, never thrown back into the
// transport.
class FileStoreService {
  public:
    explicit FileStoreService(FileStoreManager &manager, const std::string &service_unique_id = "");

    const std::string &topic() const noexcept;

    Response on_request(const Request &request);

    RequestHandler handler();

    void register_with(LoopbackFabric &fabric);

  private:
    FileStoreManager &manager_;
    std::string topic_;
};

} // namespace segxfer
