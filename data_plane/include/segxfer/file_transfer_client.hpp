#pragma once

#include "segxfer/config.hpp"
#include "segxfer/message.hpp"
#include "segxfer/transport.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <map>
#include <optional>
#include <string>

namespace segxfer {

struct SegmentProgress {
    std::string file_id;
    std::uint64_t segments_received{0};
    std::optional<std::uint64_t> total_segments;
    FileResult result{FileResult::none};
};

using ProgressObserver = std::function<void(const SegmentProgress &)>;

struct FileSendResult {
    std::string file_id;
    std::uint64_t size{0};
    // Hash algorithm name to lowercase hex digest.
    std::map<std::string, std::string> hashes;
};

// Sends files to a file store service one segment at a time. Segments go out
// strictly in order with one request in flight; the last one carries the
// size and SHA-256 of the whole content. If anything fails after the service
// assigned a file id, a single cancel request is sent before the error
// propagates.
class FileTransferClient {
  public:
    explicit FileTransferClient(RequestTransport &transport, const std::string &service_unique_id = "");

    FileSendResult store_file(const std::filesystem::path &source, const std::string &name_on_server,
                              std::size_t max_segment_size = default_max_segment_size,
                              const ProgressObserver &observer = {});

    // stream_size, when known, lets the last data segment double as the
    // terminal one. file_id may be chosen by the caller; it must not be in
    // use at the service.
    FileSendResult store_file_from_stream(std::istream &stream, const std::string &name_on_server,
                                          std::optional<std::uint64_t> stream_size = std::nullopt,
                                          std::size_t max_segment_size = default_max_segment_size,
                                          const ProgressObserver &observer = {},
                                          const std::optional<std::string> &file_id = std::nullopt);

    const std::string &topic() const noexcept;

  private:
    SegmentResponse send_segment(SegmentRequest segment);

    void cancel_store(const std::string &file_id, const std::string &name_on_server) noexcept;

    RequestTransport &transport_;
    std::string topic_;
};

} // namespace segxfer
