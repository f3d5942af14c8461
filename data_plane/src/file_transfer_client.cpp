#include "segxfer/file_transfer_client.hpp"

#include "segxfer/checksum.hpp"
#include "segxfer/file_store_service.hpp"
#include "segxfer/logging.hpp"
#include "segxfer/segment_reader.hpp"
#include "segxfer/wire.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace segxfer {

namespace {

// Lives for one store call. Unless marked complete, leaving scope with a
// file id assigned sends the cancel request.
class TransferSession {
  public:
    explicit TransferSession(std::function<void(const std::string &)> cancel)
        : cancel_(std::move(cancel)) {}

    ~TransferSession() {
        if (file_id && !complete) {
            cancel_(*file_id);
        }
    }

    TransferSession(const TransferSession &) = delete;
    TransferSession &operator=(const TransferSession &) = delete;

    std::optional<std::string> file_id;
    bool complete{false};

  private:
    std::function<void(const std::string &)> cancel_;
};

std::string describe_segment(std::uint64_t segment_number, const std::string &name,
                             const std::optional<std::string> &file_id) {
    std::ostringstream oss;
    oss << "segment '" << segment_number << "' for file '" << name << "', id '"
        << file_id.value_or("") << "'";
    return oss.str();
}

} // namespace

FileTransferClient::FileTransferClient(RequestTransport &transport, const std::string &service_unique_id)
    : transport_(transport), topic_(file_store_topic(service_unique_id)) {}

const std::string &FileTransferClient::topic() const noexcept { return topic_; }

FileSendResult FileTransferClient::store_file(const std::filesystem::path &source,
                                              const std::string &name_on_server,
                                              std::size_t max_segment_size,
                                              const ProgressObserver &observer) {
    if (!std::filesystem::is_regular_file(source)) {
        throw std::invalid_argument("path must be a regular file: " + source.string());
    }
    std::ifstream file(source, std::ios::binary);
    if (!file) {
        throw std::runtime_error("failed to open file: " + source.string());
    }
    const auto size = static_cast<std::uint64_t>(std::filesystem::file_size(source));
    return store_file_from_stream(file, name_on_server, size, max_segment_size, observer);
}

FileSendResult FileTransferClient::store_file_from_stream(std::istream &stream,
                                                          const std::string &name_on_server,
                                                          std::optional<std::uint64_t> stream_size,
                                                          std::size_t max_segment_size,
                                                          const ProgressObserver &observer,
                                                          const std::optional<std::string> &file_id) {
    SegmentReader reader(stream, max_segment_size);
    std::optional<std::uint64_t> total_segments;
    if (stream_size) {
        total_segments = SegmentReader::total_segments(*stream_size, max_segment_size);
    }

    TransferSession session(
        [this, &name_on_server](const std::string &id) { cancel_store(id, name_on_server); });

    std::uint64_t segment_number = 0;
    bool continue_reading = true;
    while (continue_reading) {
        ++segment_number;
        SegmentRequest segment;
        segment.payload = reader.next_segment();
        segment.name = name_on_server;
        segment.segment_number = segment_number;
        segment.total_segments = total_segments;
        segment.file_id = session.file_id ? session.file_id : file_id;

        if ((stream_size && reader.bytes_read() == *stream_size) ||
            (total_segments && segment_number == *total_segments) || segment.payload.empty()) {
            continue_reading = false;
            segment.result = FileResult::store;
            segment.size = reader.bytes_read();
            segment.hash_sha256 = reader.hash_hex();
        }

        log_debug("Sending " + describe_segment(segment_number, name_on_server, session.file_id));
        const auto response = send_segment(std::move(segment));
        if (!session.file_id) {
            session.file_id = response.file_id;
        }

        if (continue_reading) {
            log_debug("Store of " + describe_segment(segment_number, name_on_server, session.file_id) +
                      " succeeded");
        } else {
            session.complete = true;
            std::ostringstream oss;
            oss << "Store for file '" << name_on_server << "', id '" << *session.file_id
                << "' complete, segments: '" << response.segments_received << "'";
            log_info(oss.str());
        }

        if (observer) {
            SegmentProgress progress;
            progress.file_id = response.file_id;
            progress.segments_received = response.segments_received;
            progress.total_segments = response.total_segments ? response.total_segments : total_segments;
            progress.result = response.result;
            observer(progress);
        }
    }

    FileSendResult result;
    result.file_id = *session.file_id;
    result.size = reader.bytes_read();
    result.hashes[Checksum::sha256_name] = reader.hash_hex();
    return result;
}

SegmentResponse FileTransferClient::send_segment(SegmentRequest segment) {
    return segment_response_from(transport_.request(make_request(topic_, std::move(segment))));
}

void FileTransferClient::cancel_store(const std::string &file_id,
                                      const std::string &name_on_server) noexcept {
    try {
        log_info("Error occurred, canceling store for file '" + name_on_server + "', id '" + file_id + "'");
        SegmentRequest segment;
        segment.file_id = file_id;
        segment.name = name_on_server;
        segment.result = FileResult::cancel;
        send_segment(std::move(segment));
    } catch (const std::exception &err) {
        log_error("Failed to cancel store for file id '" + file_id + "': " + err.what());
    }
}

} // namespace segxfer
