#pragma once

#include "segxfer/config.hpp"
#include "segxfer/file_entry_registry.hpp"
#include "segxfer/message.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace segxfer {

using FileStoreSegmentResult = SegmentResponse;

// Writes file segments into a backing store. Each transfer is written to a
// private working file and moved to its destination under the storage
// directory once the last segment has been received and verified.
class FileStoreManager {
  public:
    // Creates the storage and working directories if needed and purges any
    // working content left behind by transfers that never completed.
    FileStoreManager(const StoreOptions &options, FileEntryRegistry &registry);

    // Processes one segment. Throws ValidationError for malformed requests,
    // SequenceError for out-of-order segments and IntegrityError when the
    // stored file does not match the declared size or hash. Any failure for a
    // transfer in progress discards it before the error propagates, except a
    // duplicate first segment, which leaves the owning transfer alone.
    FileStoreSegmentResult store_segment(const SegmentRequest &request);

    const std::filesystem::path &storage_dir() const noexcept;

    const std::filesystem::path &working_dir() const noexcept;

    std::size_t active_transfers() const;

  private:
    void purge_incomplete_files();

    std::filesystem::path resolve_destination(const std::string &name) const;

    // Returns the destination path, empty when the request names none.
    std::filesystem::path validate_request(const SegmentRequest &request) const;

    void discard_file(const std::string &file_id, const std::string &reason);

    FileStoreSegmentResult cancel_file(const SegmentRequest &request);

    void write_segment(FileEntry &entry, const std::vector<char> &segment);

    void validate_file(const FileEntry &entry, std::uint64_t file_size, const std::string &file_hash) const;

    void publish_file(const FileEntry &entry, const std::filesystem::path &destination) const;

    std::filesystem::path storage_dir_;
    std::filesystem::path working_dir_;
    FileEntryRegistry &registry_;
};

} // namespace segxfer
