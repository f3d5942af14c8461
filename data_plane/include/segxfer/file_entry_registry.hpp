#pragma once

#include "segxfer/checksum.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace segxfer {

// State of one in-progress reconstruction. mutex serializes segment
// processing for the id and is always taken before the registry lock.
struct FileEntry {
    std::string file_id;
    std::filesystem::path working_dir;
    std::filesystem::path working_file;
    std::uint64_t segments_received{0};
    std::optional<std::uint64_t> total_segments;
    Checksum::Sha256Accumulator hasher;
    std::mutex mutex;
};

// Map of file id to in-progress entry. An entry is registered exactly while
// its working directory exists.
class FileEntryRegistry {
  public:
    static constexpr const char *working_file_name = "file";

    // Returns the entry for file_id, creating it (and its working directory
    // under working_root) when absent. Without an id a fresh random one is
    // generated. A supplied id for a first segment must not already be in use,
    // either in the registry or on disk; ValidationError otherwise.
    std::shared_ptr<FileEntry> acquire(const std::optional<std::string> &file_id, bool first_segment,
                                       const std::filesystem::path &working_root);

    std::shared_ptr<FileEntry> find(const std::string &file_id) const;

    // Drops the entry and deletes its working directory. Unknown ids are a
    // no-op.
    void release(const std::string &file_id);

    // As above, but only while entry is still the one registered under its id.
    void release(const std::shared_ptr<FileEntry> &entry);

    bool contains(const std::string &file_id) const;

    std::size_t size() const;

  private:
    std::shared_ptr<FileEntry> create_entry(const std::string &file_id,
                                            const std::filesystem::path &working_root);

    void erase_locked(const std::string &file_id, const FileEntry *expected);

    static std::string generate_id();

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<FileEntry>> entries_;
};

} // namespace segxfer
