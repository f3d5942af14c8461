#include "segxfer/file_store_manager.hpp"

#include "segxfer/errors.hpp"
#include "segxfer/logging.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace segxfer {

namespace {

constexpr const char *path_name_separators = "./\\";

bool contains_path_name_separators(const std::string &value) {
    return value.find_first_of(path_name_separators) != std::string::npos;
}

// True when candidate equals base or lies below it. Both must be normalized.
bool is_within(const std::filesystem::path &base, const std::filesystem::path &candidate) {
    auto candidate_it = candidate.begin();
    for (auto base_it = base.begin(); base_it != base.end(); ++base_it, ++candidate_it) {
        if (candidate_it == candidate.end() || *base_it != *candidate_it) {
            return false;
        }
    }
    return true;
}

std::filesystem::path prepare_dir(const std::filesystem::path &dir) {
    auto absolute = std::filesystem::absolute(dir);
    std::filesystem::create_directories(absolute);
    return std::filesystem::canonical(absolute);
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

} // namespace

FileStoreManager::FileStoreManager(const StoreOptions &options, FileEntryRegistry &registry)
    : registry_(registry) {
    if (options.storage_dir.empty()) {
        throw std::invalid_argument("storage dir must be specified");
    }
    storage_dir_ = prepare_dir(options.storage_dir);
    log_info("Using storage dir: " + storage_dir_.string());

    working_dir_ = prepare_dir(options.working_dir ? *options.working_dir
                                                   : storage_dir_ / default_working_subdir);
    log_info("Using working dir: " + working_dir_.string());

    purge_incomplete_files();
}

const std::filesystem::path &FileStoreManager::storage_dir() const noexcept { return storage_dir_; }

const std::filesystem::path &FileStoreManager::working_dir() const noexcept { return working_dir_; }

std::size_t FileStoreManager::active_transfers() const { return registry_.size(); }

void FileStoreManager::purge_incomplete_files() {
    std::vector<std::filesystem::path> leftovers;
    for (const auto &entry : std::filesystem::directory_iterator(working_dir_)) {
        leftovers.push_back(entry.path());
    }
    for (const auto &path : leftovers) {
        const auto file_id = path.filename().string();
        log_info("Purging content for incomplete file id: '" + file_id + "'");
        registry_.release(file_id);
        std::filesystem::remove_all(path);
    }
}

std::filesystem::path FileStoreManager::resolve_destination(const std::string &name) const {
    auto destination = (storage_dir_ / name).lexically_normal();
    if (!is_within(storage_dir_, destination) || destination == storage_dir_) {
        throw ValidationError("File name cannot be outside of storage directory: '" + name + "'");
    }
    if (is_within(working_dir_, destination)) {
        throw ValidationError("File name cannot be in working directory: '" + name + "'");
    }
    if (!destination.has_filename()) {
        throw ValidationError("File name cannot refer to a directory: '" + name + "'");
    }
    return destination;
}

std::filesystem::path FileStoreManager::validate_request(const SegmentRequest &request) const {
    if (request.file_id && contains_path_name_separators(*request.file_id)) {
        throw ValidationError("File id cannot contain path name separators: '" + *request.file_id + "'");
    }

    std::filesystem::path destination;
    if (request.name && !request.name->empty()) {
        destination = resolve_destination(*request.name);
    }

    if (request.result == FileResult::store) {
        if (destination.empty()) {
            throw ValidationError("File name must be specified for store request");
        }
        if (!request.size) {
            throw ValidationError("File size must be specified for store request");
        }
        if (!request.hash_sha256 || request.hash_sha256->empty()) {
            throw ValidationError("File hash must be specified for store request");
        }
    }
    return destination;
}

FileStoreSegmentResult FileStoreManager::store_segment(const SegmentRequest &request) {
    const bool first_segment = request.segment_number && *request.segment_number == 1;

    std::filesystem::path destination;
    try {
        destination = validate_request(request);
    } catch (const ValidationError &err) {
        // A first segment naming a registered id is a duplicate; that entry
        // belongs to another transfer.
        if (request.file_id && !first_segment) {
            discard_file(*request.file_id, err.what());
        }
        throw;
    }

    if (request.result == FileResult::cancel) {
        return cancel_file(request);
    }

    auto entry = registry_.acquire(request.file_id, first_segment, working_dir_);

    std::lock_guard<std::mutex> lock(entry->mutex);
    try {
        const std::uint64_t expected = entry->segments_received + 1;
        if (!request.segment_number || *request.segment_number != expected) {
            std::ostringstream oss;
            oss << "Unexpected segment. Expected: '" << expected << "'. Received: '";
            if (request.segment_number) {
                oss << *request.segment_number;
            }
            oss << "'";
            throw SequenceError(oss.str());
        }
        entry->segments_received = expected;
        if (request.total_segments && !entry->total_segments) {
            entry->total_segments = request.total_segments;
        }

        write_segment(*entry, request.payload);

        FileStoreSegmentResult result;
        result.file_id = entry->file_id;
        result.segments_received = entry->segments_received;
        result.total_segments = entry->total_segments;

        if (request.result == FileResult::store) {
            validate_file(*entry, *request.size, *request.hash_sha256);
            publish_file(*entry, destination);
            registry_.release(entry);
            log_info("Stored file '" + destination.string() + "' for id '" + entry->file_id + "'");
            result.result = FileResult::store;
        }
        return result;
    } catch (const std::exception &err) {
        log_warning("Discarding file id '" + entry->file_id + "': " + err.what());
        registry_.release(entry);
        throw;
    }
}

void FileStoreManager::discard_file(const std::string &file_id, const std::string &reason) {
    auto entry = registry_.find(file_id);
    if (!entry) {
        return;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    log_warning("Discarding file id '" + file_id + "': " + reason);
    registry_.release(entry);
}

FileStoreSegmentResult FileStoreManager::cancel_file(const SegmentRequest &request) {
    FileStoreSegmentResult result;
    result.file_id = request.file_id.value_or("");
    result.result = FileResult::cancel;

    auto entry = result.file_id.empty() ? nullptr : registry_.find(result.file_id);
    if (!entry) {
        log_info("Cancel requested for unknown file id '" + result.file_id + "'");
        return result;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    result.segments_received = entry->segments_received;
    result.total_segments = entry->total_segments;
    registry_.release(entry);
    log_info("Canceled storage of file for id '" + result.file_id + "'");
    return result;
}

void FileStoreManager::write_segment(FileEntry &entry, const std::vector<char> &segment) {
    std::ostringstream oss;
    oss << "Storing segment '" << entry.segments_received << "' for file id: '" << entry.file_id << "'";
    log_debug(oss.str());
    if (segment.empty()) {
        return;
    }
    std::ofstream file(entry.working_file, std::ios::binary | std::ios::app);
    if (!file) {
        throw TransferError(ErrorKind::internal,
                            "failed to open working file: " + entry.working_file.string());
    }
    file.write(segment.data(), static_cast<std::streamsize>(segment.size()));
    file.flush();
    if (!file) {
        throw TransferError(ErrorKind::internal,
                            "failed to write working file: " + entry.working_file.string());
    }
    entry.hasher.update(segment.data(), segment.size());
}

void FileStoreManager::validate_file(const FileEntry &entry, std::uint64_t file_size,
                                     const std::string &file_hash) const {
    const auto stored_size = static_cast<std::uint64_t>(std::filesystem::file_size(entry.working_file));
    std::ostringstream error;
    if (stored_size != file_size) {
        error << "Unexpected file size. Expected: '" << file_size << "'. Stored: '" << stored_size << "'.";
    } else if (stored_size != 0) {
        const auto stored_hash = entry.hasher.hex();
        if (stored_hash != lowercase(file_hash)) {
            error << "Unexpected file hash. Expected: '" << file_hash << "'. Stored: '" << stored_hash
                  << "'.";
        }
    }
    if (!error.str().empty()) {
        throw IntegrityError("File storage error for file '" + entry.file_id + "': " + error.str());
    }
}

void FileStoreManager::publish_file(const FileEntry &entry,
                                    const std::filesystem::path &destination) const {
    std::filesystem::create_directories(destination.parent_path());
    if (std::filesystem::exists(destination)) {
        std::filesystem::remove(destination);
    }
    std::error_code ec;
    std::filesystem::rename(entry.working_file, destination, ec);
    if (ec == std::errc::cross_device_link) {
        // Working dir configured on another filesystem.
        std::filesystem::copy_file(entry.working_file, destination,
                                   std::filesystem::copy_options::overwrite_existing);
    } else if (ec) {
        throw std::filesystem::filesystem_error("failed to move working file", entry.working_file,
                                                destination, ec);
    }
}

} // namespace segxfer
