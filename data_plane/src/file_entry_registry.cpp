#include "segxfer/file_entry_registry.hpp"

#include "segxfer/errors.hpp"
#include "segxfer/logging.hpp"

#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>

namespace segxfer {

std::shared_ptr<FileEntry> FileEntryRegistry::acquire(const std::optional<std::string> &file_id,
                                                      bool first_segment,
                                                      const std::filesystem::path &working_root) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_id || file_id->empty()) {
        std::string id;
        do {
            id = generate_id();
        } while (entries_.count(id) != 0 || std::filesystem::exists(working_root / id));
        return create_entry(id, working_root);
    }

    auto it = entries_.find(*file_id);
    if (it != entries_.end()) {
        if (first_segment) {
            throw ValidationError("Id of new file to store '" + *file_id + "' already exists");
        }
        return it->second;
    }
    if (std::filesystem::exists(working_root / *file_id)) {
        throw ValidationError("Work directory for new file id '" + *file_id + "' already exists");
    }
    return create_entry(*file_id, working_root);
}

std::shared_ptr<FileEntry> FileEntryRegistry::find(const std::string &file_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(file_id);
    if (it == entries_.end()) {
        return nullptr;
    }
    return it->second;
}

void FileEntryRegistry::release(const std::string &file_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    erase_locked(file_id, nullptr);
}

void FileEntryRegistry::release(const std::shared_ptr<FileEntry> &entry) {
    if (!entry) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    erase_locked(entry->file_id, entry.get());
}

void FileEntryRegistry::erase_locked(const std::string &file_id, const FileEntry *expected) {
    auto it = entries_.find(file_id);
    if (it == entries_.end() || (expected != nullptr && it->second.get() != expected)) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(it->second->working_dir, ec);
    if (ec) {
        log_error("failed to remove working dir '" + it->second->working_dir.string() +
                  "': " + ec.message());
    }
    entries_.erase(it);
}

bool FileEntryRegistry::contains(const std::string &file_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(file_id) != 0;
}

std::size_t FileEntryRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::shared_ptr<FileEntry> FileEntryRegistry::create_entry(const std::string &file_id,
                                                           const std::filesystem::path &working_root) {
    auto entry = std::make_shared<FileEntry>();
    entry->file_id = file_id;
    entry->working_dir = working_root / file_id;
    entry->working_file = entry->working_dir / working_file_name;

    std::filesystem::create_directories(entry->working_dir);
    std::ofstream file(entry->working_file, std::ios::binary | std::ios::trunc);
    if (!file) {
        std::error_code ec;
        std::filesystem::remove_all(entry->working_dir, ec);
        throw TransferError(ErrorKind::internal,
                            "failed to create working file: " + entry->working_file.string());
    }

    entries_[file_id] = entry;
    log_info("Assigning file id '" + file_id + "' for '" + entry->working_dir.string() + "'");
    return entry;
}

std::string FileEntryRegistry::generate_id() {
    thread_local std::mt19937_64 generator{std::random_device{}()};
    std::uniform_int_distribution<std::uint64_t> distribution;
    std::uint64_t high = distribution(generator);
    std::uint64_t low = distribution(generator);
    // Version 4 / variant 1 bits, so ids read as random UUIDs.
    high = (high & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
    low = (low & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;

    std::ostringstream oss;
    oss << std::hex << std::nouppercase << std::setfill('0') << std::setw(8) << (high >> 32) << '-'
        << std::setw(4) << ((high >> 16) & 0xFFFFu) << '-' << std::setw(4) << (high & 0xFFFFu) << '-'
        << std::setw(4) << (low >> 48) << '-' << std::setw(12) << (low & 0xFFFFFFFFFFFFull);
    return oss.str();
}

} // namespace segxfer
