#include "segxfer/checksum.hpp"
#include "segxfer/errors.hpp"
#include "segxfer/file_entry_registry.hpp"
#include "segxfer/file_store_manager.hpp"

#include <atomic>
#include <cassert>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

namespace fs = std::filesystem;

template <typename Error, typename Fn>
bool throws(Fn &&fn) {
    try {
        fn();
    } catch (const Error &) {
        return true;
    }
    return false;
}

std::string read_file(const fs::path &path) {
    std::ifstream file(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

segxfer::SegmentRequest data_segment(const std::optional<std::string> &file_id, std::uint64_t number,
                                     const std::string &data) {
    segxfer::SegmentRequest request;
    request.file_id = file_id;
    request.name = "out.bin";
    request.segment_number = number;
    request.payload.assign(data.begin(), data.end());
    return request;
}

segxfer::SegmentRequest last_segment(const std::optional<std::string> &file_id, std::uint64_t number,
                                     const std::string &data, const std::string &name,
                                     const std::string &whole_content) {
    auto request = data_segment(file_id, number, data);
    request.name = name;
    request.result = segxfer::FileResult::store;
    request.size = whole_content.size();
    request.hash_sha256 = segxfer::Checksum::sha256_hex(whole_content);
    return request;
}

bool looks_like_uuid(const std::string &id) {
    if (id.size() != 36 || id[14] != '4') {
        return false;
    }
    for (std::size_t i = 0; i < id.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (id[i] != '-') {
                return false;
            }
        } else if (!std::isxdigit(static_cast<unsigned char>(id[i])) ||
                   std::isupper(static_cast<unsigned char>(id[i]))) {
            return false;
        }
    }
    return true;
}

void test_single_and_multi_segment(const fs::path &root) {
    segxfer::FileEntryRegistry registry;
    segxfer::FileStoreManager manager({root / "store", std::nullopt}, registry);
    assert(manager.working_dir() == manager.storage_dir() / ".workdir");
    assert(fs::is_directory(manager.working_dir()));

    auto single = manager.store_segment(last_segment(std::nullopt, 1, "hello", "one.txt", "hello"));
    assert(looks_like_uuid(single.file_id));
    assert(single.segments_received == 1);
    assert(single.result == segxfer::FileResult::store);
    assert(read_file(manager.storage_dir() / "one.txt") == "hello");
    assert(!fs::exists(manager.working_dir() / single.file_id));

    auto first = data_segment(std::nullopt, 1, "abc");
    first.total_segments = 3;
    auto progress = manager.store_segment(first);
    assert(progress.segments_received == 1);
    assert(progress.total_segments && *progress.total_segments == 3);
    assert(progress.result == segxfer::FileResult::none);
    assert(fs::exists(manager.working_dir() / progress.file_id / "file"));
    assert(manager.active_transfers() == 1);

    progress = manager.store_segment(data_segment(progress.file_id, 2, "def"));
    assert(progress.segments_received == 2);
    assert(*progress.total_segments == 3);

    auto done = manager.store_segment(last_segment(progress.file_id, 3, "g", "nested/dir/two.bin", "abcdefg"));
    assert(done.result == segxfer::FileResult::store);
    assert(done.segments_received == 3);
    assert(read_file(manager.storage_dir() / "nested/dir/two.bin") == "abcdefg");
    assert(manager.active_transfers() == 0);
    assert(fs::is_empty(manager.working_dir()));

    // Existing destinations are replaced; the declared hash is not case sensitive.
    auto replace = last_segment(std::nullopt, 1, "changed", "one.txt", "changed");
    for (auto &ch : *replace.hash_sha256) {
        ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }
    manager.store_segment(replace);
    assert(read_file(manager.storage_dir() / "one.txt") == "changed");

    auto empty = manager.store_segment(last_segment(std::nullopt, 1, "", "empty.txt", ""));
    assert(empty.result == segxfer::FileResult::store);
    assert(fs::file_size(manager.storage_dir() / "empty.txt") == 0);
}

void test_rejected_names(const fs::path &root) {
    segxfer::FileEntryRegistry registry;
    segxfer::FileStoreManager manager({root / "store", std::nullopt}, registry);

    const char *bad_names[] = {"../../etc/passwd", "..", ".", ".workdir", ".workdir/x", "a/../../x", "dir/"};
    for (const char *name : bad_names) {
        assert(throws<segxfer::ValidationError>(
            [&] { manager.store_segment(last_segment(std::nullopt, 1, "x", name, "x")); }));
    }
    assert(!fs::exists(root / "etc"));

    auto no_name = last_segment(std::nullopt, 1, "x", "", "x");
    no_name.name.reset();
    assert(throws<segxfer::ValidationError>([&] { manager.store_segment(no_name); }));

    auto no_size = last_segment(std::nullopt, 1, "x", "x.txt", "x");
    no_size.size.reset();
    assert(throws<segxfer::ValidationError>([&] { manager.store_segment(no_size); }));

    auto no_hash = last_segment(std::nullopt, 1, "x", "x.txt", "x");
    no_hash.hash_sha256 = "";
    assert(throws<segxfer::ValidationError>([&] { manager.store_segment(no_hash); }));

    assert(throws<segxfer::ValidationError>(
        [&] { manager.store_segment(data_segment(std::string("../escape"), 1, "x")); }));
    assert(throws<segxfer::ValidationError>(
        [&] { manager.store_segment(data_segment(std::string("a.b"), 1, "x")); }));

    assert(manager.active_transfers() == 0);
    assert(fs::is_empty(manager.working_dir()));
    assert(!fs::exists(manager.storage_dir() / "x.txt"));
}

void test_failures_discard_transfer(const fs::path &root) {
    segxfer::FileEntryRegistry registry;
    segxfer::FileStoreManager manager({root / "store", std::nullopt}, registry);

    auto started = manager.store_segment(data_segment(std::nullopt, 1, "abc"));
    try {
        manager.store_segment(data_segment(started.file_id, 3, "ghi"));
        assert(false);
    } catch (const segxfer::SequenceError &err) {
        assert(std::string(err.what()) == "Unexpected segment. Expected: '2'. Received: '3'");
    }
    assert(!registry.contains(started.file_id));
    assert(!fs::exists(manager.working_dir() / started.file_id));

    // Unknown id on a later segment starts a new entry, which then fails.
    assert(throws<segxfer::SequenceError>(
        [&] { manager.store_segment(data_segment(std::string("never-started"), 2, "x")); }));
    assert(!fs::exists(manager.working_dir() / "never-started"));

    auto bad_hash = last_segment(std::nullopt, 1, "abc", "bad_hash.bin", "abc");
    bad_hash.hash_sha256 = segxfer::Checksum::sha256_hex(std::string("abd"));
    assert(throws<segxfer::IntegrityError>([&] { manager.store_segment(bad_hash); }));
    assert(!fs::exists(manager.storage_dir() / "bad_hash.bin"));

    auto bad_size = last_segment(std::nullopt, 1, "abc", "bad_size.bin", "abc");
    bad_size.size = 4;
    assert(throws<segxfer::IntegrityError>([&] { manager.store_segment(bad_size); }));
    assert(!fs::exists(manager.storage_dir() / "bad_size.bin"));

    assert(manager.active_transfers() == 0);
    assert(fs::is_empty(manager.working_dir()));
}

void test_rejected_request_discards_running_transfer(const fs::path &root) {
    segxfer::FileEntryRegistry registry;
    segxfer::FileStoreManager manager({root / "store", std::nullopt}, registry);

    auto started = manager.store_segment(data_segment(std::nullopt, 1, "a"));
    auto no_hash = last_segment(started.file_id, 2, "b", "ab.txt", "ab");
    no_hash.hash_sha256.reset();
    try {
        manager.store_segment(no_hash);
        assert(false);
    } catch (const segxfer::ValidationError &err) {
        assert(std::string(err.what()) == "File hash must be specified for store request");
    }
    assert(!registry.contains(started.file_id));
    assert(!fs::exists(manager.working_dir() / started.file_id));

    started = manager.store_segment(data_segment(std::nullopt, 1, "a"));
    assert(throws<segxfer::ValidationError>(
        [&] { manager.store_segment(last_segment(started.file_id, 2, "b", "../ab.txt", "ab")); }));
    assert(!registry.contains(started.file_id));

    // A bad first segment reusing a running id must not take the owner down.
    auto owner = manager.store_segment(data_segment(std::string("owner-id"), 1, "a"));
    auto duplicate = last_segment(owner.file_id, 1, "a", "dup.txt", "a");
    duplicate.size.reset();
    assert(throws<segxfer::ValidationError>([&] { manager.store_segment(duplicate); }));
    assert(registry.contains("owner-id"));
    auto finished = manager.store_segment(last_segment(std::string("owner-id"), 2, "b", "owner.txt", "ab"));
    assert(finished.result == segxfer::FileResult::store);
    assert(read_file(manager.storage_dir() / "owner.txt") == "ab");

    assert(manager.active_transfers() == 0);
    assert(fs::is_empty(manager.working_dir()));
}

void test_concurrent_first_segments(const fs::path &root) {
    segxfer::FileEntryRegistry registry;
    segxfer::FileStoreManager manager({root / "store", std::nullopt}, registry);
    constexpr int senders = 8;

    std::atomic<int> accepted{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < senders; ++i) {
        threads.emplace_back([&]() {
            try {
                manager.store_segment(data_segment(std::string("raced-id"), 1, "x"));
                ++accepted;
            } catch (const segxfer::ValidationError &) {
                ++rejected;
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }
    assert(accepted == 1);
    assert(rejected == senders - 1);
    assert(registry.size() == 1);
    assert(registry.contains("raced-id"));

    threads.clear();
    std::mutex ids_mutex;
    std::set<std::string> ids;
    for (int i = 0; i < senders; ++i) {
        threads.emplace_back([&]() {
            auto result = manager.store_segment(data_segment(std::nullopt, 1, "y"));
            std::lock_guard<std::mutex> lock(ids_mutex);
            ids.insert(result.file_id);
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }
    assert(ids.size() == static_cast<std::size_t>(senders));
    assert(ids.count("raced-id") == 0);
    assert(registry.size() == static_cast<std::size_t>(senders) + 1);
}

void test_cancel_and_duplicate_ids(const fs::path &root) {
    segxfer::FileEntryRegistry registry;
    segxfer::FileStoreManager manager({root / "store", root / "work"}, registry);
    assert(manager.working_dir() == fs::canonical(root / "work"));

    auto started = manager.store_segment(data_segment(std::string("chosen-id"), 1, "abc"));
    assert(started.file_id == "chosen-id");
    manager.store_segment(data_segment(std::string("chosen-id"), 2, "def"));

    try {
        manager.store_segment(data_segment(std::string("chosen-id"), 1, "zzz"));
        assert(false);
    } catch (const segxfer::ValidationError &err) {
        assert(std::string(err.what()) == "Id of new file to store 'chosen-id' already exists");
    }
    // The running transfer is untouched by the rejected duplicate.
    assert(registry.contains("chosen-id"));

    segxfer::SegmentRequest cancel;
    cancel.file_id = "chosen-id";
    cancel.result = segxfer::FileResult::cancel;
    auto canceled = manager.store_segment(cancel);
    assert(canceled.result == segxfer::FileResult::cancel);
    assert(canceled.segments_received == 2);
    assert(!registry.contains("chosen-id"));
    assert(!fs::exists(root / "work" / "chosen-id"));

    cancel.file_id = "unknown-id";
    canceled = manager.store_segment(cancel);
    assert(canceled.result == segxfer::FileResult::cancel);
    assert(canceled.file_id == "unknown-id");
    assert(canceled.segments_received == 0);

    // A released id can be reused.
    auto again = manager.store_segment(last_segment(std::string("chosen-id"), 1, "x", "again.txt", "x"));
    assert(again.result == segxfer::FileResult::store);
    assert(read_file(manager.storage_dir() / "again.txt") == "x");
}

void test_recovery(const fs::path &root) {
    auto stale = root / "store" / ".workdir" / "stale-id";
    fs::create_directories(stale);
    {
        std::ofstream file(stale / "file", std::ios::binary);
        file << "partial";
    }

    segxfer::FileEntryRegistry registry;
    segxfer::FileStoreManager manager({root / "store", std::nullopt}, registry);
    assert(!fs::exists(stale));
    assert(fs::is_directory(manager.working_dir()));

    // With the leftover gone the id is free again.
    auto reused = manager.store_segment(last_segment(std::string("stale-id"), 1, "ok", "recovered.txt", "ok"));
    assert(reused.file_id == "stale-id");
    assert(read_file(manager.storage_dir() / "recovered.txt") == "ok");

    assert(throws<std::invalid_argument>([] {
        segxfer::FileEntryRegistry unused;
        segxfer::FileStoreManager bad({fs::path(), std::nullopt}, unused);
    }));
}

} // namespace

int main() {
    auto root = fs::temp_directory_path() / "segxfer_store_test";
    fs::remove_all(root);

    test_single_and_multi_segment(root);
    fs::remove_all(root);
    test_rejected_names(root);
    fs::remove_all(root);
    test_failures_discard_transfer(root);
    fs::remove_all(root);
    test_rejected_request_discards_running_transfer(root);
    fs::remove_all(root);
    test_concurrent_first_segments(root);
    fs::remove_all(root);
    test_cancel_and_duplicate_ids(root);
    fs::remove_all(root);
    test_recovery(root);
    fs::remove_all(root);
    return 0;
}
