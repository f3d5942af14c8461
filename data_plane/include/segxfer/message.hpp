#pragma once

#include "segxfer/errors.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace segxfer {

namespace field {
constexpr const char *file_id = "file_id";
constexpr const char *name = "name";
constexpr const char *segment_number = "segment_number";
constexpr const char *size = "size";
constexpr const char *hash_sha256 = "hash_sha256";
constexpr const char *result = "result";
constexpr const char *segments_received = "segments_received";
constexpr const char *total_segments = "total_segments";
} // namespace field

enum class FileResult { none, store, cancel };

const char *file_result_name(FileResult result) noexcept;

// Metadata carried beside the payload of a fabric message.
using Fields = std::map<std::string, std::string>;

struct Request {
    std::string topic;
    Fields fields;
    std::vector<char> payload;
};

struct Response {
    ErrorKind error{ErrorKind::none};
    std::string error_message;
    Fields fields;

    bool ok() const noexcept { return error == ErrorKind::none; }
};

struct SegmentRequest {
    std::optional<std::string> file_id;
    std::optional<std::string> name;
    std::optional<std::uint64_t> segment_number;
    std::optional<std::uint64_t> size;
    std::optional<std::string> hash_sha256;
    std::optional<std::uint64_t> total_segments;
    FileResult result{FileResult::none};
    std::vector<char> payload;
};

struct SegmentResponse {
    std::string file_id;
    std::uint64_t segments_received{0};
    std::optional<std::uint64_t> total_segments;
    FileResult result{FileResult::none};
};

} // namespace segxfer
