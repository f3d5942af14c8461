#include "segxfer/wire.hpp"

#include <charconv>
#include <sstream>

namespace segxfer {

namespace {

void put_uint(Fields &fields, const char *key, const std::optional<std::uint64_t> &value) {
    if (value) {
        fields[key] = std::to_string(*value);
    }
}

void put_string(Fields &fields, const char *key, const std::optional<std::string> &value) {
    if (value) {
        fields[key] = *value;
    }
}

std::optional<std::string> get_string(const Fields &fields, const char *key) {
    auto it = fields.find(key);
    if (it == fields.end()) {
        return std::nullopt;
    }
    return it->second;
}

template <typename Error>
std::optional<std::uint64_t> get_uint(const Fields &fields, const char *key) {
    auto it = fields.find(key);
    if (it == fields.end()) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    if (!parse_uint64(it->second, value)) {
        std::ostringstream oss;
        oss << "'" << key << "' of '" << it->second << "' could not be converted to an int";
        throw Error(oss.str());
    }
    return value;
}

template <typename Error>
FileResult get_result(const Fields &fields) {
    auto it = fields.find(field::result);
    if (it == fields.end() || it->second.empty()) {
        return FileResult::none;
    }
    if (it->second == file_result_name(FileResult::store)) {
        return FileResult::store;
    }
    if (it->second == file_result_name(FileResult::cancel)) {
        return FileResult::cancel;
    }
    throw Error("Unexpected '" + std::string(field::result) + "' value: '" + it->second + "'");
}

} // namespace

const char *file_result_name(FileResult result) noexcept {
    switch (result) {
    case FileResult::none:
        return "";
    case FileResult::store:
        return "store";
    case FileResult::cancel:
        return "cancel";
    }
    return "";
}

std::string encode_fields(const Fields &fields) {
    std::string text;
    for (const auto &entry : fields) {
        if (entry.first.empty() || entry.first.find_first_of("=\r\n") != std::string::npos ||
            entry.second.find_first_of("\r\n") != std::string::npos) {
            throw ValidationError("field cannot be encoded: '" + entry.first + "'");
        }
        text += entry.first;
        text += '=';
        text += entry.second;
        text += '\n';
    }
    return text;
}

Fields decode_fields(const std::string &text) {
    Fields fields;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        if (line.empty()) {
            continue;
        }
        auto pos = line.find('=');
        if (pos == std::string::npos || pos == 0) {
            throw ValidationError("malformed field line: '" + line + "'");
        }
        fields[line.substr(0, pos)] = line.substr(pos + 1);
    }
    return fields;
}

bool parse_uint64(const std::string &text, std::uint64_t &out) {
    if (text.empty()) {
        return false;
    }
    const char *first = text.data();
    const char *last = text.data() + text.size();
    auto result = std::from_chars(first, last, out);
    return result.ec == std::errc() && result.ptr == last;
}

Request make_request(const std::string &topic, SegmentRequest segment) {
    Request request;
    request.topic = topic;
    put_string(request.fields, field::file_id, segment.file_id);
    put_string(request.fields, field::name, segment.name);
    put_uint(request.fields, field::segment_number, segment.segment_number);
    put_uint(request.fields, field::size, segment.size);
    put_string(request.fields, field::hash_sha256, segment.hash_sha256);
    put_uint(request.fields, field::total_segments, segment.total_segments);
    if (segment.result != FileResult::none) {
        request.fields[field::result] = file_result_name(segment.result);
    }
    request.payload = std::move(segment.payload);
    return request;
}

SegmentRequest segment_request_from(const Request &request) {
    SegmentRequest segment;
    segment.file_id = get_string(request.fields, field::file_id);
    segment.name = get_string(request.fields, field::name);
    segment.segment_number = get_uint<ValidationError>(request.fields, field::segment_number);
    segment.size = get_uint<ValidationError>(request.fields, field::size);
    segment.hash_sha256 = get_string(request.fields, field::hash_sha256);
    segment.total_segments = get_uint<ValidationError>(request.fields, field::total_segments);
    segment.result = get_result<ValidationError>(request.fields);
    segment.payload = request.payload;
    return segment;
}

Response make_response(const SegmentResponse &segment) {
    Response response;
    response.fields[field::file_id] = segment.file_id;
    response.fields[field::segments_received] = std::to_string(segment.segments_received);
    put_uint(response.fields, field::total_segments, segment.total_segments);
    if (segment.result != FileResult::none) {
        response.fields[field::result] = file_result_name(segment.result);
    }
    return response;
}

Response make_error_response(ErrorKind kind, const std::string &message) {
    Response response;
    response.error = kind == ErrorKind::none ? ErrorKind::internal : kind;
    response.error_message = message;
    return response;
}

void raise_on_error(const Response &response) {
    if (!response.ok()) {
        throw_transfer_error(response.error, response.error_message);
    }
}

SegmentResponse segment_response_from(const Response &response) {
    raise_on_error(response);
    SegmentResponse segment;
    auto file_id = get_string(response.fields, field::file_id);
    if (!file_id || file_id->empty()) {
        throw TransportError("malformed response: missing '" + std::string(field::file_id) + "'");
    }
    segment.file_id = *file_id;
    auto received = get_uint<TransportError>(response.fields, field::segments_received);
    segment.segments_received = received.value_or(0);
    segment.total_segments = get_uint<TransportError>(response.fields, field::total_segments);
    segment.result = get_result<TransportError>(response.fields);
    return segment;
}

} // namespace segxfer
