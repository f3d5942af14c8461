#pragma once

#include "segxfer/message.hpp"

#include <cstdint>
#include <string>

namespace segxfer {

// "key=value" lines. Keys may not contain '=' and neither part may contain a
// line break.
std::string encode_fields(const Fields &fields);

Fields decode_fields(const std::string &text);

bool parse_uint64(const std::string &text, std::uint64_t &out);

Request make_request(const std::string &topic, SegmentRequest segment);

// Throws ValidationError when a numeric field does not parse or the result
// value is neither "store" nor "cancel".
SegmentRequest segment_request_from(const Request &request);

Response make_response(const SegmentResponse &segment);

Response make_error_response(ErrorKind kind, const std::string &message);

// Error responses are rethrown as the matching TransferError subclass.
void raise_on_error(const Response &response);

SegmentResponse segment_response_from(const Response &response);

} // namespace segxfer
