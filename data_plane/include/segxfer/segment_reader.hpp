#pragma once

#include "segxfer/checksum.hpp"

#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace segxfer {

// Splits a byte stream into segments of at most max_segment_size bytes while
// hashing every byte handed out.
class SegmentReader {
  public:
    SegmentReader(std::istream &stream, std::size_t max_segment_size);

    // Returns an empty vector once the stream is exhausted.
    std::vector<char> next_segment();

    std::uint64_t bytes_read() const noexcept;

    std::string hash_hex() const;

    std::size_t max_segment_size() const noexcept;

    // Number of segments a stream of stream_size bytes is sent in. An empty
    // stream still takes one (empty) terminal segment.
    static std::uint64_t total_segments(std::uint64_t stream_size, std::size_t max_segment_size);

  private:
    std::istream &stream_;
    std::size_t max_segment_size_;
    std::uint64_t bytes_read_{0};
    Checksum::Sha256Accumulator hasher_;
};

} // namespace segxfer
