#include "segxfer/segment_reader.hpp"

#include <stdexcept>

namespace segxfer {

SegmentReader::SegmentReader(std::istream &stream, std::size_t max_segment_size)
    : stream_(stream), max_segment_size_(max_segment_size) {
    if (max_segment_size_ == 0) {
        throw std::invalid_argument("max segment size must be > 0");
    }
}

std::vector<char> SegmentReader::next_segment() {
    std::vector<char> buffer(max_segment_size_);
    std::size_t filled = 0;
    // Short reads are topped up so only the last segment may be smaller.
    while (filled < buffer.size() && stream_) {
        stream_.read(buffer.data() + filled, static_cast<std::streamsize>(buffer.size() - filled));
        auto read = stream_.gcount();
        if (read <= 0) {
            break;
        }
        filled += static_cast<std::size_t>(read);
    }
    if (stream_.bad()) {
        throw std::runtime_error("failed to read from source stream");
    }
    buffer.resize(filled);
    if (!buffer.empty()) {
        bytes_read_ += buffer.size();
        hasher_.update(buffer.data(), buffer.size());
    }
    return buffer;
}

std::uint64_t SegmentReader::bytes_read() const noexcept { return bytes_read_; }

std::string SegmentReader::hash_hex() const { return hasher_.hex(); }

std::size_t SegmentReader::max_segment_size() const noexcept { return max_segment_size_; }

std::uint64_t SegmentReader::total_segments(std::uint64_t stream_size, std::size_t max_segment_size) {
    if (max_segment_size == 0) {
        throw std::invalid_argument("max segment size must be > 0");
    }
    if (stream_size == 0) {
        return 1;
    }
    return (stream_size + max_segment_size - 1) / max_segment_size;
}

} // namespace segxfer
