#ifndef BUCKETD_PROTOCOL_RANGE_HPP
#define BUCKETD_PROTOCOL_RANGE_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace bucketd {
namespace protocol {

class RangeError : public std::runtime_error {
public:
  explicit RangeError(const std::string& message) : std::runtime_error(message) {}
};

// Unknown unit or a spec that is not a valid byte range
class MalformedRange : public RangeError {
public:
  explicit MalformedRange(const std::string& message)
    : RangeError("Malformed range: " + message) {}
};

// Well formed, but no part of it can be served from the stored value
class UnsatisfiableRange : public RangeError {
public:
  explicit UnsatisfiableRange(const std::string& message)
    : RangeError("Unsatisfiable range: " + message) {}
};

// Inclusive span of bytes
struct ByteRange {
  std::size_t first;
  std::size_t last;

  std::size_t length() const { return last - first + 1; }
  bool operator==(const ByteRange& other) const { return first == other.first && last == other.last; }
};

// Parses "bytes=first-last[,...]", "first-" and "-suffix" specs against a value of content_length bytes.
// Spans keep the order of the header and are neither merged nor deduplicated
std::vector<ByteRange> parse_range_header(const std::string& header, std::size_t content_length);

// Concatenation of the spans of value, in order
std::string slice_ranges(const std::string& value, const std::vector<ByteRange>& ranges);

// "bytes first-last/length"
std::string content_range(const ByteRange& range, std::size_t content_length);

} // namespace protocol
} // namespace bucketd

#endif // BUCKETD_PROTOCOL_RANGE_HPP
