#include "protocol/range.hpp"
#include <algorithm>
#include <limits>

namespace bucketd {
namespace protocol {

namespace {

const std::string BYTES_UNIT = "bytes=";

std::string trim(const std::string& value) {
  const char* whitespace = " \t";
  std::size_t first = value.find_first_not_of(whitespace);
  if (first == std::string::npos) {
    return "";
  }
  std::size_t last = value.find_last_not_of(whitespace);
  return value.substr(first, last - first + 1);
}

// Saturates at SIZE_MAX so an oversized position is reported as unsatisfiable, not malformed
std::size_t parse_position(const std::string& digits, const std::string& spec) {
  if (digits.empty()) {
    throw MalformedRange("missing position in '" + spec + "'");
  }

  constexpr std::size_t max = std::numeric_limits<std::size_t>::max();
  std::size_t position = 0;
  for (char c : digits) {
    if (c < '0' || c > '9') {
      throw MalformedRange("invalid position in '" + spec + "'");
    }
    std::size_t digit = static_cast<std::size_t>(c - '0');
    if (position > (max - digit) / 10) {
      return max;
    }
    position = position * 10 + digit;
  }
  return position;
}

ByteRange parse_spec(const std::string& spec, std::size_t content_length) {
  std::size_t dash = spec.find('-');
  if (dash == std::string::npos) {
    throw MalformedRange("missing '-' in '" + spec + "'");
  }

  std::string first_text = trim(spec.substr(0, dash));
  std::string last_text = trim(spec.substr(dash + 1));

  if (first_text.empty()) {
    // Suffix form: the last N bytes, clamped to the value
    std::size_t suffix = parse_position(last_text, spec);
    if (suffix == 0 || content_length == 0) {
      throw UnsatisfiableRange("'" + spec + "'");
    }
    std::size_t length = std::min(suffix, content_length);
    return ByteRange{content_length - length, content_length - 1};
  }

  std::size_t first = parse_position(first_text, spec);
  std::size_t last = last_text.empty() ? content_length - 1 : parse_position(last_text, spec);

  if (!last_text.empty() && first > last) {
    throw MalformedRange("first position after last in '" + spec + "'");
  }
  if (first >= content_length || last >= content_length) {
    throw UnsatisfiableRange("'" + spec + "' for " + std::to_string(content_length) + " bytes");
  }
  return ByteRange{first, last};
}

} // namespace

std::vector<ByteRange> parse_range_header(const std::string& header, std::size_t content_length) {
  std::string value = trim(header);
  if (value.compare(0, BYTES_UNIT.size(), BYTES_UNIT) != 0) {
    throw MalformedRange("unsupported unit in '" + header + "'");
  }

  std::vector<ByteRange> ranges;
  std::string specs = value.substr(BYTES_UNIT.size());
  std::size_t start = 0;
  while (start <= specs.size()) {
    std::size_t end = specs.find(',', start);
    if (end == std::string::npos) {
      end = specs.size();
    }
    std::string spec = trim(specs.substr(start, end - start));
    if (!spec.empty()) {
      ranges.push_back(parse_spec(spec, content_length));
    }
    start = end + 1;
  }

  if (ranges.empty()) {
    throw UnsatisfiableRange("empty range set");
  }
  return ranges;
}

std::string slice_ranges(const std::string& value, const std::vector<ByteRange>& ranges) {
  std::string body;
  for (const auto& range : ranges) {
    body.append(value, range.first, range.length());
  }
  return body;
}

std::string content_range(const ByteRange& range, std::size_t content_length) {
  return "bytes " + std::to_string(range.first) + "-" + std::to_string(range.last)
       + "/" + std::to_string(content_length);
}

} // namespace protocol
} // namespace bucketd
