#ifndef INCLUDE_EXECBOX_CAPTURE_H_
#define INCLUDE_EXECBOX_CAPTURE_H_

#include <string>
#include <string_view>

// Append-only buffer for the text one execution writes to a channel.
// The snippet can only reach it through the allow-listed output operation.
class CapturedStream {
  std::string buffer_;
  size_t limit_; // bytes; 0 = unlimited
  bool truncated_;
 public:
  CapturedStream() : limit_(0), truncated_(false) {}

  void SetLimit(size_t bytes) { limit_ = bytes; }
  size_t Limit() const { return limit_; }

  // Returns false if the limit cut the text short; nothing is appended after that.
  bool Append(std::string_view text);

  const std::string& str() const { return buffer_; }
  bool empty() const { return buffer_.empty(); }
  bool truncated() const { return truncated_; }
  std::string Release();
};

// The writer handle threaded into one run
struct OutputChannels {
  CapturedStream out;
  CapturedStream err;
};

#endif  // INCLUDE_EXECBOX_CAPTURE_H_
