#include "execbox/capture.h"

bool CapturedStream::Append(std::string_view text) {
  if (truncated_) return false;
  if (!limit_ || buffer_.size() + text.size() <= limit_) {
    buffer_.append(text);
    return true;
  }
  // keep what fits, without splitting a UTF-8 sequence
  size_t keep = limit_ - buffer_.size();
  while (keep > 0 && keep < text.size() && ((unsigned char)text[keep] & 0xC0) == 0x80) keep--;
  buffer_.append(text.substr(0, keep));
  truncated_ = true;
  return false;
}

std::string CapturedStream::Release() {
  std::string ret = std::move(buffer_);
  buffer_.clear();
  truncated_ = false;
  return ret;
}
