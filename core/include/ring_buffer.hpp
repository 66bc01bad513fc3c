#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>

namespace hvctl {

/**
 * @brief Fixed-capacity byte buffer that keeps only the most recent bytes
 * @note Not thread-safe; `broadcaster_t` guards it with its own lock.
 */
class ring_buffer_t {
public:
  explicit ring_buffer_t(size_t capacity) : buf_(capacity, '\0') {}

  void write(std::string_view data) {
    const size_t cap = buf_.size();
    if (cap == 0)
      return;
    total_ += data.size();
    if (data.size() >= cap) {
      data.remove_prefix(data.size() - cap);
      buf_.assign(data.begin(), data.end());
      head_ = 0;
      size_ = cap;
      return;
    }
    for (char c : data) {
      buf_[head_] = c;
      head_ = (head_ + 1) % cap;
    }
    size_ = std::min(cap, size_ + data.size());
  }

  /**
   * @return Retained bytes, oldest first
   */
  std::string bytes() const {
    const size_t cap = buf_.size();
    if (size_ < cap)
      return buf_.substr(0, size_);
    std::string rv;
    rv.reserve(cap);
    rv.append(buf_, head_, cap - head_);
    rv.append(buf_, 0, head_);
    return rv;
  }

  size_t size() const { return size_; }

  size_t capacity() const { return buf_.size(); }

  /**
   * @return Number of bytes ever written
   */
  size_t total_written() const { return total_; }

  void reset() {
    head_ = 0;
    size_ = 0;
    total_ = 0;
  }

private:
  std::string buf_;

  size_t head_ = 0;

  size_t size_ = 0;

  size_t total_ = 0;
};

} // namespace hvctl
