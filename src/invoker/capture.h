#ifndef INVOKER_CAPTURE_H_
#define INVOKER_CAPTURE_H_

#include <string>
#include <utility>

// Bounded capture of one output stream. Bytes over the limit are read and dropped.
class OutputCapture {
  std::string data_;
  size_t limit_;
  size_t total_;
 public:
  OutputCapture(size_t limit) : limit_(limit), total_(0) {}

  void Append(const char* buf, size_t len);
  // Read what is currently available from a non-blocking fd.
  // Returns false on EOF or error.
  bool Drain(int fd);

  const std::string& Data() const { return data_; }
  std::string&& Take() { return std::move(data_); }
  bool Truncated() const { return total_ > limit_; }
  size_t Total() const { return total_; }
};

#endif  // INVOKER_CAPTURE_H_
