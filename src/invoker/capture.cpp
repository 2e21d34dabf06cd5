#include "capture.h"

#include <errno.h>
#include <unistd.h>
#include <algorithm>

void OutputCapture::Append(const char* buf, size_t len) {
  total_ += len;
  if (data_.size() >= limit_) return;
  data_.append(buf, std::min(len, limit_ - data_.size()));
}

bool OutputCapture::Drain(int fd) {
  char buf[65536];
  // bounded so that a fast writer cannot starve the caller
  for (int i = 0; i < 64; i++) {
    ssize_t ret = read(fd, buf, sizeof(buf));
    if (ret > 0) {
      Append(buf, ret);
      continue;
    }
    if (ret < 0 && errno == EINTR) continue;
    if (ret < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
    return false;
  }
  return true;
}
