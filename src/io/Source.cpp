#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "ipgeo/io/Source.hpp"

static auto logger = spdlog::stdout_color_mt("Source");

namespace ipgeo {
namespace io {

FileSource::~FileSource() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

std::unique_ptr<FileSource> FileSource::Open(const std::string &path) {
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    logger->error("unable to open: {}, {}", path, strerror(errno));
    return nullptr;
  }

  struct stat st;
  if (fstat(fd, &st) != 0) {
    logger->error("unable to stat: {}, {}", path, strerror(errno));
    ::close(fd);
    return nullptr;
  }

  return std::unique_ptr<FileSource>(
      new FileSource(path, fd, static_cast<uint64_t>(st.st_size)));
}

bool FileSource::DoReadAt(uint64_t offset, void *buf, size_t len) {
  char *p = static_cast<char *>(buf);
  while (len > 0) {
    ssize_t n = ::pread(fd_, p, len, static_cast<off_t>(offset));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      logger->error("pread failed: {}, offset: {}, {}", path_, offset,
                    strerror(errno));
      return false;
    }
    if (n == 0) {
      logger->error("short read: {}, offset: {}, missing: {}", path_, offset,
                    len);
      return false;
    }
    p += n;
    len -= static_cast<size_t>(n);
    offset += static_cast<uint64_t>(n);
  }
  return true;
}

bool MemorySource::DoReadAt(uint64_t offset, void *buf, size_t len) {
  if (offset > data_.size() || len > data_.size() - offset) {
    logger->error("short read: offset: {}, length: {}, size: {}", offset, len,
                  data_.size());
    return false;
  }
  memcpy(buf, data_.data() + offset, len);
  return true;
}

} // namespace io
} // namespace ipgeo
