#pragma once

#include <stddef.h>
#include <stdint.h>
#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "ipgeo/Macros.hpp"

namespace ipgeo {
namespace io {

// Random access byte source. Reads are positional, there is no shared cursor,
// so concurrent ReadAt calls never interleave.
class Source {
public:
  Source() : reads_(0) {}
  virtual ~Source() {}

  // Fills buf with exactly len bytes starting at the 0-based offset. A short
  // read counts as a failure.
  bool ReadAt(uint64_t offset, void *buf, size_t len) {
    reads_.fetch_add(1, std::memory_order_relaxed);
    return DoReadAt(offset, buf, len);
  }

  virtual uint64_t Size() const = 0;

  // Number of ReadAt calls issued so far.
  uint64_t Reads() const { return reads_.load(std::memory_order_relaxed); }

protected:
  virtual bool DoReadAt(uint64_t offset, void *buf, size_t len) = 0;

private:
  DISALLOW_COPY_AND_ASSIGN(Source);

  std::atomic<uint64_t> reads_;
};

class FileSource final : public Source {
public:
  ~FileSource();

  // Returns nullptr (and logs) when the file cannot be opened.
  static std::unique_ptr<FileSource> Open(const std::string &path);

  uint64_t Size() const override { return size_; }
  const std::string &Path() const { return path_; }

protected:
  bool DoReadAt(uint64_t offset, void *buf, size_t len) override;

private:
  FileSource(std::string path, int fd, uint64_t size)
      : path_(std::move(path)), fd_(fd), size_(size) {}

  std::string path_;
  int fd_;
  uint64_t size_;
};

class MemorySource final : public Source {
public:
  MemorySource(const char *data, size_t size) : data_(data, data + size) {}
  explicit MemorySource(std::vector<char> data) : data_(std::move(data)) {}

  uint64_t Size() const override { return data_.size(); }

protected:
  bool DoReadAt(uint64_t offset, void *buf, size_t len) override;

private:
  std::vector<char> data_;
};

} // namespace io
} // namespace ipgeo
