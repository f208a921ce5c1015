#include <string.h>

#include "ipgeo/io/Reader.hpp"

namespace ipgeo {
namespace io {

#define B2IL(b)                                                               \
  (((b)[0] & 0xFF) | (((b)[1] << 8) & 0xFF00) | (((b)[2] << 16) & 0xFF0000) | \
   ((static_cast<uint32_t>((b)[3]) << 24) & 0xFF000000))

Status Reader::read(uint64_t offset, void *buf, size_t len) const {
  return source_.ReadAt(offset, buf, len) ? Status::OK : Status::IOError;
}

Status Reader::ReadU8(uint32_t pos, uint8_t &out) const {
  byte b;
  RETURN_IF_ERROR(read(static_cast<uint64_t>(pos) - 1, &b, 1));
  out = b;
  return Status::OK;
}

Status Reader::ReadU32(uint32_t pos, uint32_t &out) const {
  byte b[4];
  RETURN_IF_ERROR(read(static_cast<uint64_t>(pos) - 1, b, sizeof(b)));
  out = B2IL(b);
  return Status::OK;
}

Status Reader::ReadU128(uint32_t pos, uint128 &out) const {
  byte b[16];
  RETURN_IF_ERROR(read(static_cast<uint64_t>(pos) - 1, b, sizeof(b)));

  // stored least significant byte first
  uint128 value = 0;
  for (int i = 15; i >= 0; --i) {
    value <<= 8;
    value |= b[i];
  }
  out = value;
  return Status::OK;
}

Status Reader::ReadFloat(uint32_t pos, float &out) const {
  uint32_t bits;
  RETURN_IF_ERROR(ReadU32(pos, bits));
  static_assert(sizeof(float) == sizeof(uint32_t), "IEEE-754 single expected");
  memcpy(&out, &bits, sizeof(out));
  return Status::OK;
}

Status Reader::ReadString(uint32_t pos, std::string &out) const {
  byte length;
  RETURN_IF_ERROR(read(pos, &length, 1));

  std::string value(length, '\0');
  if (length > 0) {
    RETURN_IF_ERROR(read(static_cast<uint64_t>(pos) + 1, &value[0], length));
  }
  out.swap(value);
  return Status::OK;
}

} // namespace io
} // namespace ipgeo
