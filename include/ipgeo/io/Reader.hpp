#pragma once

#include <string>

#include "ipgeo/Status.hpp"
#include "ipgeo/Types.hpp"
#include "ipgeo/io/Source.hpp"

namespace ipgeo {
namespace io {

// Little-endian primitive decoding on top of a Source.
//
// Numeric reads take 1-based positions, as every position stored in the
// database header and row columns is 1-based. ReadString takes the pointer
// stored in a string column as is, i.e. as a 0-based offset of the length
// byte. Mixing the two conventions reads one byte off.
class Reader {
public:
  explicit Reader(Source &source) : source_(source) {}

  Status ReadU8(uint32_t pos, uint8_t &out) const;
  Status ReadU32(uint32_t pos, uint32_t &out) const;
  Status ReadU128(uint32_t pos, uint128 &out) const;
  Status ReadFloat(uint32_t pos, float &out) const;
  Status ReadString(uint32_t pos, std::string &out) const;

  Source &source() const { return source_; }

private:
  Status read(uint64_t offset, void *buf, size_t len) const;

  Source &source_;
};

} // namespace io
} // namespace ipgeo
