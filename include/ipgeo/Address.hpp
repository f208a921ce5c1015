#pragma once

#include <stdint.h>
#include <string>

#include "ipgeo/Types.hpp"

namespace ipgeo {

enum class Family : int { Unknown = 0, V4 = 4, V6 = 6 };

struct Address {
  Family family  = Family::Unknown;
  uint128 number = 0; // big-endian interpretation of the address bytes
};

// Parses an IPv4 dotted quad or an IPv6 address. IPv4-mapped IPv6 addresses
// (::ffff:a.b.c.d) are classified as IPv4. Returns false on anything else.
bool Classify(const std::string &text, Address &address);

// Highest number of the family, 2^32-1 or 2^128-1.
const uint128 &MaxNumber(Family family);

// Position of the index bucket holding the row bounds for the address's top
// 16 bits, or 0 when the family has no index. Buckets are 8 bytes apart.
uint32_t BucketAddress(const Address &address, uint32_t v4_index_base,
                       uint32_t v6_index_base);

} // namespace ipgeo
