#include <boost/asio/ip/address.hpp>

#include "ipgeo/Address.hpp"

namespace ipgeo {

static const uint128 kMaxV4 = uint128(0xFFFFFFFFu);
static const uint128 kMaxV6 = ~uint128(0);

bool Classify(const std::string &text, Address &address) {
  namespace ip = boost::asio::ip;

  // scoped addresses (fe80::1%eth0) are not looked up
  if (text.find('%') != std::string::npos) {
    return false;
  }

  boost::system::error_code ec;
  ip::address parsed = ip::make_address(text, ec);
  if (ec) {
    return false;
  }

  if (parsed.is_v4()) {
    address.family = Family::V4;
    address.number = parsed.to_v4().to_uint();
    return true;
  }

  ip::address_v6 v6 = parsed.to_v6();
  if (v6.is_v4_mapped()) {
    address.family = Family::V4;
    address.number = ip::make_address_v4(ip::v4_mapped, v6).to_uint();
    return true;
  }

  uint128 number = 0;
  for (auto b : v6.to_bytes()) {
    number <<= 8;
    number |= b;
  }
  address.family = Family::V6;
  address.number = number;
  return true;
}

const uint128 &MaxNumber(Family family) {
  return family == Family::V6 ? kMaxV6 : kMaxV4;
}

uint32_t BucketAddress(const Address &address, uint32_t v4_index_base,
                       uint32_t v6_index_base) {
  switch (address.family) {
  case Family::V4:
    if (v4_index_base > 0) {
      uint32_t prefix = static_cast<uint32_t>(address.number >> 16);
      return (prefix << 3) + v4_index_base;
    }
    break;
  case Family::V6:
    if (v6_index_base > 0) {
      uint32_t prefix = static_cast<uint32_t>(address.number >> 112);
      return (prefix << 3) + v6_index_base;
    }
    break;
  case Family::Unknown:
    break;
  }
  return 0;
}

} // namespace ipgeo
