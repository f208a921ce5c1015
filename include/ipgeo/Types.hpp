#pragma once

#include <stdint.h>
#include <boost/multiprecision/cpp_int.hpp>

namespace ipgeo {

typedef unsigned char byte;

// IPv6 addresses and the 16 byte range columns of the IPv6 table.
using uint128 = boost::multiprecision::uint128_t;

} // namespace ipgeo
