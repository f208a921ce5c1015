#undef NDEBUG
#include <assert.h>
#include <iostream>

#include "ipgeo/Address.hpp"

using namespace ipgeo;

static Address classify(const std::string &text) {
  Address address;
  bool ok = Classify(text, address);
  assert(ok);
  return address;
}

void testIPv4() {
  std::cout << "Testing IPv4 classification..." << std::endl;

  Address a = classify("1.2.3.4");
  assert(a.family == Family::V4);
  assert(a.number == 0x01020304u);

  a = classify("0.0.0.0");
  assert(a.family == Family::V4);
  assert(a.number == 0);

  a = classify("255.255.255.255");
  assert(a.number == MaxNumber(Family::V4));

  // IPv4-mapped IPv6 goes to the IPv4 table
  a = classify("::ffff:8.8.4.4");
  assert(a.family == Family::V4);
  assert(a.number == 0x08080404u);

  std::cout << "IPv4 classification tests passed!" << std::endl;
}

void testIPv6() {
  std::cout << "Testing IPv6 classification..." << std::endl;

  Address a = classify("::1");
  assert(a.family == Family::V6);
  assert(a.number == 1);

  a = classify("2001:db8::ff00:42:8329");
  assert(a.family == Family::V6);
  assert(a.number == uint128("0x20010db8000000000000ff0000428329"));

  a = classify("ffff:ffff:ffff:ffff:ffff:ffff:ffff:ffff");
  assert(a.number == MaxNumber(Family::V6));

  // IPv4-compatible (not mapped) stays IPv6
  a = classify("::1.2.3.4");
  assert(a.family == Family::V6);
  assert(a.number == 0x01020304u);

  std::cout << "IPv6 classification tests passed!" << std::endl;
}

void testInvalid() {
  std::cout << "Testing invalid addresses..." << std::endl;

  const char *bad[] = {"",          "not-an-ip",    "1.2.3",
                       "1.2.3.256", "1.2.3.4.5",    " 1.2.3.4",
                       "1.2.3.4 ",  "2001:db8:::1", "fe80::1%eth0",
                       "12345::",   "::ffff:1.2.3"};
  for (auto text : bad) {
    Address a;
    assert(!Classify(text, a));
    assert(a.family == Family::Unknown);
  }

  std::cout << "Invalid address tests passed!" << std::endl;
}

void testBuckets() {
  std::cout << "Testing index buckets..." << std::endl;

  Address v4 = classify("1.2.3.4");
  Address v6 = classify("2001:db8::1");

  // no index
  assert(BucketAddress(v4, 0, 500) == 0);
  assert(BucketAddress(v6, 500, 0) == 0);

  assert(BucketAddress(v4, 65, 0) == (0x0102u << 3) + 65);
  assert(BucketAddress(v6, 0, 65) == (0x2001u << 3) + 65);

  Address top = classify("255.255.255.255");
  assert(BucketAddress(top, 1, 0) == (0xFFFFu << 3) + 1);
  Address top6 = classify("ffff::");
  assert(BucketAddress(top6, 0, 1) == (0xFFFFu << 3) + 1);

  Address none;
  assert(BucketAddress(none, 1, 1) == 0);

  std::cout << "Index bucket tests passed!" << std::endl;
}

int main() {
  testIPv4();
  testIPv6();
  testInvalid();
  testBuckets();
  return 0;
}
