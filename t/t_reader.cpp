#undef NDEBUG
#include <assert.h>
#include <iostream>

#include "ipgeo/io/Reader.hpp"
#include "Fixture.hpp"

using namespace ipgeo;
using namespace ipgeo::io;
using namespace ipgeo::test;

static std::vector<char> sample() {
  std::vector<char> data = {
      0x11,                                           // 0
      0x78, 0x56, 0x34, 0x12,                         // 1..4  u32 0x12345678
      0x00, 0x00, static_cast<char>(0x80), 0x3F,      // 5..8  float 1.0
      0x02, 'U',  'S',                                // 9..11 "US"
      0x00,                                           // 12    ""
      0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08, // 13..28 u128
      0x09, 0x0A, 0x0B, 0x0C, 0x0D, 0x0E, 0x0F, 0x10,
      0x05, 'a',  'b',                                // 29..31 truncated
  };
  return data;
}

void testNumbers(Reader &reader) {
  std::cout << "Testing numeric reads..." << std::endl;

  uint8_t u8 = 0;
  assert(reader.ReadU8(1, u8) == Status::OK);
  assert(u8 == 0x11);

  uint32_t u32 = 0;
  assert(reader.ReadU32(2, u32) == Status::OK);
  assert(u32 == 0x12345678);

  float f = 0;
  assert(reader.ReadFloat(6, f) == Status::OK);
  assert(f == 1.0f);

  uint128 v = 0;
  assert(reader.ReadU128(14, v) == Status::OK);
  uint128 expected("0x100f0e0d0c0b0a090807060504030201");
  assert(v == expected);

  // position 0 is before the first byte
  u8 = 7;
  assert(reader.ReadU8(0, u8) == Status::IOError);
  assert(u8 == 7);

  // runs past the end
  u32 = 42;
  assert(reader.ReadU32(30, u32) == Status::IOError);
  assert(u32 == 42);
  assert(reader.ReadU128(20, v) == Status::IOError);
  assert(v == expected);

  std::cout << "Numeric read tests passed!" << std::endl;
}

void testStrings(Reader &reader) {
  std::cout << "Testing string reads..." << std::endl;

  // string positions are 0-based: the length byte of "US" is at offset 9
  std::string s;
  assert(reader.ReadString(9, s) == Status::OK);
  assert(s == "US");

  s = "x";
  assert(reader.ReadString(12, s) == Status::OK);
  assert(s.empty());

  // one byte off lands on 'U', taken as a length of 85
  s = "keep";
  assert(reader.ReadString(10, s) == Status::IOError);
  assert(s == "keep");

  // length byte says 5, only 2 bytes follow
  assert(reader.ReadString(29, s) == Status::IOError);
  assert(s == "keep");

  assert(reader.ReadString(1000, s) == Status::IOError);

  std::cout << "String read tests passed!" << std::endl;
}

void testFileSource() {
  std::cout << "Testing file source..." << std::endl;

  auto data = sample();
  TempFile file(data);

  auto source = FileSource::Open(file.path());
  assert(source);
  assert(source->Size() == data.size());
  assert(source->Path() == file.path());

  Reader reader(*source);
  uint64_t before = source->Reads();
  testNumbers(reader);
  testStrings(reader);
  assert(source->Reads() > before);

  assert(!FileSource::Open("/nonexistent/ipgeo.bin"));

  std::cout << "File source tests passed!" << std::endl;
}

int main() {
  auto data = sample();
  MemorySource memory(data);
  Reader reader(memory);

  assert(memory.Reads() == 0);
  testNumbers(reader);
  testStrings(reader);
  assert(memory.Reads() > 0);

  testFileSource();
  return 0;
}
