#undef NDEBUG
#include <assert.h>
#include <iostream>
#include <thread>
#include <boost/asio/ip/address_v6.hpp>

#include "ipgeo/Database.hpp"
#include "ipgeo/io/Reader.hpp"
#include "Fixture.hpp"

using namespace ipgeo;
using namespace ipgeo::test;

static const uint8_t kType = 24;

struct Sample {
  uint128 from;
  const char *tag;
  const char *elevation_text;
  float elevation;
};

// clang-format off
static const Sample kV4[] = {
    {0x00000000u, "ZZ", "0",     0},
    {0x01000000u, "AU", "123.5", 123.5f},
    {0x01000100u, "CN", "abc",   0},     // not a number
    {0x08080800u, "US", "",      0},
    {0x08080900u, "GB", "1e2",   100},
    {0xC8000000u, "LA", "-12",   -12},
};

static const Sample kV6[] = {
    {uint128(0),                                   "ZZ", "1",   1},
    {uint128(0x2001) << 112,                       "US", "2",   2},
    {uint128("0x20010db8000000000000000000000000"), "DE", "3.5", 3.5f},
    {uint128(0x2400) << 112,                       "JP", "x",   0},
    {uint128(0xffff) << 112,                       "LA", "-1",  -1},
};
// clang-format on

static const size_t kV4Rows = sizeof(kV4) / sizeof(kV4[0]);
static const size_t kV6Rows = sizeof(kV6) / sizeof(kV6[0]);

static std::vector<char> build(bool index) {
  Fixture fixture(kType);
  fixture.Index(index, index);
  for (auto &s : kV4) {
    fixture.AddV4(static_cast<uint32_t>(s.from),
                  SampleRecord(s.tag, s.elevation), s.elevation_text);
  }
  for (auto &s : kV6) {
    fixture.AddV6(s.from, SampleRecord(s.tag, s.elevation), s.elevation_text);
  }
  return fixture.Build();
}

static std::string v4Text(const uint128 &n) {
  uint32_t v = static_cast<uint32_t>(n);
  return std::to_string(v >> 24) + "." + std::to_string((v >> 16) & 0xFF) +
         "." + std::to_string((v >> 8) & 0xFF) + "." + std::to_string(v & 0xFF);
}

static std::string v6Text(uint128 n) {
  boost::asio::ip::address_v6::bytes_type bytes;
  for (int i = 15; i >= 0; --i) {
    bytes[i] = static_cast<unsigned char>(static_cast<uint32_t>(n & 0xFF));
    n >>= 8;
  }
  return boost::asio::ip::address_v6(bytes).to_string();
}

static std::unique_ptr<Database> open(const std::vector<char> &image) {
  Status status;
  auto db = Database::FromMemory(image.data(), image.size(), &status);
  assert(db);
  assert(status == Status::OK);
  return db;
}

static void expectRow(const Database &db, const std::string &ip,
                      const Sample &s) {
  Record r;
  Status status = db.GetAll(ip, r);
  if (status != Status::OK || r != SampleRecord(s.tag, s.elevation)) {
    std::cout << ip << ": expected " << s.tag << ", got "
              << StatusString(status) << "\n"
              << ToString(r);
    assert(false);
  }
}

void testBoundaries(const Database &db) {
  std::cout << "Testing range boundaries..." << std::endl;

  for (size_t i = 0; i < kV4Rows; ++i) {
    expectRow(db, v4Text(kV4[i].from), kV4[i]);
    if (i + 1 < kV4Rows) {
      uint128 to = kV4[i + 1].from;
      expectRow(db, v4Text(to - 1), kV4[i]);
      expectRow(db, v4Text(to), kV4[i + 1]);
    }
  }

  for (size_t i = 0; i < kV6Rows; ++i) {
    expectRow(db, v6Text(kV6[i].from), kV6[i]);
    if (i + 1 < kV6Rows) {
      uint128 to = kV6[i + 1].from;
      expectRow(db, v6Text(to - 1), kV6[i]);
      expectRow(db, v6Text(to), kV6[i + 1]);
    }
  }

  // the maximum address belongs to the last range, not past it
  expectRow(db, "255.255.255.255", kV4[kV4Rows - 1]);
  expectRow(db, "255.255.255.254", kV4[kV4Rows - 1]);
  expectRow(db, "ffff:ffff:ffff:ffff:ffff:ffff:ffff:ffff", kV6[kV6Rows - 1]);
  expectRow(db, "ffff:ffff:ffff:ffff:ffff:ffff:ffff:fffe", kV6[kV6Rows - 1]);

  // IPv4-mapped IPv6 is looked up in the IPv4 table
  expectRow(db, "::ffff:8.8.8.8", kV4[3]);
  expectRow(db, "::ffff:1.0.0.255", kV4[1]);

  std::cout << "Range boundary tests passed!" << std::endl;
}

void testIndexAgreement(const Database &plain, const Database &indexed) {
  std::cout << "Testing index agreement..." << std::endl;

  assert(plain.metadata().v4_index_base == 0);
  assert(indexed.metadata().v4_index_base != 0);
  assert(indexed.metadata().v6_index_base != 0);

  std::vector<std::string> ips;
  for (auto &s : kV4) {
    ips.push_back(v4Text(s.from));
    if (s.from > 0) {
      ips.push_back(v4Text(s.from - 1));
    }
  }
  for (auto &s : kV6) {
    ips.push_back(v6Text(s.from));
    if (s.from > 0) {
      ips.push_back(v6Text(s.from - 1));
    }
  }
  ips.push_back("255.255.255.255");
  ips.push_back("ffff:ffff:ffff:ffff:ffff:ffff:ffff:ffff");

  uint32_t seed = 12345;
  for (int i = 0; i < 3000; ++i) {
    seed = seed * 1103515245u + 12345u;
    ips.push_back(v4Text(seed));
  }
  uint128 seed6 = 987654321;
  for (int i = 0; i < 1000; ++i) {
    seed6 = seed6 * uint128("0x5851f42d4c957f2d14057b7ef767814f") + 1;
    ips.push_back(v6Text(seed6));
  }

  for (auto &ip : ips) {
    Record a, b;
    assert(plain.GetAll(ip, a) == Status::OK);
    assert(indexed.GetAll(ip, b) == Status::OK);
    if (a != b) {
      std::cout << ip << " differs:\n" << ToString(a) << ToString(b);
      assert(false);
    }
  }

  std::cout << "Index agreement tests passed (" << ips.size() << " addresses)!"
            << std::endl;
}

void testCountryLong(const std::vector<char> &image, const Database &db) {
  std::cout << "Testing country long position..." << std::endl;

  io::MemorySource source(image);
  io::Reader reader(source);
  auto &m = db.metadata();

  for (size_t i = 0; i < kV4Rows; ++i) {
    uint32_t row = m.v4_base + static_cast<uint32_t>(i) * m.v4_row_size;
    uint32_t ptr = 0;
    assert(reader.ReadU32(row + db.Offset(Field::CountryShort), ptr) ==
           Status::OK);

    std::string code, name;
    assert(reader.ReadString(ptr, code) == Status::OK);
    assert(reader.ReadString(ptr + 3, name) == Status::OK);

    Record r;
    assert(db.GetCountryLong(v4Text(kV4[i].from), r) == Status::OK);
    assert(r.country_long == name);
    assert(r.country_short.empty());
    assert(db.GetCountryShort(v4Text(kV4[i].from), r) == Status::OK);
    assert(r.country_short == code);
    assert(r.country_long.empty());
  }

  std::cout << "Country long position tests passed!" << std::endl;
}

void testGetters(const Database &db) {
  std::cout << "Testing per field getters..." << std::endl;

  typedef Status (Database::*Getter)(const std::string &, Record &) const;
  static const std::pair<Field, Getter> getters[] = {
      {Field::CountryShort, &Database::GetCountryShort},
      {Field::CountryLong, &Database::GetCountryLong},
      {Field::Region, &Database::GetRegion},
      {Field::City, &Database::GetCity},
      {Field::ISP, &Database::GetISP},
      {Field::Latitude, &Database::GetLatitude},
      {Field::Longitude, &Database::GetLongitude},
      {Field::Domain, &Database::GetDomain},
      {Field::ZipCode, &Database::GetZipCode},
      {Field::TimeZone, &Database::GetTimeZone},
      {Field::NetSpeed, &Database::GetNetSpeed},
      {Field::IDDCode, &Database::GetIDDCode},
      {Field::AreaCode, &Database::GetAreaCode},
      {Field::WeatherStationCode, &Database::GetWeatherStationCode},
      {Field::WeatherStationName, &Database::GetWeatherStationName},
      {Field::MCC, &Database::GetMCC},
      {Field::MNC, &Database::GetMNC},
      {Field::MobileBrand, &Database::GetMobileBrand},
      {Field::Elevation, &Database::GetElevation},
      {Field::UsageType, &Database::GetUsageType},
  };

  const Sample &s = kV4[1];
  Record full     = SampleRecord(s.tag, s.elevation);
  for (auto &g : getters) {
    Record r;
    assert((db.*g.second)("1.0.0.7", r) == Status::OK);
    assert(r == Expected(full, kType, Mask(g.first)));
  }

  Record r;
  assert(db.GetElevation("1.0.0.7", r) == Status::OK);
  assert(r.elevation == 123.5f);
  assert(db.GetLatitude("1.0.0.7", r) == Status::OK);
  assert(r.latitude == full.latitude && r.longitude == 0);

  // combined masks decode each requested field once
  assert(db.Query("1.0.0.7", Mask(Field::City) | Mask(Field::Longitude), r) ==
         Status::OK);
  assert(r.city == full.city && r.longitude == full.longitude);
  assert(r.region.empty() && r.latitude == 0);

  std::cout << "Per field getter tests passed!" << std::endl;
}

void testElevation(const Database &db) {
  std::cout << "Testing elevation parsing..." << std::endl;

  Record r;
  for (auto &s : kV4) {
    assert(db.GetElevation(v4Text(s.from), r) == Status::OK);
    assert(r.elevation == s.elevation);
  }
  for (auto &s : kV6) {
    assert(db.GetElevation(v6Text(s.from), r) == Status::OK);
    assert(r.elevation == s.elevation);
  }

  std::cout << "Elevation parsing tests passed!" << std::endl;
}

void testReadCounts(const std::vector<char> &image) {
  std::cout << "Testing read counts..." << std::endl;

  auto *source = new io::MemorySource(image);
  auto db      = Database::FromSource(std::unique_ptr<io::Source>(source));
  assert(db);

  auto reads = [&](const std::string &ip, uint32_t mask, Status expect) {
    Record r;
    uint64_t before = source->Reads();
    assert(db->Query(ip, mask, r) == expect);
    return source->Reads() - before;
  };

  // invalid addresses never touch the file
  assert(reads("not-an-ip", kAllFields, Status::InvalidAddress) == 0);
  assert(reads("1.2.3.4.5", 0, Status::InvalidAddress) == 0);
  assert(reads("", kAllFields, Status::InvalidAddress) == 0);

  // an empty mask stops after the range probes: a float field adds exactly
  // one read, a string field a pointer, a length byte and the text
  uint64_t probes = reads("8.8.8.8", 0, Status::OK);
  assert(probes > 0);
  assert(reads("8.8.8.8", Mask(Field::Latitude), Status::OK) == probes + 1);
  assert(reads("8.8.8.8", Mask(Field::City), Status::OK) == probes + 3);

  Record r = SampleRecord("keep");
  assert(db->Query("8.8.8.8", 0, r) == Status::OK);
  assert(r == Record());

  std::cout << "Read count tests passed!" << std::endl;
}

void testCorruptPointer(std::vector<char> image) {
  std::cout << "Testing corrupt string pointers..." << std::endl;

  uint32_t country_offset;
  {
    auto db        = open(image);
    auto &m        = db->metadata();
    country_offset = (m.v4_base - 1) + m.v4_row_size +
                     db->Offset(Field::CountryShort);
  }
  // row 1 (AU) points its country far past the end of the file
  image[country_offset + 0] = 0x00;
  image[country_offset + 1] = static_cast<char>(0xFF);
  image[country_offset + 2] = static_cast<char>(0xFF);
  image[country_offset + 3] = static_cast<char>(0xFF);
  auto db = open(image);

  Record r = SampleRecord("keep");
  Record keep = r;
  assert(db->GetCountryShort("1.0.0.9", r) == Status::IOError);
  assert(r == keep);
  assert(db->GetCountryLong("1.0.0.9", r) == Status::IOError);
  assert(db->GetAll("1.0.0.9", r) == Status::IOError);
  assert(r == keep);

  // other fields of the row are still readable on their own
  assert(db->GetCity("1.0.0.9", r) == Status::OK);
  assert(r.city == SampleRecord("AU").city);
  assert(db->Query("1.0.0.9", 0, r) == Status::OK);
  assert(r == Record());

  // other rows are unaffected
  assert(db->GetAll("1.0.1.1", r) == Status::OK);
  assert(r.country_short == "CN");

  std::cout << "Corrupt string pointer tests passed!" << std::endl;
}

void testNoRangeFound() {
  std::cout << "Testing uncovered addresses..." << std::endl;

  // ranges must start at 0; a table that does not yields empty records
  Fixture fixture(kType);
  fixture.AddV4(0x05000000u, SampleRecord("FR"), "1");
  auto image = fixture.Build();
  auto db    = open(image);

  Record r = SampleRecord("keep");
  assert(db->GetAll("1.2.3.4", r) == Status::OK);
  assert(r == Record());
  assert(db->GetAll("5.0.0.1", r) == Status::OK);
  assert(r.country_short == "FR");

  // no IPv6 rows at all
  assert(db->GetAll("2001:db8::1", r) == Status::OK);
  assert(r == Record());

  std::cout << "Uncovered address tests passed!" << std::endl;
}

void testFileAndClose(const std::vector<char> &image, const Database &memory) {
  std::cout << "Testing file databases and close..." << std::endl;

  Status status = Status::OK;
  assert(!Database::Open("/nonexistent/ipgeo.bin", &status));
  assert(status == Status::IOError);

  TempFile file(image);
  auto db = Database::Open(file.path(), &status);
  assert(db);
  assert(status == Status::OK);
  assert(!db->IsClosed());

  const char *ips[] = {"0.0.0.1", "1.0.0.0", "8.8.8.8", "200.1.2.3",
                       "255.255.255.255", "2001:db8::1", "2400::5",
                       "ffff:ffff:ffff:ffff:ffff:ffff:ffff:ffff"};
  for (auto ip : ips) {
    Record a, b;
    assert(memory.GetAll(ip, a) == Status::OK);
    assert(db->GetAll(ip, b) == Status::OK);
    assert(a == b);
  }

  db->Close();
  assert(db->IsClosed());
  Record r = SampleRecord("keep");
  assert(db->GetAll("8.8.8.8", r) == Status::Closed);
  assert(db->GetAll("not-an-ip", r) == Status::Closed);
  assert(r == SampleRecord("keep"));
  db->Close();

  std::cout << "File database and close tests passed!" << std::endl;
}

void testRendering(const Database &db) {
  std::cout << "Testing record rendering..." << std::endl;

  Record r;
  assert(db.GetAll("8.8.8.8", r) == Status::OK);
  std::string text = ToString(r);

  size_t lines = 0;
  for (auto c : text) {
    lines += c == '\n';
  }
  assert(lines == kFieldCount);
  assert(text.find("country_short: US\n") == 0);
  assert(text.find("country_long: Country of US\n") != std::string::npos);
  assert(text.find("latitude: 2.250000\n") != std::string::npos);
  assert(text.find("longitude: -2.500000\n") != std::string::npos);
  assert(text.find("usagetype: usagetype-US\n") != std::string::npos);

  assert(FieldValue(r, Field::City) == "city-US");
  assert(FieldValue(Record(), Field::Elevation) == "0.000000");

  std::cout << "Record rendering tests passed!" << std::endl;
}

void testConcurrentQueries(const Database &db) {
  std::cout << "Testing concurrent queries..." << std::endl;

  std::vector<std::string> ips;
  std::vector<Record> expected;
  uint32_t seed = 777;
  for (int i = 0; i < 500; ++i) {
    seed = seed * 1103515245u + 12345u;
    ips.push_back(v4Text(seed));
    Record r;
    assert(db.GetAll(ips.back(), r) == Status::OK);
    expected.push_back(r);
  }

  std::vector<std::thread> threads;
  std::vector<int> failures(4, 0);
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&, t]() {
      for (int round = 0; round < 10; ++round) {
        for (size_t i = 0; i < ips.size(); ++i) {
          Record r;
          if (db.GetAll(ips[i], r) != Status::OK || r != expected[i]) {
            ++failures[t];
          }
        }
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }
  for (auto f : failures) {
    assert(f == 0);
  }

  std::cout << "Concurrent query tests passed!" << std::endl;
}

int main() {
  auto plain_image   = build(false);
  auto indexed_image = build(true);
  auto plain         = open(plain_image);
  auto indexed       = open(indexed_image);

  testBoundaries(*plain);
  testBoundaries(*indexed);
  testIndexAgreement(*plain, *indexed);
  testCountryLong(plain_image, *plain);
  testGetters(*indexed);
  testElevation(*plain);
  testReadCounts(plain_image);
  testReadCounts(indexed_image);
  testCorruptPointer(plain_image);
  testNoRangeFound();
  testFileAndClose(indexed_image, *indexed);
  testRendering(*plain);
  testConcurrentQueries(*indexed);

  bench("plain", [&](size_t i) {
    Record r;
    plain->GetAll(v4Text(static_cast<uint32_t>(i * 2654435761u)), r);
  }, 100000);
  bench("indexed", [&](size_t i) {
    Record r;
    indexed->GetAll(v4Text(static_cast<uint32_t>(i * 2654435761u)), r);
  }, 100000);

  return 0;
}
