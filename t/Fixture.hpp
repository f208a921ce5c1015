#pragma once

// Builds small databases in the on-disk format for the test programs.

#include <assert.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <algorithm>
#include <ctime>
#include <fstream>
#include <string>
#include <vector>

#include "ipgeo/Field.hpp"
#include "ipgeo/Record.hpp"
#include "ipgeo/Types.hpp"

namespace ipgeo {
namespace test {

class timer {
public:
  timer() : start_(0) {}
  timer(const timer &) = delete;
  void operator=(const timer &) = delete;

  void start() { start_ = clock(); }

  double elapsed_milliseconds() const {
    return static_cast<double>(clock() - start_) / CLOCKS_PER_SEC * 1000;
  }

private:
  clock_t start_;
};

template <typename Callable>
void bench(const char *name, const Callable &cb, size_t calls) {
  timer t;
  t.start();
  for (size_t i = 0; i < calls; ++i) {
    cb(i);
  }
  double elapsed = t.elapsed_milliseconds();
  printf("%s: %lu calls: %.2f ms\n", name, static_cast<unsigned long>(calls),
         elapsed);
}

// Fields of every edition, in column order starting at column 2, written out
// from the published product layouts DB1 ... DB24.
inline const std::vector<std::vector<Field>> &Editions() {
  typedef Field F;
  static const std::vector<F> C   = {F::CountryShort};
  static const std::vector<F> CRC = {F::CountryShort, F::Region, F::City};
  static const std::vector<F> GEO = {F::CountryShort, F::Region, F::City,
                                     F::Latitude, F::Longitude};

  auto cat = [](std::vector<F> a, const std::vector<F> &b) {
    a.insert(a.end(), b.begin(), b.end());
    return a;
  };

  static const std::vector<std::vector<F>> editions = {
      /* 0  */ {},
      /* 1  */ C,
      /* 2  */ cat(C, {F::ISP}),
      /* 3  */ CRC,
      /* 4  */ cat(CRC, {F::ISP}),
      /* 5  */ GEO,
      /* 6  */ cat(GEO, {F::ISP}),
      /* 7  */ cat(CRC, {F::ISP, F::Domain}),
      /* 8  */ cat(GEO, {F::ISP, F::Domain}),
      /* 9  */ cat(GEO, {F::ZipCode}),
      /* 10 */ cat(GEO, {F::ZipCode, F::ISP, F::Domain}),
      /* 11 */ cat(GEO, {F::ZipCode, F::TimeZone}),
      /* 12 */ cat(GEO, {F::ZipCode, F::TimeZone, F::ISP, F::Domain}),
      /* 13 */ cat(GEO, {F::TimeZone, F::NetSpeed}),
      /* 14 */
      cat(GEO, {F::ZipCode, F::TimeZone, F::ISP, F::Domain, F::NetSpeed}),
      /* 15 */ cat(GEO, {F::ZipCode, F::TimeZone, F::IDDCode, F::AreaCode}),
      /* 16 */
      cat(GEO, {F::ZipCode, F::TimeZone, F::ISP, F::Domain, F::NetSpeed,
                F::IDDCode, F::AreaCode}),
      /* 17 */
      cat(GEO, {F::TimeZone, F::NetSpeed, F::WeatherStationCode,
                F::WeatherStationName}),
      /* 18 */
      cat(GEO, {F::ZipCode, F::TimeZone, F::ISP, F::Domain, F::NetSpeed,
                F::IDDCode, F::AreaCode, F::WeatherStationCode,
                F::WeatherStationName}),
      /* 19 */
      cat(GEO, {F::ISP, F::Domain, F::MCC, F::MNC, F::MobileBrand}),
      /* 20 */
      cat(GEO, {F::ZipCode, F::TimeZone, F::ISP, F::Domain, F::NetSpeed,
                F::IDDCode, F::AreaCode, F::WeatherStationCode,
                F::WeatherStationName, F::MCC, F::MNC, F::MobileBrand}),
      /* 21 */
      cat(GEO, {F::ZipCode, F::TimeZone, F::IDDCode, F::AreaCode,
                F::Elevation}),
      /* 22 */
      cat(GEO, {F::ZipCode, F::TimeZone, F::ISP, F::Domain, F::NetSpeed,
                F::IDDCode, F::AreaCode, F::WeatherStationCode,
                F::WeatherStationName, F::MCC, F::MNC, F::MobileBrand,
                F::Elevation}),
      /* 23 */
      cat(GEO, {F::ISP, F::Domain, F::MCC, F::MNC, F::MobileBrand,
                F::UsageType}),
      /* 24 */
      cat(GEO, {F::ZipCode, F::TimeZone, F::ISP, F::Domain, F::NetSpeed,
                F::IDDCode, F::AreaCode, F::WeatherStationCode,
                F::WeatherStationName, F::MCC, F::MNC, F::MobileBrand,
                F::Elevation, F::UsageType}),
  };
  return editions;
}

// 1-based column of field in the edition, 0 if absent. Country long shares
// the country column.
inline int EditionColumn(uint8_t type, Field field) {
  if (field == Field::CountryLong) {
    field = Field::CountryShort;
  }
  auto &fields = Editions()[type];
  for (size_t i = 0; i < fields.size(); ++i) {
    if (fields[i] == field) {
      return static_cast<int>(i) + 2;
    }
  }
  return 0;
}

// A record with every field set to something distinguishable per tag.
inline Record SampleRecord(const std::string &tag, float elevation = 0) {
  Record r;
  for (int i = 0; i < kFieldCount; ++i) {
    std::string *s = r.String(FieldAt(i));
    if (s) {
      *s = std::string(FieldName(FieldAt(i))) + "-" + tag;
    }
  }
  r.country_short = tag.size() >= 2 ? tag.substr(0, 2) : tag + "X";
  r.country_long  = "Country of " + tag;
  r.latitude      = static_cast<float>(tag.size()) + 0.25f;
  r.longitude     = -static_cast<float>(tag.size()) - 0.5f;
  r.elevation     = elevation;
  return r;
}

// What a query with mask returns for a row holding r in a database of type.
inline Record Expected(const Record &r, uint8_t type, uint32_t mask) {
  Record out;
  for (int i = 0; i < kFieldCount; ++i) {
    Field field = FieldAt(i);
    if (!Requested(mask, field) || EditionColumn(type, field) == 0) {
      continue;
    }
    if (IsNumeric(field)) {
      *out.Number(field) = *r.Number(field);
    } else {
      *out.String(field) = *r.String(field);
    }
  }
  return out;
}

class Fixture {
public:
  struct Row {
    uint128 from;
    Record record;
    std::string elevation; // stored as text
  };

  explicit Fixture(uint8_t type)
      : type_(type),
        columns_(static_cast<uint8_t>(
            1 + (type < Editions().size() ? Editions()[type].size() : 0))) {}

  Fixture &Columns(uint8_t columns) {
    columns_ = columns;
    return *this;
  }

  Fixture &Date(uint8_t year, uint8_t month, uint8_t day) {
    year_  = year;
    month_ = month;
    day_   = day;
    return *this;
  }

  Fixture &Index(bool v4, bool v6) {
    v4_index_ = v4;
    v6_index_ = v6;
    return *this;
  }

  Fixture &AddV4(uint32_t from, const Record &record,
                 const std::string &elevation = "") {
    v4_.push_back(Row{uint128(from), record, elevation});
    return *this;
  }

  Fixture &AddV6(const uint128 &from, const Record &record,
                 const std::string &elevation = "") {
    v6_.push_back(Row{from, record, elevation});
    return *this;
  }

  uint32_t V4RowSize() const { return static_cast<uint32_t>(columns_) * 4; }
  uint32_t V6RowSize() const {
    return 16 + (static_cast<uint32_t>(columns_) - 1) * 4;
  }

  // 1-based positions of the tables in the built image.
  uint32_t V4Base() const { return v4_base_; }
  uint32_t V6Base() const { return v6_base_; }

  std::vector<char> Build() {
    static const uint32_t kHeader = 64;
    static const uint32_t kIndex  = 65536 * 8;

    std::sort(v4_.begin(), v4_.end(),
              [](const Row &a, const Row &b) { return a.from < b.from; });
    std::sort(v6_.begin(), v6_.end(),
              [](const Row &a, const Row &b) { return a.from < b.from; });

    uint32_t off      = kHeader;
    uint32_t v4_index = 0, v6_index = 0;
    if (v4_index_) {
      v4_index = off;
      off += kIndex;
    }
    if (v6_index_) {
      v6_index = off;
      off += kIndex;
    }
    uint32_t v4_table = off;
    off += static_cast<uint32_t>(v4_.size() + 1) * V4RowSize();
    uint32_t v6_table = off;
    off += static_cast<uint32_t>(v6_.size() + 1) * V6RowSize();

    image_.assign(off, 0);

    for (size_t i = 0; i < v4_.size(); ++i) {
      writeRow(v4_table + static_cast<uint32_t>(i) * V4RowSize(), v4_[i],
               false);
    }
    putU32(v4_table + static_cast<uint32_t>(v4_.size()) * V4RowSize(),
           0xFFFFFFFFu);

    for (size_t i = 0; i < v6_.size(); ++i) {
      writeRow(v6_table + static_cast<uint32_t>(i) * V6RowSize(), v6_[i],
               true);
    }
    putU128(v6_table + static_cast<uint32_t>(v6_.size()) * V6RowSize(),
            ~uint128(0));

    if (v4_index_) {
      writeIndex(v4_index, v4_, 16, uint128(0xFFFFFFFFu));
    }
    if (v6_index_) {
      writeIndex(v6_index, v6_, 112, ~uint128(0));
    }

    // slack so that probes next to the last table never hit the end of file
    image_.resize(image_.size() + 32, 0);

    v4_base_ = v4_table + 1;
    v6_base_ = v6_table + 1;

    image_[0] = static_cast<char>(type_);
    image_[1] = static_cast<char>(columns_);
    image_[2] = static_cast<char>(year_);
    image_[3] = static_cast<char>(month_);
    image_[4] = static_cast<char>(day_);
    putU32(5, static_cast<uint32_t>(v4_.size()));
    putU32(9, v4_base_);
    putU32(13, static_cast<uint32_t>(v6_.size()));
    putU32(17, v6_base_);
    putU32(21, v4_index_ ? v4_index + 1 : 0);
    putU32(25, v6_index_ ? v6_index + 1 : 0);

    return image_;
  }

private:
  void putU32(uint32_t off, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
      image_[off + i] = static_cast<char>((v >> (8 * i)) & 0xFF);
    }
  }

  void putU128(uint32_t off, uint128 v) {
    for (int i = 0; i < 16; ++i) {
      image_[off + i] = static_cast<char>(static_cast<uint32_t>(v & 0xFF));
      v >>= 8;
    }
  }

  // appends [len][bytes] and returns its 0-based offset
  uint32_t putString(const std::string &s) {
    assert(s.size() <= 255);
    uint32_t off = static_cast<uint32_t>(image_.size());
    image_.push_back(static_cast<char>(s.size()));
    image_.insert(image_.end(), s.begin(), s.end());
    return off;
  }

  void putFloat(uint32_t off, float f) {
    uint32_t bits;
    memcpy(&bits, &f, sizeof(bits));
    putU32(off, bits);
  }

  void writeRow(uint32_t row, const Row &r, bool v6) {
    if (v6) {
      putU128(row, r.from);
    } else {
      putU32(row, static_cast<uint32_t>(r.from));
    }

    // columns after the first are 4 bytes wide in both tables
    uint32_t first = row + (v6 ? 16 : 4);
    auto &fields   = Editions()[type_];
    for (size_t i = 0; i < fields.size(); ++i) {
      uint32_t at = first + static_cast<uint32_t>(i) * 4;
      Field f     = fields[i];
      if (f == Field::CountryShort) {
        assert(r.record.country_short.size() == 2);
        uint32_t p = putString(r.record.country_short);
        putString(r.record.country_long);
        putU32(at, p);
      } else if (f == Field::Latitude || f == Field::Longitude) {
        putFloat(at, *r.record.Number(f));
      } else if (f == Field::Elevation) {
        putU32(at, putString(r.elevation));
      } else {
        putU32(at, putString(*r.record.String(f)));
      }
    }
  }

  static size_t containing(const std::vector<Row> &rows, const uint128 &x) {
    size_t i = 0;
    while (i + 1 < rows.size() && rows[i + 1].from <= x) {
      ++i;
    }
    return i;
  }

  void writeIndex(uint32_t off, const std::vector<Row> &rows, int shift,
                  const uint128 &max) {
    for (uint32_t b = 0; b < 65536; ++b) {
      uint128 first = uint128(b) << shift;
      uint128 last  = ((uint128(b) + 1) << shift) - 1;
      if (b == 65535) {
        last = max - 1;
      }
      uint32_t lo = 0, hi = 0;
      if (!rows.empty()) {
        lo = static_cast<uint32_t>(containing(rows, first));
        hi = static_cast<uint32_t>(containing(rows, last));
      }
      putU32(off + b * 8, lo);
      putU32(off + b * 8 + 4, hi);
    }
  }

  uint8_t type_;
  uint8_t columns_;
  uint8_t year_  = 24;
  uint8_t month_ = 5;
  uint8_t day_   = 1;
  bool v4_index_ = false;
  bool v6_index_ = false;

  std::vector<Row> v4_, v6_;
  std::vector<char> image_;
  uint32_t v4_base_ = 0;
  uint32_t v6_base_ = 0;
};

// Writes data to a fresh file under /tmp, removed on destruction.
class TempFile {
public:
  explicit TempFile(const std::vector<char> &data) {
    char path[] = "/tmp/ipgeo_t_XXXXXX";
    int fd      = mkstemp(path);
    assert(fd >= 0);
    path_ = path;
    size_t done = 0;
    while (done < data.size()) {
      ssize_t n = write(fd, data.data() + done, data.size() - done);
      assert(n > 0);
      done += static_cast<size_t>(n);
    }
    close(fd);
  }
  ~TempFile() { unlink(path_.c_str()); }

  TempFile(const TempFile &) = delete;
  void operator=(const TempFile &) = delete;

  const std::string &path() const { return path_; }

private:
  std::string path_;
};

} // namespace test
} // namespace ipgeo
