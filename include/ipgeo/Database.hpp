#pragma once

#include <stddef.h>
#include <stdint.h>
#include <memory>
#include <string>

#include "ipgeo/Address.hpp"
#include "ipgeo/Field.hpp"
#include "ipgeo/Macros.hpp"
#include "ipgeo/Record.hpp"
#include "ipgeo/Schema.hpp"
#include "ipgeo/Status.hpp"
#include "ipgeo/io/Source.hpp"

namespace ipgeo {

// Fixed header at the start of every database file.
//
//   pos  field                 type
//   1    type                  u8
//   2    columns               u8
//   3    year, month, day      u8 x 3
//   6    v4 row count          u32
//   10   v4 table base         u32
//   14   v6 row count          u32
//   18   v6 table base         u32
//   22   v4 index base         u32  (0 = no index)
//   26   v6 index base         u32  (0 = no index)
struct Metadata {
  static const uint32_t kHeaderSize = 29;

  uint8_t type    = 0;
  uint8_t columns = 0;
  uint8_t year    = 0; // years since 2000
  uint8_t month   = 0;
  uint8_t day     = 0;

  uint32_t v4_count      = 0;
  uint32_t v4_base       = 0;
  uint32_t v6_count      = 0;
  uint32_t v6_base       = 0;
  uint32_t v4_index_base = 0;
  uint32_t v6_index_base = 0;

  // every column is 4 bytes, except the 16 byte range start of v6 rows
  uint32_t v4_row_size = 0;
  uint32_t v6_row_size = 0;
};

// Read-only handle on a database file.
//
// Query is safe to call from several threads at once: the metadata never
// changes after open and the byte source is read positionally. Close must not
// run concurrently with queries.
class Database {
public:
  static std::unique_ptr<Database> Open(const std::string &path,
                                        Status *status = nullptr);
  static std::unique_ptr<Database> FromMemory(const char *data, size_t size,
                                              Status *status = nullptr);
  static std::unique_ptr<Database> FromSource(std::unique_ptr<io::Source> source,
                                              Status *status = nullptr);

  ~Database();

  // Releases the byte source. Later queries return Status::Closed.
  void Close();
  bool IsClosed() const { return !source_; }

  const Metadata &metadata() const { return meta_; }
  const Layout &layout() const { return layout_; }

  // Whether this database edition carries the field.
  bool Enabled(Field field) const { return layout_[field].enabled; }
  uint32_t Offset(Field field) const { return layout_[field].offset; }

  // Looks up the range containing ip and decodes the fields selected by mask.
  // Unselected fields keep their defaults. On error record is left untouched.
  Status Query(const std::string &ip, uint32_t mask, Record &record) const;

  Status GetAll(const std::string &ip, Record &record) const {
    return Query(ip, kAllFields, record);
  }
  Status GetCountryShort(const std::string &ip, Record &record) const {
    return Query(ip, Mask(Field::CountryShort), record);
  }
  Status GetCountryLong(const std::string &ip, Record &record) const {
    return Query(ip, Mask(Field::CountryLong), record);
  }
  Status GetRegion(const std::string &ip, Record &record) const {
    return Query(ip, Mask(Field::Region), record);
  }
  Status GetCity(const std::string &ip, Record &record) const {
    return Query(ip, Mask(Field::City), record);
  }
  Status GetISP(const std::string &ip, Record &record) const {
    return Query(ip, Mask(Field::ISP), record);
  }
  Status GetLatitude(const std::string &ip, Record &record) const {
    return Query(ip, Mask(Field::Latitude), record);
  }
  Status GetLongitude(const std::string &ip, Record &record) const {
    return Query(ip, Mask(Field::Longitude), record);
  }
  Status GetDomain(const std::string &ip, Record &record) const {
    return Query(ip, Mask(Field::Domain), record);
  }
  Status GetZipCode(const std::string &ip, Record &record) const {
    return Query(ip, Mask(Field::ZipCode), record);
  }
  Status GetTimeZone(const std::string &ip, Record &record) const {
    return Query(ip, Mask(Field::TimeZone), record);
  }
  Status GetNetSpeed(const std::string &ip, Record &record) const {
    return Query(ip, Mask(Field::NetSpeed), record);
  }
  Status GetIDDCode(const std::string &ip, Record &record) const {
    return Query(ip, Mask(Field::IDDCode), record);
  }
  Status GetAreaCode(const std::string &ip, Record &record) const {
    return Query(ip, Mask(Field::AreaCode), record);
  }
  Status GetWeatherStationCode(const std::string &ip, Record &record) const {
    return Query(ip, Mask(Field::WeatherStationCode), record);
  }
  Status GetWeatherStationName(const std::string &ip, Record &record) const {
    return Query(ip, Mask(Field::WeatherStationName), record);
  }
  Status GetMCC(const std::string &ip, Record &record) const {
    return Query(ip, Mask(Field::MCC), record);
  }
  Status GetMNC(const std::string &ip, Record &record) const {
    return Query(ip, Mask(Field::MNC), record);
  }
  Status GetMobileBrand(const std::string &ip, Record &record) const {
    return Query(ip, Mask(Field::MobileBrand), record);
  }
  Status GetElevation(const std::string &ip, Record &record) const {
    return Query(ip, Mask(Field::Elevation), record);
  }
  Status GetUsageType(const std::string &ip, Record &record) const {
    return Query(ip, Mask(Field::UsageType), record);
  }

private:
  DISALLOW_COPY_AND_ASSIGN(Database);

  explicit Database(std::unique_ptr<io::Source> source)
      : source_(std::move(source)) {}

  Status readHeader();
  Status search(const Address &address, uint32_t bucket, uint32_t mask,
                Record &record) const;
  Status extract(uint32_t row, uint32_t mask, Record &record) const;

  std::unique_ptr<io::Source> source_;
  Metadata meta_;
  Layout layout_;
};

} // namespace ipgeo
