#pragma once

#include <stdint.h>
#include <string>

namespace ipgeo {

// Optional attributes of a row, in bit order.
enum class Field : int {
  CountryShort = 0,
  CountryLong,
  Region,
  City,
  ISP,
  Latitude,
  Longitude,
  Domain,
  ZipCode,
  TimeZone,
  NetSpeed,
  IDDCode,
  AreaCode,
  WeatherStationCode,
  WeatherStationName,
  MCC,
  MNC,
  MobileBrand,
  Elevation,
  UsageType,
};

static const int kFieldCount = 20;

inline int Index(Field field) { return static_cast<int>(field); }
inline Field FieldAt(int index) { return static_cast<Field>(index); }

// Query masks, one bit per field: 0x00001 country short ... 0x80000 usage type.
inline uint32_t Mask(Field field) { return 1u << Index(field); }
static const uint32_t kAllFields = (1u << kFieldCount) - 1;

inline bool Requested(uint32_t mask, Field field) {
  return (mask & Mask(field)) != 0;
}

// Lower-case name used by the text/JSON renderings and the CLI,
// e.g. "country_short", "weatherstationcode".
const char *FieldName(Field field);

// Parses "all" or a comma separated list of field names into a mask.
// Whitespace around names is ignored. Returns false on an unknown name.
bool ParseFields(const std::string &text, uint32_t &mask);

} // namespace ipgeo
