#pragma once

#include <string>

#include "ipgeo/Field.hpp"

namespace ipgeo {

// Attributes of the range an address falls in. Fields that were not
// requested, or that the database edition does not carry, stay empty/zero.
struct Record {
  std::string country_short;
  std::string country_long;
  std::string region;
  std::string city;
  std::string isp;
  float latitude = 0;
  float longitude = 0;
  std::string domain;
  std::string zipcode;
  std::string timezone;
  std::string netspeed;
  std::string iddcode;
  std::string areacode;
  std::string weatherstationcode;
  std::string weatherstationname;
  std::string mcc;
  std::string mnc;
  std::string mobilebrand;
  float elevation = 0;
  std::string usagetype;

  // nullptr for the float fields
  std::string *String(Field field);
  const std::string *String(Field field) const;

  // nullptr for the string fields
  float *Number(Field field);
  const float *Number(Field field) const;

  bool operator==(const Record &other) const;
  bool operator!=(const Record &other) const { return !(*this == other); }
};

inline bool IsNumeric(Field field) {
  return field == Field::Latitude || field == Field::Longitude ||
         field == Field::Elevation;
}

// Value of one field as text, floats with six decimals.
std::string FieldValue(const Record &record, Field field);

// "country_short: US\ncountry_long: United States\n..." for all fields.
std::string ToString(const Record &record);

} // namespace ipgeo
