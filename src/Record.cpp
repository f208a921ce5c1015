#include <iterator>

#include "fmt/format.h"
#include "ipgeo/Record.hpp"

namespace ipgeo {

std::string *Record::String(Field field) {
  return const_cast<std::string *>(
      static_cast<const Record *>(this)->String(field));
}

const std::string *Record::String(Field field) const {
  switch (field) {
  case Field::CountryShort:       return &country_short;
  case Field::CountryLong:        return &country_long;
  case Field::Region:             return &region;
  case Field::City:               return &city;
  case Field::ISP:                return &isp;
  case Field::Domain:             return &domain;
  case Field::ZipCode:            return &zipcode;
  case Field::TimeZone:           return &timezone;
  case Field::NetSpeed:           return &netspeed;
  case Field::IDDCode:            return &iddcode;
  case Field::AreaCode:           return &areacode;
  case Field::WeatherStationCode: return &weatherstationcode;
  case Field::WeatherStationName: return &weatherstationname;
  case Field::MCC:                return &mcc;
  case Field::MNC:                return &mnc;
  case Field::MobileBrand:        return &mobilebrand;
  case Field::UsageType:          return &usagetype;
  case Field::Latitude:
  case Field::Longitude:
  case Field::Elevation:
    break;
  }
  return nullptr;
}

float *Record::Number(Field field) {
  return const_cast<float *>(static_cast<const Record *>(this)->Number(field));
}

const float *Record::Number(Field field) const {
  switch (field) {
  case Field::Latitude:  return &latitude;
  case Field::Longitude: return &longitude;
  case Field::Elevation: return &elevation;
  default:
    return nullptr;
  }
}

bool Record::operator==(const Record &other) const {
  for (int i = 0; i < kFieldCount; ++i) {
    Field field = FieldAt(i);
    if (IsNumeric(field)) {
      if (*Number(field) != *other.Number(field)) {
        return false;
      }
    } else if (*String(field) != *other.String(field)) {
      return false;
    }
  }
  return true;
}

std::string FieldValue(const Record &record, Field field) {
  if (IsNumeric(field)) {
    return fmt::format("{:f}", *record.Number(field));
  }
  return *record.String(field);
}

std::string ToString(const Record &record) {
  fmt::memory_buffer buf;
  for (int i = 0; i < kFieldCount; ++i) {
    Field field = FieldAt(i);
    fmt::format_to(std::back_inserter(buf), "{}: {}\n", FieldName(field),
                   FieldValue(record, field));
  }
  return fmt::to_string(buf);
}

} // namespace ipgeo
