#undef NDEBUG
#include <assert.h>
#include <iostream>
#include <set>
#include <string>

#include "ipgeo/Field.hpp"

using namespace ipgeo;

void testMasks() {
  std::cout << "Testing field masks..." << std::endl;

  // same bits as the query constants of the published API
  assert(Mask(Field::CountryShort) == 0x00001);
  assert(Mask(Field::CountryLong) == 0x00002);
  assert(Mask(Field::Region) == 0x00004);
  assert(Mask(Field::City) == 0x00008);
  assert(Mask(Field::ISP) == 0x00010);
  assert(Mask(Field::Latitude) == 0x00020);
  assert(Mask(Field::Longitude) == 0x00040);
  assert(Mask(Field::Domain) == 0x00080);
  assert(Mask(Field::ZipCode) == 0x00100);
  assert(Mask(Field::TimeZone) == 0x00200);
  assert(Mask(Field::NetSpeed) == 0x00400);
  assert(Mask(Field::IDDCode) == 0x00800);
  assert(Mask(Field::AreaCode) == 0x01000);
  assert(Mask(Field::WeatherStationCode) == 0x02000);
  assert(Mask(Field::WeatherStationName) == 0x04000);
  assert(Mask(Field::MCC) == 0x08000);
  assert(Mask(Field::MNC) == 0x10000);
  assert(Mask(Field::MobileBrand) == 0x20000);
  assert(Mask(Field::Elevation) == 0x40000);
  assert(Mask(Field::UsageType) == 0x80000);
  assert(kAllFields == 0xFFFFF);

  assert(Requested(kAllFields, Field::UsageType));
  assert(!Requested(0, Field::CountryShort));
  assert(!Requested(Mask(Field::CountryLong), Field::CountryShort));

  std::set<std::string> names;
  for (int i = 0; i < kFieldCount; ++i) {
    names.insert(FieldName(FieldAt(i)));
  }
  assert(names.size() == kFieldCount);
  assert(std::string(FieldName(Field::CountryShort)) == "country_short");
  assert(std::string(FieldName(Field::WeatherStationName)) ==
         "weatherstationname");

  std::cout << "Field mask tests passed!" << std::endl;
}

void testParseFields() {
  std::cout << "Testing field list parsing..." << std::endl;

  uint32_t mask = 0;
  assert(ParseFields("all", mask));
  assert(mask == kAllFields);

  assert(ParseFields("country_short,city", mask));
  assert(mask == (Mask(Field::CountryShort) | Mask(Field::City)));

  assert(ParseFields(" country_long , latitude,longitude ", mask));
  assert(mask == (Mask(Field::CountryLong) | Mask(Field::Latitude) |
                  Mask(Field::Longitude)));

  assert(ParseFields("mcc,mnc,mcc", mask));
  assert(mask == (Mask(Field::MCC) | Mask(Field::MNC)));

  for (int i = 0; i < kFieldCount; ++i) {
    assert(ParseFields(FieldName(FieldAt(i)), mask));
    assert(mask == Mask(FieldAt(i)));
  }

  mask = 123;
  assert(!ParseFields("", mask));
  assert(!ParseFields("country", mask));
  assert(!ParseFields("country_shortx", mask));
  assert(!ParseFields("city,,region", mask));
  assert(!ParseFields("city,", mask));
  assert(!ParseFields("City", mask));
  assert(mask == 123);

  std::cout << "Field list parsing tests passed!" << std::endl;
}

int main() {
  testMasks();
  testParseFields();
  return 0;
}
