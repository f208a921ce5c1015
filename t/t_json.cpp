#undef NDEBUG
#include <assert.h>
#include <iostream>

#include "rapidjson/document.h"
#include "ipgeo/Database.hpp"
#include "ipgeo/Json.hpp"
#include "Fixture.hpp"

using namespace ipgeo;
using namespace ipgeo::test;

void testAllFields() {
  std::cout << "Testing json of all fields..." << std::endl;

  Record record = SampleRecord("NZ", 45.5f);
  std::string text = json::ToJsonString("1.2.3.4", record, kAllFields);

  rapidjson::Document doc;
  doc.Parse(text.c_str());
  assert(!doc.HasParseError());
  assert(doc.IsObject());
  assert(doc.MemberCount() == 1 + kFieldCount);
  assert(std::string(doc["ip"].GetString()) == "1.2.3.4");

  for (int i = 0; i < kFieldCount; ++i) {
    Field field = FieldAt(i);
    const char *name = FieldName(field);
    assert(doc.HasMember(name));
    if (IsNumeric(field)) {
      assert(doc[name].IsNumber());
      assert(static_cast<float>(doc[name].GetDouble()) ==
             *record.Number(field));
    } else {
      assert(doc[name].IsString());
      assert(doc[name].GetString() == *record.String(field));
    }
  }

  std::cout << "Json of all fields tests passed!" << std::endl;
}

void testMaskedFields() {
  std::cout << "Testing json of selected fields..." << std::endl;

  Record record = SampleRecord("BR");
  uint32_t mask = Mask(Field::CountryShort) | Mask(Field::Latitude);

  rapidjson::Document doc;
  json::PopulateJsonDoc(&doc, "::1", record, mask);
  assert(doc.MemberCount() == 3);
  assert(std::string(doc["country_short"].GetString()) == "BR");
  assert(doc["latitude"].IsNumber());
  assert(!doc.HasMember("city"));

  // quotes and control characters survive the round trip
  record.city = "a \"quoted\"\tname";
  std::string text = json::ToJsonString("::1", record, Mask(Field::City));
  rapidjson::Document parsed;
  parsed.Parse(text.c_str());
  assert(!parsed.HasParseError());
  assert(parsed["city"].GetString() == record.city);

  assert(json::ToJsonString("x", Record(), 0) == "{\"ip\":\"x\"}");

  std::cout << "Json of selected fields tests passed!" << std::endl;
}

void testFromDatabase() {
  std::cout << "Testing json of a lookup..." << std::endl;

  Fixture fixture(5);
  fixture.AddV4(0, SampleRecord("AR")).AddV4(0x0A000000u, SampleRecord("JP"));
  auto image = fixture.Build();
  auto db    = Database::FromMemory(image.data(), image.size());
  assert(db);

  Record record;
  assert(db->GetAll("10.1.1.1", record) == Status::OK);
  std::string text = json::ToJsonString("10.1.1.1", record, kAllFields);

  rapidjson::Document doc;
  doc.Parse(text.c_str());
  assert(!doc.HasParseError());
  assert(std::string(doc["country_short"].GetString()) == "JP");
  assert(std::string(doc["country_long"].GetString()) == "Country of JP");
  // fields outside the edition are present but empty
  assert(std::string(doc["isp"].GetString()).empty());

  std::cout << "Json of a lookup tests passed!" << std::endl;
}

int main() {
  testAllFields();
  testMaskedFields();
  testFromDatabase();
  return 0;
}
