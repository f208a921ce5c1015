#undef NDEBUG
#include <assert.h>
#include <iostream>

#include "ipgeo/Database.hpp"
#include "ipgeo/Schema.hpp"
#include "Fixture.hpp"

using namespace ipgeo;
using namespace ipgeo::test;

void testColumnTable() {
  std::cout << "Testing column table..." << std::endl;

  assert(Editions().size() == kDatabaseTypeCount);

  for (int t = 0; t < kDatabaseTypeCount; ++t) {
    uint8_t type  = static_cast<uint8_t>(t);
    Layout layout = Layout::For(type);
    int last      = 0;

    for (int i = 0; i < kFieldCount; ++i) {
      Field field = FieldAt(i);
      int column  = EditionColumn(type, field);

      assert(ColumnOf(field, type) == column);
      assert(layout[field].enabled == (column != 0));
      if (column != 0) {
        assert(layout[field].offset == static_cast<uint32_t>(column - 1) * 4);
        last = std::max(last, column);
      }
    }

    assert(layout.LastColumn() == last);
    assert(last == static_cast<int>(Editions()[type].size()) + (last ? 1 : 0));
  }

  // a few well known layouts
  assert(!Layout::For(0)[Field::CountryShort].enabled);
  assert(Layout::For(1)[Field::CountryShort].offset == 4);
  assert(Layout::For(1)[Field::CountryLong].offset == 4);
  assert(Layout::For(2)[Field::ISP].offset == 8);
  assert(Layout::For(24)[Field::UsageType].offset == 76);
  assert(Layout::For(24)[Field::Elevation].offset == 72);
  assert(!Layout::For(23)[Field::Elevation].enabled);
  assert(!Layout::For(19)[Field::ZipCode].enabled);

  std::cout << "Column table tests passed!" << std::endl;
}

// Builds a database of every type and checks what open derives from it, and
// that a query for all fields returns exactly the fields of the edition.
void testEveryType() {
  std::cout << "Testing every database type..." << std::endl;

  for (int t = 0; t < kDatabaseTypeCount; ++t) {
    uint8_t type = static_cast<uint8_t>(t);
    Record a     = SampleRecord("AA", 12.5f);
    Record b     = SampleRecord("BBB", -3.0f);

    Fixture fixture(type);
    fixture.Date(23, 11, 30)
        .AddV4(0, a, "12.5")
        .AddV4(0x0A000000, b, "-3")
        .AddV6(0, b, "-3")
        .AddV6(uint128(1) << 120, a, "12.5");
    auto image = fixture.Build();

    Status status = Status::IOError;
    auto db       = Database::FromMemory(image.data(), image.size(), &status);
    assert(db);
    assert(status == Status::OK);

    auto &m = db->metadata();
    assert(m.type == type);
    assert(m.columns == 1 + Editions()[type].size());
    assert(m.year == 23 && m.month == 11 && m.day == 30);
    assert(m.v4_count == 2 && m.v6_count == 2);
    assert(m.v4_base == fixture.V4Base());
    assert(m.v6_base == fixture.V6Base());
    assert(m.v4_index_base == 0 && m.v6_index_base == 0);
    assert(m.v4_row_size == fixture.V4RowSize());
    assert(m.v6_row_size == fixture.V6RowSize());

    for (int i = 0; i < kFieldCount; ++i) {
      Field field = FieldAt(i);
      int column  = EditionColumn(type, field);
      assert(db->Enabled(field) == (column != 0));
      if (column != 0) {
        assert(db->Offset(field) == static_cast<uint32_t>(column - 1) * 4);
      }
    }

    Record r;
    assert(db->GetAll("9.9.9.9", r) == Status::OK);
    assert(r == Expected(a, type, kAllFields));
    assert(db->GetAll("10.0.0.1", r) == Status::OK);
    assert(r == Expected(b, type, kAllFields));
    assert(db->GetAll("::2", r) == Status::OK);
    assert(r == Expected(b, type, kAllFields));
    assert(db->GetAll("100::", r) == Status::OK);
    assert(r == Expected(a, type, kAllFields));
  }

  std::cout << "Every database type tests passed!" << std::endl;
}

void testRejectedHeaders() {
  std::cout << "Testing rejected headers..." << std::endl;

  Status status;

  // type byte past the last edition
  {
    Fixture fixture(1);
    auto image = fixture.Build();
    image[0]   = 25;
    assert(!Database::FromMemory(image.data(), image.size(), &status));
    assert(status == Status::InvalidDatabase);
  }

  // fewer columns than the edition needs
  {
    Fixture fixture(24);
    fixture.Columns(5);
    auto image = fixture.Build();
    assert(!Database::FromMemory(image.data(), image.size(), &status));
    assert(status == Status::InvalidDatabase);
  }

  // no columns at all
  {
    Fixture fixture(0);
    auto image = fixture.Build();
    image[1]   = 0;
    assert(!Database::FromMemory(image.data(), image.size(), &status));
    assert(status == Status::InvalidDatabase);
  }

  // truncated header
  {
    Fixture fixture(1);
    auto image = fixture.Build();
    assert(!Database::FromMemory(image.data(), 20, &status));
    assert(status == Status::IOError);
  }

  // extra trailing columns are fine
  {
    Fixture fixture(1);
    fixture.Columns(4).AddV4(0, SampleRecord("CC"));
    auto image = fixture.Build();
    auto db    = Database::FromMemory(image.data(), image.size(), &status);
    assert(db);
    assert(db->metadata().v4_row_size == 16);
    assert(db->metadata().v6_row_size == 28);

    Record r;
    assert(db->GetCountryLong("1.1.1.1", r) == Status::OK);
    assert(r.country_long == "Country of CC");
  }

  std::cout << "Rejected header tests passed!" << std::endl;
}

int main() {
  testColumnTable();
  testEveryType();
  testRejectedHeaders();
  return 0;
}
