#pragma once

#include <stdint.h>

#include "ipgeo/Field.hpp"

namespace ipgeo {

// Number of database editions ("types") the format defines, 0 to 24.
static const int kDatabaseTypeCount = 25;

// 1-based column of a field in rows of the given database type, 0 if the
// edition does not carry the field. Column 1 is the range start.
uint8_t ColumnOf(Field field, uint8_t type);

struct FieldLayout {
  bool enabled    = false;
  uint32_t offset = 0; // byte offset inside a row, valid only when enabled
};

// Where each field lives in a row, derived once from the column table.
// Offsets count 4 bytes per column for both families; IPv6 rows are read
// with a 12 byte shift to account for their wider range column.
struct Layout {
  FieldLayout fields[kFieldCount];

  const FieldLayout &operator[](Field field) const {
    return fields[Index(field)];
  }

  // Highest column any enabled field occupies, 0 when none is enabled.
  uint8_t LastColumn() const { return last_column_; }

  // type must be below kDatabaseTypeCount.
  static Layout For(uint8_t type);

private:
  uint8_t last_column_ = 0;
};

} // namespace ipgeo
