#include <boost/spirit/include/qi.hpp>

#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "ipgeo/Database.hpp"
#include "ipgeo/io/Reader.hpp"

static auto logger = spdlog::stdout_color_mt("Database");

namespace ipgeo {

std::unique_ptr<Database> Database::Open(const std::string &path,
                                         Status *status) {
  std::unique_ptr<io::Source> source = io::FileSource::Open(path);
  if (!source) {
    if (status) {
      *status = Status::IOError;
    }
    return nullptr;
  }

  auto db = FromSource(std::move(source), status);
  if (db) {
    logger->info("opened: {}", path);
  }
  return db;
}

std::unique_ptr<Database> Database::FromMemory(const char *data, size_t size,
                                               Status *status) {
  return FromSource(
      std::unique_ptr<io::Source>(new io::MemorySource(data, size)), status);
}

std::unique_ptr<Database>
Database::FromSource(std::unique_ptr<io::Source> source, Status *status) {
  std::unique_ptr<Database> db(new Database(std::move(source)));
  Status s = db->readHeader();
  if (status) {
    *status = s;
  }
  if (s != Status::OK) {
    return nullptr;
  }

  auto &m = db->meta_;
  logger->info("database type: {}, columns: {}, date: 20{:02}-{:02}-{:02}, "
               "ipv4 rows: {}, ipv6 rows: {}",
               m.type, m.columns, m.year, m.month, m.day, m.v4_count,
               m.v6_count);
  return db;
}

Database::~Database() { Close(); }

void Database::Close() { source_.reset(); }

Status Database::readHeader() {
  if (source_->Size() < Metadata::kHeaderSize) {
    logger->error("database too small: {} bytes", source_->Size());
    return Status::IOError;
  }

  io::Reader reader(*source_);
  Metadata m;

  RETURN_IF_ERROR(reader.ReadU8(1, m.type));
  RETURN_IF_ERROR(reader.ReadU8(2, m.columns));
  RETURN_IF_ERROR(reader.ReadU8(3, m.year));
  RETURN_IF_ERROR(reader.ReadU8(4, m.month));
  RETURN_IF_ERROR(reader.ReadU8(5, m.day));
  RETURN_IF_ERROR(reader.ReadU32(6, m.v4_count));
  RETURN_IF_ERROR(reader.ReadU32(10, m.v4_base));
  RETURN_IF_ERROR(reader.ReadU32(14, m.v6_count));
  RETURN_IF_ERROR(reader.ReadU32(18, m.v6_base));
  RETURN_IF_ERROR(reader.ReadU32(22, m.v4_index_base));
  RETURN_IF_ERROR(reader.ReadU32(26, m.v6_index_base));

  if (m.type >= kDatabaseTypeCount) {
    logger->error("unsupported database type: {}", m.type);
    return Status::InvalidDatabase;
  }
  if (m.columns == 0) {
    logger->error("database has no columns");
    return Status::InvalidDatabase;
  }

  Layout layout = Layout::For(m.type);
  if (layout.LastColumn() > m.columns) {
    logger->error("type {} needs {} columns, database has {}", m.type,
                  layout.LastColumn(), m.columns);
    return Status::InvalidDatabase;
  }

  m.v4_row_size = static_cast<uint32_t>(m.columns) << 2;
  m.v6_row_size = 16 + (static_cast<uint32_t>(m.columns - 1) << 2);

  meta_   = m;
  layout_ = layout;
  return Status::OK;
}

Status Database::Query(const std::string &ip, uint32_t mask,
                       Record &record) const {
  if (!source_) {
    return Status::Closed;
  }

  Address address;
  if (!Classify(ip, address)) {
    logger->debug("invalid address: {}", ip);
    return Status::InvalidAddress;
  }

  uint32_t bucket =
      BucketAddress(address, meta_.v4_index_base, meta_.v6_index_base);

  Record result;
  RETURN_IF_ERROR(search(address, bucket, mask, result));
  record = std::move(result);
  return Status::OK;
}

Status Database::search(const Address &address, uint32_t bucket, uint32_t mask,
                        Record &record) const {
  io::Reader reader(*source_);
  bool v4 = address.family == Family::V4;

  uint32_t base     = v4 ? meta_.v4_base : meta_.v6_base;
  uint32_t row_size = v4 ? meta_.v4_row_size : meta_.v6_row_size;

  // signed, so that high = mid - 1 at mid = 0 ends the loop
  int64_t low  = 0;
  int64_t high = v4 ? meta_.v4_count : meta_.v6_count;

  if (bucket > 0) {
    uint32_t lo, hi;
    RETURN_IF_ERROR(reader.ReadU32(bucket, lo));
    RETURN_IF_ERROR(reader.ReadU32(bucket + 4, hi));
    low  = lo;
    high = hi;
  }

  // the last row starts at the family's maximum, which therefore belongs to
  // the range before it
  uint128 number = address.number;
  if (number >= MaxNumber(address.family)) {
    number -= 1;
  }

  uint128 from, to;
  while (low <= high) {
    int64_t mid = (low + high) >> 1;

    uint64_t offset = static_cast<uint64_t>(base) +
                      static_cast<uint64_t>(mid) * row_size;
    if (offset + row_size > UINT32_MAX) {
      logger->error("row {} lies outside the addressable file", mid);
      return Status::IOError;
    }
    uint32_t row  = static_cast<uint32_t>(offset);
    uint32_t next = row + row_size;

    // a row stores only where its range starts, the range ends where the
    // next row starts
    if (v4) {
      uint32_t v;
      RETURN_IF_ERROR(reader.ReadU32(row, v));
      from = v;
      RETURN_IF_ERROR(reader.ReadU32(next, v));
      to = v;
    } else {
      RETURN_IF_ERROR(reader.ReadU128(row, from));
      RETURN_IF_ERROR(reader.ReadU128(next, to));
    }

    if (number >= from && number < to) {
      if (!v4) {
        // field offsets assume a 4 byte range column
        row += 12;
      }
      return extract(row, mask, record);
    }

    if (number < from) {
      high = mid - 1;
    } else {
      low = mid + 1;
    }
  }

  logger->debug("no range found for {}", address.number.str());
  return Status::OK;
}

// Go-style ParseFloat: the whole text must be a number, anything else is 0.
static float parseElevation(const std::string &text) {
  namespace qi = boost::spirit::qi;

  float value = 0;
  auto begin  = text.cbegin();
  auto end    = text.cend();
  if (!qi::parse(begin, end, qi::float_, value) || begin != end) {
    logger->debug("elevation is not a number: {}", text);
    return 0;
  }
  return value;
}

Status Database::extract(uint32_t row, uint32_t mask, Record &record) const {
  io::Reader reader(*source_);

  for (int i = 0; i < kFieldCount; ++i) {
    Field field = FieldAt(i);
    const FieldLayout &fl = layout_.fields[i];
    if (!Requested(mask, field) || !fl.enabled) {
      continue;
    }

    uint32_t pos = row + fl.offset;

    switch (field) {
    case Field::Latitude:
    case Field::Longitude:
      RETURN_IF_ERROR(reader.ReadFloat(pos, *record.Number(field)));
      break;

    case Field::Elevation: {
      uint32_t ptr;
      std::string text;
      RETURN_IF_ERROR(reader.ReadU32(pos, ptr));
      RETURN_IF_ERROR(reader.ReadString(ptr, text));
      record.elevation = parseElevation(text);
      break;
    }

    case Field::CountryLong: {
      // the long name follows the 2 letter code and its length byte
      uint32_t ptr;
      RETURN_IF_ERROR(reader.ReadU32(pos, ptr));
      RETURN_IF_ERROR(reader.ReadString(ptr + 3, record.country_long));
      break;
    }

    default: {
      uint32_t ptr;
      RETURN_IF_ERROR(reader.ReadU32(pos, ptr));
      RETURN_IF_ERROR(reader.ReadString(ptr, *record.String(field)));
      break;
    }
    }
  }

  return Status::OK;
}

} // namespace ipgeo
