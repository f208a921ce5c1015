#include <iostream>
#include <string>

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include "ipgeo/Database.hpp"
#include "ipgeo/Json.hpp"
#include "ipgeo/Option.hpp"

using namespace ipgeo;

static void printMeta(const Database &db) {
  auto &m = db.metadata();
  fmt::print("type: {}\ncolumns: {}\ndate: 20{:02}-{:02}-{:02}\n", m.type,
             m.columns, m.year, m.month, m.day);
  fmt::print("ipv4: rows: {}, base: {}, index: {}, row size: {}\n", m.v4_count,
             m.v4_base, m.v4_index_base, m.v4_row_size);
  fmt::print("ipv6: rows: {}, base: {}, index: {}, row size: {}\n", m.v6_count,
             m.v6_base, m.v6_index_base, m.v6_row_size);
  for (int i = 0; i < kFieldCount; ++i) {
    Field field = FieldAt(i);
    if (db.Enabled(field)) {
      fmt::print("field: {}, offset: {}\n", FieldName(field), db.Offset(field));
    }
  }
}

// Returns false when the lookup failed.
static bool lookup(const Database &db, const Option &opt,
                   const std::string &ip) {
  Record record;
  Status status = db.Query(ip, opt.mask_, record);
  if (status != Status::OK) {
    std::cerr << ip << ": " << StatusString(status) << std::endl;
    return false;
  }

  if (opt.json_) {
    std::cout << json::ToJsonString(ip, record, opt.mask_) << std::endl;
    return true;
  }

  fmt::print("ip: {}\n", ip);
  for (int i = 0; i < kFieldCount; ++i) {
    Field field = FieldAt(i);
    if (Requested(opt.mask_, field)) {
      fmt::print("{}: {}\n", FieldName(field), FieldValue(record, field));
    }
  }
  return true;
}

int main(int argc, char *argv[]) {
  Option opt;
  ParseOption(argc, argv, opt);

  spdlog::set_level(opt.verbose_ ? spdlog::level::debug : spdlog::level::warn);

  Status status;
  auto db = Database::Open(opt.db_path_, &status);
  if (!db) {
    std::cerr << opt.db_path_ << ": " << StatusString(status) << std::endl;
    return 1;
  }

  if (opt.meta_) {
    printMeta(*db);
  }

  int failed = 0;
  if (opt.ReadStdin()) {
    std::string line;
    while (std::getline(std::cin, line)) {
      if (!line.empty() && !lookup(*db, opt, line)) {
        ++failed;
      }
    }
  } else {
    for (auto &ip : opt.addresses_) {
      if (!lookup(*db, opt, ip)) {
        ++failed;
      }
    }
  }

  db->Close();
  return failed == 0 ? 0 : 2;
}
